#include "whalecopy/config/engine_config.hpp"
#include "whalecopy/domain/enum_strings.hpp"
#include "whalecopy/errors.hpp"

#include <fstream>
#include <iostream>

namespace whalecopy {

namespace {

// Overwrites `target` with j[key] when the key is present. A value of the
// wrong JSON type surfaces as ConfigError naming the offending key.
template <typename T>
void readOptional(const nlohmann::json& j, const char* key, T& target) {
  if (!j.contains(key)) {
    return;
  }
  try {
    target = j.at(key).get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("invalid value for '") + key + "': " + e.what());
  }
}

void requirePositive(double value, const char* key) {
  if (!(value > 0.0)) {
    throw ConfigError(std::string("'") + key + "' must be positive");
  }
}

void requireFraction(double value, const char* key) {
  if (!(value >= 0.0 && value <= 1.0)) {
    throw ConfigError(std::string("'") + key + "' must be within [0, 1]");
  }
}

void readFilter(const nlohmann::json& j, FilterConfig& c) {
  readOptional(j, "min_quality_score", c.min_quality_score);
  readOptional(j, "max_whale_drawdown", c.max_whale_drawdown);
  readOptional(j, "min_trade_notional", c.min_trade_notional);
  readOptional(j, "max_slippage", c.max_slippage);
  readOptional(j, "max_days_to_resolution", c.max_days_to_resolution);
  readOptional(j, "min_edge", c.min_edge);
  readOptional(j, "whale_win_rate_weight", c.whale_win_rate_weight);
  readOptional(j, "max_correlation", c.max_correlation);
  readOptional(j, "max_total_exposure_pct", c.max_total_exposure_pct);
  readOptional(j, "max_category_exposure_pct", c.max_category_exposure_pct);
  readOptional(j, "projected_trade_fraction", c.projected_trade_fraction);

  requireFraction(c.max_whale_drawdown, "filter.max_whale_drawdown");
  requireFraction(c.whale_win_rate_weight, "filter.whale_win_rate_weight");
  requireFraction(c.max_total_exposure_pct, "filter.max_total_exposure_pct");
  requireFraction(c.max_category_exposure_pct, "filter.max_category_exposure_pct");
}

void readSizer(const nlohmann::json& j, SizerConfig& c) {
  readOptional(j, "whale_win_rate_weight", c.whale_win_rate_weight);
  readOptional(j, "kelly_multiplier", c.kelly_multiplier);
  readOptional(j, "max_fraction", c.max_fraction);
  readOptional(j, "confidence_base", c.confidence_base);
  readOptional(j, "confidence_scale", c.confidence_scale);
  readOptional(j, "vol_sensitivity", c.vol_sensitivity);
  readOptional(j, "vol_floor", c.vol_floor);
  readOptional(j, "vol_cap", c.vol_cap);
  readOptional(j, "corr_floor", c.corr_floor);
  readOptional(j, "drawdown_scale", c.drawdown_scale);
  readOptional(j, "drawdown_floor", c.drawdown_floor);
  readOptional(j, "ewma_lambda", c.ewma_lambda);

  requireFraction(c.max_fraction, "sizer.max_fraction");
  requireFraction(c.ewma_lambda, "sizer.ewma_lambda");
  if (c.vol_floor > c.vol_cap) {
    throw ConfigError("'sizer.vol_floor' must not exceed 'sizer.vol_cap'");
  }
}

void readRisk(const nlohmann::json& j, domain::RiskLimits& c) {
  readOptional(j, "daily_loss_limit_usd", c.daily_loss_limit_usd);
  readOptional(j, "daily_loss_limit_pct", c.daily_loss_limit_pct);
  readOptional(j, "whale_daily_loss_limit_usd", c.whale_daily_loss_limit_usd);
  readOptional(j, "drawdown_reduce_pct", c.drawdown_reduce_pct);
  readOptional(j, "reduce_factor", c.reduce_factor);
  readOptional(j, "max_consecutive_losses", c.max_consecutive_losses);
  readOptional(j, "pause_duration_ms", c.pause_duration_ms);
  readOptional(j, "max_position_usd", c.max_position_usd);
  readOptional(j, "max_market_exposure_usd", c.max_market_exposure_usd);
  readOptional(j, "max_whale_exposure_usd", c.max_whale_exposure_usd);
  readOptional(j, "max_portfolio_allocation_pct", c.max_portfolio_allocation_pct);
  readOptional(j, "quarantine_min_score", c.quarantine_min_score);
  readOptional(j, "quarantine_max_drawdown", c.quarantine_max_drawdown);
  readOptional(j, "quarantine_score_drop", c.quarantine_score_drop);
  readOptional(j, "score_drop_window_ms", c.score_drop_window_ms);
  readOptional(j, "release_min_score", c.release_min_score);
  readOptional(j, "release_clean_period_ms", c.release_clean_period_ms);

  if (j.contains("quarantine_policy")) {
    std::string name;
    readOptional(j, "quarantine_policy", name);
    auto policy = domain::parseQuarantinePolicy(name);
    if (!policy) {
      throw ConfigError("unknown quarantine_policy: " + name);
    }
    c.quarantine_policy = *policy;
  }

  requirePositive(c.daily_loss_limit_usd, "risk.daily_loss_limit_usd");
  requireFraction(c.daily_loss_limit_pct, "risk.daily_loss_limit_pct");
  requireFraction(c.reduce_factor, "risk.reduce_factor");
  requirePositive(c.max_position_usd, "risk.max_position_usd");
  if (c.max_consecutive_losses < 1) {
    throw ConfigError("'risk.max_consecutive_losses' must be at least 1");
  }
}

void readExecution(const nlohmann::json& j, ExecutionConfig& c) {
  readOptional(j, "max_retries", c.max_retries);
  readOptional(j, "base_backoff_ms", c.base_backoff_ms);
  readOptional(j, "backoff_multiplier", c.backoff_multiplier);
  readOptional(j, "max_backoff_ms", c.max_backoff_ms);
  readOptional(j, "pending_timeout_ms", c.pending_timeout_ms);
  readOptional(j, "submitted_timeout_ms", c.submitted_timeout_ms);
  readOptional(j, "poll_interval_ms", c.poll_interval_ms);
  readOptional(j, "partial_fill_accept_ratio", c.partial_fill_accept_ratio);
  readOptional(j, "max_child_depth", c.max_child_depth);

  if (j.contains("default_order_type")) {
    std::string name;
    readOptional(j, "default_order_type", name);
    auto type = domain::parseOrderType(name);
    if (!type) {
      throw ConfigError("unknown default_order_type: " + name);
    }
    c.default_order_type = *type;
  }

  if (c.max_retries < 0) {
    throw ConfigError("'execution.max_retries' must not be negative");
  }
  requireFraction(c.partial_fill_accept_ratio, "execution.partial_fill_accept_ratio");
  if (c.poll_interval_ms <= 0) {
    throw ConfigError("'execution.poll_interval_ms' must be positive");
  }
}

void readLedger(const nlohmann::json& j, LedgerConfig& c) {
  readOptional(j, "stop_loss_pct", c.stop_loss_pct);
  readOptional(j, "take_profit_pct", c.take_profit_pct);
  readOptional(j, "trailing_stop_enabled", c.trailing_stop_enabled);
  readOptional(j, "trailing_activation_pct", c.trailing_activation_pct);
  readOptional(j, "trailing_distance_pct", c.trailing_distance_pct);
  readOptional(j, "pre_resolution_window_ms", c.pre_resolution_window_ms);
  readOptional(j, "archive_after_ms", c.archive_after_ms);

  if (j.contains("exit_priority")) {
    std::vector<std::string> names;
    readOptional(j, "exit_priority", names);
    std::vector<domain::ExitTrigger> priority;
    for (const auto& name : names) {
      auto trigger = domain::parseExitTrigger(name);
      if (!trigger) {
        throw ConfigError("unknown exit trigger: " + name);
      }
      priority.push_back(*trigger);
    }
    c.exit_priority = std::move(priority);
  }

  requireFraction(c.stop_loss_pct, "ledger.stop_loss_pct");
  requirePositive(c.take_profit_pct, "ledger.take_profit_pct");
}

void readNetwork(const nlohmann::json& j, NetworkConfig& c) {
  readOptional(j, "feed_endpoint", c.feed_endpoint);
  readOptional(j, "ipc_cmd_endpoint", c.ipc_cmd_endpoint);
  readOptional(j, "ipc_pub_endpoint", c.ipc_pub_endpoint);
}

}  // namespace

// -----------------------------------------------------------------------------
// engineConfigFromJson(): overlay JSON on the defaults
// -----------------------------------------------------------------------------
EngineConfig engineConfigFromJson(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw ConfigError("engine config must be a JSON object");
  }

  EngineConfig config;
  readOptional(j, "initial_nav", config.initial_nav);
  readOptional(j, "audit_journal_path", config.audit_journal_path);
  readOptional(j, "maintenance_interval_ms", config.maintenance_interval_ms);
  requirePositive(config.initial_nav, "initial_nav");

  if (j.contains("filter")) readFilter(j.at("filter"), config.filter);
  if (j.contains("sizer")) readSizer(j.at("sizer"), config.sizer);
  if (j.contains("risk")) readRisk(j.at("risk"), config.risk);
  if (j.contains("execution")) readExecution(j.at("execution"), config.execution);
  if (j.contains("ledger")) readLedger(j.at("ledger"), config.ledger);
  if (j.contains("network")) readNetwork(j.at("network"), config.network);

  return config;
}

// -----------------------------------------------------------------------------
// loadEngineConfig(): read file, parse, overlay
// -----------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file: " + path);
  }

  nlohmann::json j;
  try {
    in >> j;
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("cannot parse config file " + path + ": " + e.what());
  }

  EngineConfig config = engineConfigFromJson(j);
  std::cout << "[EngineConfig] loaded " << path << " (nav="
            << config.initial_nav << ")\n";
  return config;
}

}  // namespace whalecopy
