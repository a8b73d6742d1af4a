#pragma once

#include "whalecopy/domain/order.hpp"
#include "whalecopy/domain/position.hpp"
#include "whalecopy/domain/risk_limits.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace whalecopy {

// -----------------------------------------------------------------------------
// FilterConfig - thresholds of the three signal gates
// -----------------------------------------------------------------------------
struct FilterConfig {
  // Stage 1: whale gate
  double min_quality_score{75.0};
  double max_whale_drawdown{0.25};

  // Stage 2: trade gate
  double min_trade_notional{5000.0};
  double max_slippage{0.01};
  double max_days_to_resolution{90.0};
  double min_edge{0.03};
  double whale_win_rate_weight{0.7};  // p_model blend weight

  // Stage 3: portfolio gate
  double max_correlation{0.4};
  double max_total_exposure_pct{0.95};
  double max_category_exposure_pct{0.30};
  double projected_trade_fraction{0.08};  // Upper bound of a sized order
};

// -----------------------------------------------------------------------------
// SizerConfig - adaptive Kelly coefficients
// -----------------------------------------------------------------------------
struct SizerConfig {
  double whale_win_rate_weight{0.7};
  double kelly_multiplier{0.5};
  double max_fraction{0.08};
  double confidence_base{0.4};
  double confidence_scale{0.6};
  double vol_sensitivity{5.0};
  double vol_floor{0.5};
  double vol_cap{1.2};
  double corr_floor{0.3};
  double drawdown_scale{3.0};
  double drawdown_floor{0.2};
  double ewma_lambda{0.94};
};

// -----------------------------------------------------------------------------
// ExecutionConfig - retry, timeout and partial-fill policy
// -----------------------------------------------------------------------------
struct ExecutionConfig {
  int max_retries{3};
  std::int64_t base_backoff_ms{1000};
  double backoff_multiplier{2.0};
  std::int64_t max_backoff_ms{4000};
  std::int64_t pending_timeout_ms{5000};
  std::int64_t submitted_timeout_ms{30000};
  std::int64_t poll_interval_ms{500};
  double partial_fill_accept_ratio{0.8};
  int max_child_depth{2};
  domain::OrderType default_order_type{domain::OrderType::Limit};
};

// -----------------------------------------------------------------------------
// LedgerConfig - default exits and retention
// -----------------------------------------------------------------------------
struct LedgerConfig {
  double stop_loss_pct{0.15};
  double take_profit_pct{0.30};
  bool trailing_stop_enabled{true};
  double trailing_activation_pct{0.10};
  double trailing_distance_pct{0.05};
  std::int64_t pre_resolution_window_ms{2LL * 60 * 60 * 1000};
  std::int64_t archive_after_ms{30LL * 24 * 60 * 60 * 1000};
  std::vector<domain::ExitTrigger> exit_priority{
      domain::ExitTrigger::StopLoss, domain::ExitTrigger::TakeProfit,
      domain::ExitTrigger::TimeBased, domain::ExitTrigger::WhaleExit};
};

// -----------------------------------------------------------------------------
// NetworkConfig - ZeroMQ endpoints (empty string disables the socket)
// -----------------------------------------------------------------------------
struct NetworkConfig {
  std::string feed_endpoint{"tcp://127.0.0.1:5555"};
  std::string ipc_cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string ipc_pub_endpoint{"tcp://127.0.0.1:5557"};
};

// -----------------------------------------------------------------------------
// EngineConfig - everything CopyTradingEngine needs to start
// -----------------------------------------------------------------------------
//
// @brief  Aggregates the per-component configuration structs.
//
// @details
// Every default matches the production thresholds, so a default-constructed
// EngineConfig is a valid configuration. loadEngineConfig() overlays a JSON
// file on top of the defaults: keys that are absent keep their default,
// keys with the wrong type or an out-of-range value raise ConfigError.
//
// Example file:
//   {
//     "initial_nav": 25000,
//     "risk": { "daily_loss_limit_usd": 750, "quarantine_policy": "LIQUIDATE" },
//     "ledger": { "exit_priority": ["WHALE_EXIT", "STOP_LOSS"] },
//     "network": { "feed_endpoint": "tcp://10.0.0.5:5555" }
//   }
// -----------------------------------------------------------------------------
struct EngineConfig {
  double initial_nav{10000.0};
  std::string audit_journal_path;  // Empty keeps the audit trail in memory
  std::int64_t maintenance_interval_ms{1000};

  FilterConfig filter;
  SizerConfig sizer;
  domain::RiskLimits risk;
  ExecutionConfig execution;
  LedgerConfig ledger;
  NetworkConfig network;
};

// Builds a config from parsed JSON. Throws ConfigError on invalid values.
EngineConfig engineConfigFromJson(const nlohmann::json& j);

// Reads and parses a JSON config file. Throws ConfigError if the file
// cannot be opened or parsed.
EngineConfig loadEngineConfig(const std::string& path);

}  // namespace whalecopy
