#include "whalecopy/risk/risk_manager.hpp"
#include "whalecopy/domain/enum_strings.hpp"
#include "whalecopy/time/time_utils.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>

namespace whalecopy {

namespace {

constexpr double kEpsilon = 1e-9;

void addTo(domain::ExposureBook& book, const std::string& whale,
           const std::string& market, const std::string& category,
           double amount) {
  book.total += amount;
  book.by_whale[whale] += amount;
  book.by_market[market] += amount;
  book.by_category[category] += amount;
}

void subtractFrom(std::map<std::string, double>& bucket, const std::string& key,
                  double amount) {
  auto it = bucket.find(key);
  if (it == bucket.end()) {
    return;
  }
  it->second -= amount;
  if (it->second <= kEpsilon) {
    bucket.erase(it);
  }
}

void subtractFrom(domain::ExposureBook& book, const std::string& whale,
                  const std::string& market, const std::string& category,
                  double amount) {
  book.total = std::max(0.0, book.total - amount);
  subtractFrom(book.by_whale, whale, amount);
  subtractFrom(book.by_market, market, amount);
  subtractFrom(book.by_category, category, amount);
}

double lookup(const std::map<std::string, double>& bucket,
              const std::string& key) {
  auto it = bucket.find(key);
  return it == bucket.end() ? 0.0 : it->second;
}

std::string money(double value) {
  std::ostringstream os;
  os.setf(std::ios::fixed);
  os.precision(2);
  os << value;
  return os.str();
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
RiskManager::RiskManager(const ITimeProvider& clock, domain::RiskLimits limits,
                         double initial_nav, EventSink alert_sink)
    : clock_(clock),
      limits_(limits),
      initial_nav_(initial_nav),
      alert_sink_(std::move(alert_sink)) {
  state_.nav = initial_nav;
  state_.start_of_day_nav = initial_nav;
  state_.portfolio_value = initial_nav;
  state_.portfolio_peak_value = initial_nav;
  state_.trading_day = utc_day_index(clock_.now_ms());
}

// -----------------------------------------------------------------------------
// checkLocked: every veto rule against the current state (caller holds lock)
// -----------------------------------------------------------------------------
RiskDecision RiskManager::checkLocked(const RiskRequest& request,
                                      std::int64_t now) const {
  const domain::RiskState& s = state_;

  if (s.halt_cause != domain::HaltCause::None) {
    return RiskDecision::veto("Circuit breaker: " + s.circuit_breaker_reason);
  }
  const double loss_limit = std::min(
      limits_.daily_loss_limit_usd,
      limits_.daily_loss_limit_pct * s.start_of_day_nav);
  if (-s.dailyPnl() > loss_limit) {
    return RiskDecision::veto("Circuit breaker: Daily loss limit");
  }
  if (s.paused_until_ms && now < *s.paused_until_ms) {
    return RiskDecision::veto("Trading paused after consecutive losses");
  }
  if (s.quarantined_whales.count(request.whale_address) > 0) {
    return RiskDecision::veto("Whale quarantined");
  }
  if (lookup(s.whale_daily_pnl, request.whale_address) <=
      -limits_.whale_daily_loss_limit_usd) {
    return RiskDecision::veto("Whale daily loss limit");
  }
  if (!(request.notional_usd > 0.0)) {
    return RiskDecision::veto("Order notional must be positive");
  }
  if (request.notional_usd > limits_.max_position_usd) {
    return RiskDecision::veto("Position size limit");
  }

  const double market_exposure =
      lookup(s.exposure.by_market, request.market_id) +
      lookup(s.reserved.by_market, request.market_id);
  if (market_exposure + request.notional_usd > limits_.max_market_exposure_usd) {
    return RiskDecision::veto("Market exposure limit");
  }

  const double whale_exposure =
      lookup(s.exposure.by_whale, request.whale_address) +
      lookup(s.reserved.by_whale, request.whale_address);
  if (whale_exposure + request.notional_usd > limits_.max_whale_exposure_usd) {
    return RiskDecision::veto("Whale exposure limit");
  }

  if (s.openExposure() + request.notional_usd >
      limits_.max_portfolio_allocation_pct * s.portfolio_value) {
    return RiskDecision::veto("Portfolio allocation limit");
  }

  return RiskDecision::approve(s.size_multiplier);
}

RiskDecision RiskManager::evaluate(const RiskRequest& request) const {
  const std::int64_t now = clock_.now_ms();
  std::lock_guard lock(mutex_);
  return checkLocked(request, now);
}

// -----------------------------------------------------------------------------
// reserve: check-and-book under one lock acquisition
// -----------------------------------------------------------------------------
RiskDecision RiskManager::reserve(const std::string& reservation_id,
                                  const RiskRequest& request) {
  const std::int64_t now = clock_.now_ms();
  std::lock_guard lock(mutex_);

  if (reservations_.count(reservation_id) > 0) {
    return RiskDecision::approve(state_.size_multiplier);
  }

  RiskDecision decision = checkLocked(request, now);
  if (!decision.approved) {
    std::cout << "[RiskManager] VETO whale=" << request.whale_address
              << " market=" << request.market_id
              << " notional=" << money(request.notional_usd)
              << " reason=" << decision.reason << "\n";
    return decision;
  }

  reservations_[reservation_id] = Reservation{
      request.whale_address, request.market_id, request.category,
      request.notional_usd};
  addTo(state_.reserved, request.whale_address, request.market_id,
        request.category, request.notional_usd);
  return decision;
}

void RiskManager::releaseReservation(const std::string& reservation_id) {
  std::lock_guard lock(mutex_);
  auto it = reservations_.find(reservation_id);
  if (it == reservations_.end()) {
    return;
  }
  const Reservation& r = it->second;
  subtractFrom(state_.reserved, r.whale_address, r.market_id, r.category,
               r.notional);
  reservations_.erase(it);
}

void RiskManager::settleReservation(const std::string& reservation_id,
                                    double filled_notional) {
  std::lock_guard lock(mutex_);
  auto it = reservations_.find(reservation_id);
  if (it == reservations_.end()) {
    std::cerr << "[RiskManager] WARNING: settle for unknown reservation "
              << reservation_id << ". Skipping.\n";
    return;
  }
  const Reservation r = it->second;
  subtractFrom(state_.reserved, r.whale_address, r.market_id, r.category,
               r.notional);
  reservations_.erase(it);
  if (filled_notional > 0.0) {
    addTo(state_.exposure, r.whale_address, r.market_id, r.category,
          filled_notional);
  }
}

void RiskManager::addExposure(const std::string& whale_address,
                              const std::string& market_id,
                              const std::string& category, double notional) {
  if (!(notional > 0.0)) {
    return;
  }
  std::lock_guard lock(mutex_);
  addTo(state_.exposure, whale_address, market_id, category, notional);
}

void RiskManager::releaseExposure(const std::string& whale_address,
                                  const std::string& market_id,
                                  const std::string& category,
                                  double notional) {
  if (!(notional > 0.0)) {
    return;
  }
  std::lock_guard lock(mutex_);
  subtractFrom(state_.exposure, whale_address, market_id, category, notional);
}

// -----------------------------------------------------------------------------
// recordTradeResult: realized P&L of a closing fill
// -----------------------------------------------------------------------------
void RiskManager::recordTradeResult(const std::string& whale_address,
                                    double realized_pnl) {
  const std::int64_t now = clock_.now_ms();
  std::vector<Event> alerts;
  {
    std::lock_guard lock(mutex_);
    rolloverLocked(now, alerts);

    state_.daily_realized_pnl += realized_pnl;
    state_.cumulative_realized_pnl += realized_pnl;
    state_.whale_daily_pnl[whale_address] += realized_pnl;

    if (realized_pnl < 0.0) {
      WhaleRecord& record = whales_[whale_address];
      record.last_loss_ms = now;
      record.has_loss = true;

      ++state_.consecutive_losses;
      if (state_.consecutive_losses >= limits_.max_consecutive_losses) {
        state_.paused_until_ms = now + limits_.pause_duration_ms;
        std::cerr << "[RiskManager] WARNING: " << state_.consecutive_losses
                  << " consecutive losses. New trading paused for "
                  << limits_.pause_duration_ms / 60000 << " minutes.\n";
        alerts.emplace_back(makeAlert(
            RiskAlertKind::BreakerTripped, domain::toString(domain::BreakerState::Paused),
            "Consecutive losses", state_.consecutive_losses,
            limits_.max_consecutive_losses));
        state_.consecutive_losses = 0;
      }
    } else if (realized_pnl > 0.0) {
      state_.consecutive_losses = 0;
    }

    revalueLocked();
    refreshBreakersLocked(now, alerts);
  }
  emit(alerts);
}

void RiskManager::updateUnrealized(double unrealized_pnl) {
  const std::int64_t now = clock_.now_ms();
  std::vector<Event> alerts;
  {
    std::lock_guard lock(mutex_);
    rolloverLocked(now, alerts);
    state_.unrealized_pnl = unrealized_pnl;
    revalueLocked();
    refreshBreakersLocked(now, alerts);
  }
  emit(alerts);
}

// -----------------------------------------------------------------------------
// onWhaleProfile: quarantine triggers and release on each score refresh
// -----------------------------------------------------------------------------
QuarantineChange RiskManager::onWhaleProfile(const domain::WhaleProfile& profile) {
  const std::int64_t now = clock_.now_ms();
  QuarantineChange change = QuarantineChange::None;
  std::vector<Event> alerts;
  {
    std::lock_guard lock(mutex_);
    WhaleRecord& record = whales_[profile.address];

    double window_high = 0.0;
    if (profile.quality_score) {
      const double score = *profile.quality_score;
      record.score_history.emplace_back(now, score);
      while (!record.score_history.empty() &&
             record.score_history.front().first < now - limits_.score_drop_window_ms) {
        record.score_history.pop_front();
      }
      for (const auto& [at, value] : record.score_history) {
        window_high = std::max(window_high, value);
      }
      record.last_score = score;
      record.has_score = true;
    }

    const bool quarantined =
        state_.quarantined_whales.count(profile.address) > 0;

    if (!quarantined) {
      std::string reason;
      double current = 0.0;
      double limit = 0.0;
      if (profile.quality_score &&
          *profile.quality_score < limits_.quarantine_min_score) {
        reason = "Quality score below minimum";
        current = *profile.quality_score;
        limit = limits_.quarantine_min_score;
      } else if (profile.current_drawdown &&
                 *profile.current_drawdown > limits_.quarantine_max_drawdown) {
        reason = "Whale drawdown above limit";
        current = *profile.current_drawdown;
        limit = limits_.quarantine_max_drawdown;
      } else if (profile.quality_score &&
                 window_high - *profile.quality_score >=
                     limits_.quarantine_score_drop) {
        reason = "Quality score dropped within window";
        current = window_high - *profile.quality_score;
        limit = limits_.quarantine_score_drop;
      }

      if (!reason.empty()) {
        state_.quarantined_whales.insert(profile.address);
        record.quarantined_at_ms = now;
        change = QuarantineChange::Quarantined;
        std::cerr << "[RiskManager] WARNING: whale " << profile.address
                  << " quarantined: " << reason << " (value=" << current
                  << ", limit=" << limit << ")\n";
        alerts.emplace_back(makeAlert(RiskAlertKind::WhaleQuarantined,
                                      profile.address, reason, current, limit));
      }
    } else if (releaseEligibleLocked(profile.address, record, now)) {
      state_.quarantined_whales.erase(profile.address);
      change = QuarantineChange::Released;
      std::cout << "[RiskManager] whale " << profile.address
                << " released from quarantine\n";
      alerts.emplace_back(makeAlert(RiskAlertKind::WhaleReleased,
                                    profile.address, "Score recovered",
                                    record.last_score, limits_.release_min_score));
    }
  }
  emit(alerts);
  return change;
}

bool RiskManager::releaseEligibleLocked(const std::string& /*whale*/,
                                        const WhaleRecord& record,
                                        std::int64_t now) const {
  if (!record.has_score || !(record.last_score > limits_.release_min_score)) {
    return false;
  }
  std::int64_t clean_since = record.quarantined_at_ms;
  if (record.has_loss) {
    clean_since = std::max(clean_since, record.last_loss_ms);
  }
  return now - clean_since >= limits_.release_clean_period_ms;
}

// -----------------------------------------------------------------------------
// maintain: day rollover, pause expiry and quarantine release review
// -----------------------------------------------------------------------------
std::vector<std::string> RiskManager::maintain() {
  const std::int64_t now = clock_.now_ms();
  std::vector<std::string> released;
  std::vector<Event> alerts;
  {
    std::lock_guard lock(mutex_);
    rolloverLocked(now, alerts);
    refreshBreakersLocked(now, alerts);

    for (auto it = state_.quarantined_whales.begin();
         it != state_.quarantined_whales.end();) {
      auto record = whales_.find(*it);
      if (record != whales_.end() &&
          releaseEligibleLocked(*it, record->second, now)) {
        std::cout << "[RiskManager] whale " << *it
                  << " released from quarantine\n";
        alerts.emplace_back(makeAlert(RiskAlertKind::WhaleReleased, *it,
                                      "Score recovered",
                                      record->second.last_score,
                                      limits_.release_min_score));
        released.push_back(*it);
        it = state_.quarantined_whales.erase(it);
      } else {
        ++it;
      }
    }
  }
  emit(alerts);
  return released;
}

void RiskManager::haltTrading(const std::string& reason) {
  std::vector<Event> alerts;
  {
    std::lock_guard lock(mutex_);
    state_.halt_cause = domain::HaltCause::Manual;
    state_.circuit_breaker_reason = reason;
    std::cerr << "[RiskManager] CRITICAL: manual halt: " << reason
              << ". ALL NEW TRADING HALTED.\n";
    alerts.emplace_back(makeAlert(RiskAlertKind::BreakerTripped,
                                  domain::toString(domain::BreakerState::Halted),
                                  reason, 0.0, 0.0));
    refreshBreakersLocked(clock_.now_ms(), alerts);
  }
  emit(alerts);
}

void RiskManager::resetCircuitBreaker() {
  std::vector<Event> alerts;
  {
    std::lock_guard lock(mutex_);
    state_.halt_cause = domain::HaltCause::None;
    state_.circuit_breaker_reason.clear();
    state_.paused_until_ms.reset();
    state_.consecutive_losses = 0;
    // A reset starts a fresh loss budget from the current value.
    state_.daily_realized_pnl = 0.0;
    unrealized_at_day_start_ = state_.unrealized_pnl;
    state_.daily_unrealized_pnl = 0.0;
    state_.start_of_day_nav = state_.portfolio_value;
    std::cout << "[RiskManager] circuit breaker reset\n";
    alerts.emplace_back(makeAlert(RiskAlertKind::BreakerCleared, "ALL",
                                  "Manual reset", 0.0, 0.0));
    refreshBreakersLocked(clock_.now_ms(), alerts);
  }
  emit(alerts);
}

domain::RiskState RiskManager::snapshot() const {
  std::lock_guard lock(mutex_);
  return state_;
}

double RiskManager::sizeMultiplier() const {
  std::lock_guard lock(mutex_);
  return state_.size_multiplier;
}

bool RiskManager::isQuarantined(const std::string& whale_address) const {
  std::lock_guard lock(mutex_);
  return state_.quarantined_whales.count(whale_address) > 0;
}

bool RiskManager::tradingHalted() const {
  std::lock_guard lock(mutex_);
  return state_.halt_cause != domain::HaltCause::None;
}

// -----------------------------------------------------------------------------
// rolloverLocked: reset the daily figures on a new UTC day
// -----------------------------------------------------------------------------
void RiskManager::rolloverLocked(std::int64_t now, std::vector<Event>& alerts) {
  const std::int64_t day = utc_day_index(now);
  if (day == state_.trading_day) {
    return;
  }
  state_.trading_day = day;
  state_.daily_realized_pnl = 0.0;
  state_.daily_unrealized_pnl = 0.0;
  unrealized_at_day_start_ = state_.unrealized_pnl;
  state_.whale_daily_pnl.clear();
  state_.start_of_day_nav = state_.portfolio_value;

  std::cout << "[RiskManager] new trading day " << day
            << " start_of_day_nav=" << money(state_.start_of_day_nav) << "\n";

  if (state_.halt_cause == domain::HaltCause::DailyLoss) {
    state_.halt_cause = domain::HaltCause::None;
    state_.circuit_breaker_reason.clear();
    std::cout << "[RiskManager] daily loss halt cleared by day rollover\n";
    alerts.emplace_back(makeAlert(RiskAlertKind::BreakerCleared,
                                  domain::toString(domain::BreakerState::Halted),
                                  "Day rollover", 0.0, 0.0));
  }
}

void RiskManager::revalueLocked() {
  state_.nav = initial_nav_ + state_.cumulative_realized_pnl;
  state_.daily_unrealized_pnl = state_.unrealized_pnl - unrealized_at_day_start_;
  state_.portfolio_value = state_.nav + state_.unrealized_pnl;
  state_.portfolio_peak_value =
      std::max(state_.portfolio_peak_value, state_.portfolio_value);
}

// -----------------------------------------------------------------------------
// refreshBreakersLocked: trip or clear breakers, derive the breaker state
// -----------------------------------------------------------------------------
void RiskManager::refreshBreakersLocked(std::int64_t now,
                                        std::vector<Event>& alerts) {
  const double loss_limit = std::min(
      limits_.daily_loss_limit_usd,
      limits_.daily_loss_limit_pct * state_.start_of_day_nav);
  const double daily_loss = -state_.dailyPnl();
  if (state_.halt_cause == domain::HaltCause::None && daily_loss > loss_limit) {
    state_.halt_cause = domain::HaltCause::DailyLoss;
    state_.circuit_breaker_reason = "Daily loss limit";
    std::cerr << "[RiskManager] CRITICAL: daily loss " << money(daily_loss)
              << " exceeds limit " << money(loss_limit)
              << ". ALL NEW TRADING HALTED.\n";
    alerts.emplace_back(makeAlert(RiskAlertKind::BreakerTripped,
                                  domain::toString(domain::BreakerState::Halted),
                                  "Daily loss limit", daily_loss, loss_limit));
  }

  const double drawdown = state_.drawdown();
  if (!reduced_ && drawdown >= limits_.drawdown_reduce_pct) {
    reduced_ = true;
    std::cerr << "[RiskManager] WARNING: drawdown " << drawdown * 100.0
              << "% reached. Position sizes scaled by " << limits_.reduce_factor
              << ".\n";
    alerts.emplace_back(makeAlert(RiskAlertKind::BreakerTripped,
                                  domain::toString(domain::BreakerState::Reduced),
                                  "Portfolio drawdown", drawdown,
                                  limits_.drawdown_reduce_pct));
  } else if (reduced_ && drawdown < limits_.drawdown_reduce_pct) {
    reduced_ = false;
    std::cout << "[RiskManager] drawdown recovered, full sizing restored\n";
    alerts.emplace_back(makeAlert(RiskAlertKind::BreakerCleared,
                                  domain::toString(domain::BreakerState::Reduced),
                                  "Drawdown recovered", drawdown,
                                  limits_.drawdown_reduce_pct));
  }
  state_.size_multiplier = reduced_ ? limits_.reduce_factor : 1.0;

  if (state_.paused_until_ms && now >= *state_.paused_until_ms) {
    state_.paused_until_ms.reset();
    std::cout << "[RiskManager] consecutive-loss pause expired\n";
    alerts.emplace_back(makeAlert(RiskAlertKind::BreakerCleared,
                                  domain::toString(domain::BreakerState::Paused),
                                  "Pause expired", 0.0, 0.0));
  }

  if (state_.halt_cause != domain::HaltCause::None) {
    state_.breaker = domain::BreakerState::Halted;
  } else if (state_.paused_until_ms) {
    state_.breaker = domain::BreakerState::Paused;
  } else if (reduced_) {
    state_.breaker = domain::BreakerState::Reduced;
  } else {
    state_.breaker = domain::BreakerState::Normal;
  }
  state_.circuit_breaker_tripped = state_.breaker == domain::BreakerState::Halted;
}

RiskAlertEvent RiskManager::makeAlert(RiskAlertKind kind, std::string subject,
                                      std::string reason, double current,
                                      double limit) const {
  RiskAlertEvent alert;
  alert.kind = kind;
  alert.subject = std::move(subject);
  alert.reason = std::move(reason);
  alert.current_value = current;
  alert.limit_value = limit;
  alert.timestamp = ms_to_timestamp(clock_.now_ms());
  return alert;
}

void RiskManager::emit(std::vector<Event>& alerts) const {
  if (!alert_sink_) {
    return;
  }
  for (auto& alert : alerts) {
    alert_sink_(std::move(alert));
  }
}

}  // namespace whalecopy
