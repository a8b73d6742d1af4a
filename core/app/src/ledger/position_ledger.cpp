#include "whalecopy/ledger/position_ledger.hpp"
#include "whalecopy/domain/enum_strings.hpp"
#include "whalecopy/errors.hpp"
#include "whalecopy/persistence/json_codec.hpp"
#include "whalecopy/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <tuple>
#include <utility>

namespace whalecopy {

using domain::CloseReason;
using domain::ExitTrigger;
using domain::Outcome;
using domain::Position;
using domain::PositionId;
using domain::PositionStatus;
using domain::PositionUpdateType;

namespace {

constexpr double kSizeEpsilon = 1e-9;

// Price paid per share of the held token at entry.
double entryTokenPrice(const Position& p) {
  return p.side == Outcome::Yes ? p.entry_price : 1.0 - p.entry_price;
}

CloseReason reasonFor(ExitTrigger trigger) {
  switch (trigger) {
    case ExitTrigger::StopLoss:
      return CloseReason::StopLoss;
    case ExitTrigger::TakeProfit:
      return CloseReason::TakeProfit;
    case ExitTrigger::TimeBased:
      return CloseReason::PreResolution;
    case ExitTrigger::WhaleExit:
      return CloseReason::WhaleExit;
  }
  return CloseReason::Manual;
}

bool validTokenPrice(double price) {
  return std::isfinite(price) && price >= 0.0 && price <= 1.0;
}

}  // namespace

PositionLedger::PositionLedger(const ITimeProvider& clock, AuditTrail& audit,
                               LedgerConfig config, EventSink sink)
    : clock_(clock), audit_(audit), config_(std::move(config)), sink_(std::move(sink)) {}

std::pair<double, double> PositionLedger::defaultStops(const LedgerConfig& config,
                                                       Outcome side,
                                                       double entry_price) {
  if (side == Outcome::Yes) {
    return {domain::clampPrice(entry_price * (1.0 - config.stop_loss_pct)),
            domain::clampPrice(entry_price * (1.0 + config.take_profit_pct))};
  }
  return {domain::clampPrice(entry_price * (1.0 + config.stop_loss_pct)),
          domain::clampPrice(entry_price * (1.0 - config.take_profit_pct))};
}

// -----------------------------------------------------------------------------
// openPosition()
// -----------------------------------------------------------------------------
Position PositionLedger::openPosition(const PositionOpen& open, double fill_size,
                                      double token_fill_price) {
  if (!(fill_size > 0.0)) {
    throw std::invalid_argument("fill size must be positive");
  }
  if (!(token_fill_price > 0.0 && token_fill_price < 1.0)) {
    throw std::invalid_argument("fill price must be inside (0, 1)");
  }

  const double fill_ref = domain::clampPrice(domain::referencePrice(open.side, token_fill_price));
  const std::int64_t now = clock_.now_ms();
  std::vector<Event> events;
  Position result;
  {
    std::unique_lock map_lock(map_mutex_);

    Slot* existing = nullptr;
    for (auto& [id, slot] : positions_) {
      const Position& p = slot.position;
      if (p.status == PositionStatus::Open && p.whale_address == open.whale_address &&
          p.token_id == open.token_id && p.side == open.side) {
        existing = &slot;
        break;
      }
    }

    if (existing != nullptr) {
      Position& p = existing->position;
      const Position before = p;
      const double total = p.current_size + fill_size;
      p.entry_price = domain::clampPrice(
          (p.entry_price * p.current_size + fill_ref * fill_size) / total);
      p.entry_size += fill_size;
      p.entry_amount += fill_size * token_fill_price;
      p.current_size = total;
      std::tie(p.stop_loss_price, p.take_profit_price) =
          defaultStops(config_, p.side, p.entry_price);
      p.trailing_reference_price.reset();
      p.last_updated_at_ms = now;
      p.revalue();
      record(before, p, PositionUpdateType::SizeIncrease,
             "Added " + std::to_string(fill_size) + " from whale trade", events);
      result = p;
    } else {
      Position p;
      p.position_id = ids_.next();
      p.whale_address = open.whale_address;
      p.token_id = open.token_id;
      p.market_id = open.market_id;
      p.category = open.category;
      p.side = open.side;
      p.entry_size = fill_size;
      p.entry_price = fill_ref;
      p.entry_amount = fill_size * token_fill_price;
      p.current_size = fill_size;
      p.current_price = fill_ref;
      std::tie(p.stop_loss_price, p.take_profit_price) =
          defaultStops(config_, p.side, p.entry_price);
      p.kelly_fraction = open.kelly_fraction;
      p.edge = open.edge;
      p.win_rate = open.win_rate;
      p.status = PositionStatus::Open;
      p.opened_at_ms = now;
      p.last_updated_at_ms = now;
      p.resolution_time_ms = open.resolution_time_ms;
      p.revalue();

      Position before = p;
      before.current_size = 0.0;
      before.market_value = 0.0;
      before.unrealized_pnl = 0.0;
      record(before, p, PositionUpdateType::SizeIncrease, "Position opened", events);
      positions_[p.position_id].position = p;
      result = p;
      std::cout << "[PositionLedger] Opened " << p.position_id << " "
                << domain::toString(p.side) << " " << p.current_size << " @ "
                << token_fill_price << " (" << p.token_id << ", whale "
                << p.whale_address << ")\n";
    }
  }
  emit(events);
  return result;
}

// -----------------------------------------------------------------------------
// applyPrice()
// -----------------------------------------------------------------------------
std::size_t PositionLedger::applyPrice(const std::string& token_id, double token_price) {
  if (!validTokenPrice(token_price)) {
    std::cerr << "[PositionLedger] WARNING: ignoring invalid price " << token_price
              << " for " << token_id << "\n";
    return 0;
  }

  const std::int64_t now = clock_.now_ms();
  std::vector<Event> events;
  std::size_t changed = 0;
  {
    std::shared_lock map_lock(map_mutex_);
    for (auto& [id, slot] : positions_) {
      std::lock_guard lock(slot.mutex);
      Position& p = slot.position;
      if (p.token_id != token_id || !p.isLive()) {
        continue;
      }
      const double ref = domain::clampPrice(domain::referencePrice(p.side, token_price));
      if (ref == p.current_price) {
        continue;
      }
      const Position before = p;
      p.current_price = ref;
      p.last_updated_at_ms = now;
      p.revalue();
      trail(p);
      record(before, p, PositionUpdateType::PriceUpdate, "Price update", events);
      ++changed;
    }
  }
  emit(events);
  return changed;
}

// -----------------------------------------------------------------------------
// trail() - arm and ratchet the trailing stop
// -----------------------------------------------------------------------------
void PositionLedger::trail(Position& p) const {
  if (!config_.trailing_stop_enabled || p.entry_price <= 0.0) {
    return;
  }
  const bool yes = p.side == Outcome::Yes;
  if (!p.trailing_reference_price) {
    const double gain = (p.current_price - p.entry_price) * domain::direction(p.side) /
                        p.entry_price;
    if (gain < config_.trailing_activation_pct) {
      return;
    }
    p.trailing_reference_price = p.current_price;
  } else {
    p.trailing_reference_price =
        yes ? std::max(*p.trailing_reference_price, p.current_price)
            : std::min(*p.trailing_reference_price, p.current_price);
  }

  const double candidate = domain::clampPrice(
      yes ? *p.trailing_reference_price * (1.0 - config_.trailing_distance_pct)
          : *p.trailing_reference_price * (1.0 + config_.trailing_distance_pct));
  if (!p.stop_loss_price) {
    p.stop_loss_price = candidate;
  } else {
    p.stop_loss_price = yes ? std::max(*p.stop_loss_price, candidate)
                            : std::min(*p.stop_loss_price, candidate);
  }
}

// -----------------------------------------------------------------------------
// dueTrigger() - first trigger met, in configured priority
// -----------------------------------------------------------------------------
std::optional<ExitTrigger> PositionLedger::dueTrigger(const Position& p,
                                                      std::int64_t now) const {
  const bool yes = p.side == Outcome::Yes;
  for (ExitTrigger trigger : config_.exit_priority) {
    switch (trigger) {
      case ExitTrigger::StopLoss:
        if (p.stop_loss_price &&
            (yes ? p.current_price <= *p.stop_loss_price
                 : p.current_price >= *p.stop_loss_price)) {
          return trigger;
        }
        break;
      case ExitTrigger::TakeProfit:
        if (p.take_profit_price &&
            (yes ? p.current_price >= *p.take_profit_price
                 : p.current_price <= *p.take_profit_price)) {
          return trigger;
        }
        break;
      case ExitTrigger::TimeBased:
        if (p.resolution_time_ms &&
            *p.resolution_time_ms - now <= config_.pre_resolution_window_ms) {
          return trigger;
        }
        break;
      case ExitTrigger::WhaleExit:
        if (p.whale_exit_pending) {
          return trigger;
        }
        break;
    }
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// evaluateExits()
// -----------------------------------------------------------------------------
std::vector<ExitSignal> PositionLedger::evaluateExits() {
  const std::int64_t now = clock_.now_ms();
  std::vector<ExitSignal> signals;
  std::vector<Event> events;
  {
    std::shared_lock map_lock(map_mutex_);
    for (auto& [id, slot] : positions_) {
      std::lock_guard lock(slot.mutex);
      Position& p = slot.position;
      if (p.status != PositionStatus::Open) {
        continue;
      }
      const std::optional<ExitTrigger> trigger = dueTrigger(p, now);
      if (!trigger) {
        continue;
      }

      const Position before = p;
      p.status = PositionStatus::Closing;
      p.last_updated_at_ms = now;

      std::string detail = std::string(domain::toString(*trigger)) + " at " +
                           std::to_string(p.current_price);
      PositionUpdateType type = PositionUpdateType::ManualAdjustment;
      if (*trigger == ExitTrigger::StopLoss) {
        type = PositionUpdateType::StopLossHit;
      } else if (*trigger == ExitTrigger::TakeProfit) {
        type = PositionUpdateType::TakeProfitHit;
      }
      record(before, p, type, detail, events);
      signals.push_back(makeSignal(p, trigger, reasonFor(*trigger), detail));
      std::cout << "[PositionLedger] Exit " << p.position_id << ": " << detail << "\n";
    }
  }
  emit(events);
  return signals;
}

std::vector<PositionId> PositionLedger::markWhaleExit(const std::string& whale_address,
                                                      const std::string& token_id) {
  std::vector<PositionId> marked;
  std::shared_lock map_lock(map_mutex_);
  for (auto& [id, slot] : positions_) {
    std::lock_guard lock(slot.mutex);
    Position& p = slot.position;
    if (p.status == PositionStatus::Open && p.whale_address == whale_address &&
        p.token_id == token_id) {
      p.whale_exit_pending = true;
      marked.push_back(id);
    }
  }
  return marked;
}

std::optional<ExitSignal> PositionLedger::beginClose(const PositionId& position_id,
                                                     CloseReason reason,
                                                     const std::string& detail) {
  std::vector<Event> events;
  std::optional<ExitSignal> signal;
  {
    std::shared_lock map_lock(map_mutex_);
    auto it = positions_.find(position_id);
    if (it == positions_.end()) {
      throw UnknownEntityError("unknown position id: " + position_id);
    }
    std::lock_guard lock(it->second.mutex);
    Position& p = it->second.position;
    if (p.status != PositionStatus::Open) {
      return std::nullopt;
    }
    const Position before = p;
    p.status = PositionStatus::Closing;
    p.last_updated_at_ms = clock_.now_ms();
    record(before, p, PositionUpdateType::ManualAdjustment, detail, events);
    signal = makeSignal(p, std::nullopt, reason, detail);
  }
  emit(events);
  return signal;
}

void PositionLedger::abortClose(const PositionId& position_id, const std::string& why) {
  std::vector<Event> events;
  {
    std::shared_lock map_lock(map_mutex_);
    auto it = positions_.find(position_id);
    if (it == positions_.end()) {
      throw UnknownEntityError("unknown position id: " + position_id);
    }
    std::lock_guard lock(it->second.mutex);
    Position& p = it->second.position;
    if (p.status != PositionStatus::Closing) {
      return;
    }
    const Position before = p;
    p.status = PositionStatus::Open;
    p.last_updated_at_ms = clock_.now_ms();
    record(before, p, PositionUpdateType::ManualAdjustment,
           "Closing order failed: " + why, events);
    std::cerr << "[PositionLedger] WARNING: close of " << position_id
              << " failed (" << why << "), position back to OPEN\n";
  }
  emit(events);
}

// -----------------------------------------------------------------------------
// applyCloseFill()
// -----------------------------------------------------------------------------
CloseResult PositionLedger::applyCloseFill(const PositionId& position_id,
                                           double fill_size, double token_fill_price,
                                           CloseReason reason) {
  if (!(fill_size > 0.0)) {
    throw std::invalid_argument("close fill size must be positive");
  }
  if (!validTokenPrice(token_fill_price)) {
    throw std::invalid_argument("close fill price must be inside [0, 1]");
  }

  std::vector<Event> events;
  CloseResult result;
  {
    std::shared_lock map_lock(map_mutex_);
    auto it = positions_.find(position_id);
    if (it == positions_.end()) {
      throw UnknownEntityError("unknown position id: " + position_id);
    }
    std::lock_guard lock(it->second.mutex);
    Position& p = it->second.position;
    if (!p.isLive()) {
      throw DataIntegrityError("position " + position_id + " is not live");
    }

    const Position before = p;
    const double exit_ref = domain::referencePrice(p.side, token_fill_price);
    const double closed = std::min(fill_size, p.current_size);
    const double delta = (exit_ref - p.entry_price) * closed * domain::direction(p.side);
    const std::int64_t now = clock_.now_ms();

    result.closed_size = closed;
    result.realized_delta = delta;
    result.released_cost = closed * entryTokenPrice(p);

    p.realized_pnl += delta;
    p.current_size -= closed;
    p.last_updated_at_ms = now;

    if (p.current_size <= kSizeEpsilon) {
      p.current_size = 0.0;
      p.current_price = domain::clampPrice(exit_ref);
      p.market_value = 0.0;
      p.unrealized_pnl = 0.0;
      p.status = PositionStatus::Closed;
      p.closed_at_ms = now;
      p.close_reason = reason;
      p.whale_exit_pending = false;
      p.max_profit = std::max(p.max_profit, p.totalPnl());
      p.max_drawdown = std::min(p.max_drawdown, p.totalPnl());
      record(before, p, PositionUpdateType::FullClose,
             std::string("Closed: ") + domain::toString(reason), events);
      result.fully_closed = true;
      std::cout << "[PositionLedger] Closed " << position_id << " ("
                << domain::toString(reason) << "), realized " << p.realized_pnl << "\n";
    } else {
      p.status = PositionStatus::Open;
      p.revalue();
      record(before, p, PositionUpdateType::PartialClose,
             "Closed " + std::to_string(closed) + " of " +
                 std::to_string(before.current_size),
             events);
    }
    result.position = p;
  }
  emit(events);
  return result;
}

std::size_t PositionLedger::archiveClosed() {
  const std::int64_t now = clock_.now_ms();
  std::vector<Event> events;
  std::size_t archived = 0;
  {
    std::unique_lock map_lock(map_mutex_);
    for (auto& [id, slot] : positions_) {
      Position& p = slot.position;
      if (p.status != PositionStatus::Closed || !p.closed_at_ms ||
          now - *p.closed_at_ms < config_.archive_after_ms) {
        continue;
      }
      const Position before = p;
      p.status = PositionStatus::Archived;
      p.last_updated_at_ms = now;
      record(before, p, PositionUpdateType::ManualAdjustment, "Archived", events);
      ++archived;
    }
  }
  emit(events);
  return archived;
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
std::optional<Position> PositionLedger::get(const PositionId& position_id) const {
  std::shared_lock map_lock(map_mutex_);
  auto it = positions_.find(position_id);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  std::lock_guard lock(it->second.mutex);
  return it->second.position;
}

std::vector<Position> PositionLedger::all() const {
  std::shared_lock map_lock(map_mutex_);
  std::vector<Position> result;
  result.reserve(positions_.size());
  for (const auto& [id, slot] : positions_) {
    std::lock_guard lock(slot.mutex);
    result.push_back(slot.position);
  }
  return result;
}

std::vector<Position> PositionLedger::live() const {
  std::vector<Position> result;
  for (Position& p : all()) {
    if (p.isLive()) {
      result.push_back(std::move(p));
    }
  }
  return result;
}

std::vector<Position> PositionLedger::forWhale(const std::string& whale_address) const {
  std::vector<Position> result;
  for (Position& p : all()) {
    if (p.whale_address == whale_address) {
      result.push_back(std::move(p));
    }
  }
  return result;
}

std::map<PositionStatus, std::size_t> PositionLedger::countsByStatus() const {
  std::map<PositionStatus, std::size_t> counts{{PositionStatus::Open, 0},
                                               {PositionStatus::Closing, 0},
                                               {PositionStatus::Closed, 0},
                                               {PositionStatus::Archived, 0}};
  for (const Position& p : all()) {
    ++counts[p.status];
  }
  return counts;
}

std::vector<Position> PositionLedger::requiringAction() const {
  const std::int64_t now = clock_.now_ms();
  std::vector<Position> result;
  for (Position& p : all()) {
    if (p.status == PositionStatus::Closing ||
        (p.status == PositionStatus::Open && dueTrigger(p, now))) {
      result.push_back(std::move(p));
    }
  }
  return result;
}

double PositionLedger::totalUnrealized() const {
  double total = 0.0;
  for (const Position& p : all()) {
    if (p.isLive()) {
      total += p.unrealized_pnl;
    }
  }
  return total;
}

double PositionLedger::totalRealized() const {
  double total = 0.0;
  for (const Position& p : all()) {
    total += p.realized_pnl;
  }
  return total;
}

double PositionLedger::totalExposure() const {
  double total = 0.0;
  for (const Position& p : all()) {
    if (p.isLive()) {
      total += p.current_size * entryTokenPrice(p);
    }
  }
  return total;
}

std::vector<domain::PositionUpdate> PositionLedger::updatesFor(
    const PositionId& position_id) const {
  return audit_.updatesFor(position_id);
}

// -----------------------------------------------------------------------------
// recover()
// -----------------------------------------------------------------------------
std::size_t PositionLedger::recover(const std::vector<Position>& positions) {
  std::vector<Event> events;
  {
    std::unique_lock map_lock(map_mutex_);
    positions_.clear();
    for (const Position& recovered : positions) {
      ids_.observe(recovered.position_id);
      Position& p = positions_[recovered.position_id].position;
      p = recovered;
      if (p.status == PositionStatus::Closing) {
        const Position before = p;
        p.status = PositionStatus::Open;
        record(before, p, PositionUpdateType::ManualAdjustment,
               "Closing order lost in restart", events);
      }
    }
  }
  emit(events);
  std::cout << "[PositionLedger] Recovered " << positions.size()
            << " position(s) from the audit trail\n";
  return positions.size();
}

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------
ExitSignal PositionLedger::makeSignal(const Position& p,
                                      std::optional<ExitTrigger> trigger,
                                      CloseReason reason, std::string detail) const {
  ExitSignal signal;
  signal.position_id = p.position_id;
  signal.whale_address = p.whale_address;
  signal.token_id = p.token_id;
  signal.market_id = p.market_id;
  signal.side = p.side;
  signal.trigger = trigger;
  signal.reason = reason;
  signal.size = p.current_size;
  signal.token_price = p.tokenPrice();
  signal.detail = std::move(detail);
  return signal;
}

void PositionLedger::record(const Position& before, const Position& after,
                            PositionUpdateType type, const std::string& reason,
                            std::vector<Event>& events) {
  domain::PositionUpdate update;
  update.position_id = after.position_id;
  update.update_type = type;
  update.old_size = before.current_size;
  update.new_size = after.current_size;
  update.old_price = before.current_price;
  update.new_price = after.current_price;
  update.old_market_value = before.market_value;
  update.new_market_value = after.market_value;
  update.old_unrealized_pnl = before.unrealized_pnl;
  update.new_unrealized_pnl = after.unrealized_pnl;
  update.timestamp_ms = clock_.now_ms();
  update.reason = reason;
  update.metadata = nlohmann::json{{"position", after}};
  update = audit_.appendUpdate(std::move(update));

  PositionUpdateEvent event;
  event.position = after;
  event.update_type = type;
  event.timestamp = ms_to_timestamp(update.timestamp_ms);
  event.sequence_id = update.id;
  events.emplace_back(std::move(event));
}

void PositionLedger::emit(std::vector<Event>& events) const {
  if (!sink_) {
    return;
  }
  for (Event& event : events) {
    sink_(std::move(event));
  }
}

}  // namespace whalecopy
