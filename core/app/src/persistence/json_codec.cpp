#include "whalecopy/persistence/json_codec.hpp"
#include "whalecopy/domain/enum_strings.hpp"
#include "whalecopy/errors.hpp"

#include <optional>
#include <string>

namespace whalecopy {
namespace domain {

namespace {

template <typename T>
void putOptional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
  if (value) {
    j[key] = *value;
  } else {
    j[key] = nullptr;
  }
}

template <typename T>
std::optional<T> getOptional(const nlohmann::json& j, const char* key) {
  if (!j.contains(key) || j.at(key).is_null()) {
    return std::nullopt;
  }
  return j.at(key).get<T>();
}

template <typename E>
E parseOrThrow(std::optional<E> parsed, const std::string& text, const char* what) {
  if (!parsed) {
    throw DataIntegrityError(std::string("unknown ") + what + ": " + text);
  }
  return *parsed;
}

std::string getString(const nlohmann::json& j, const char* key) {
  return j.at(key).get<std::string>();
}

}  // namespace

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Order& o) {
  j = nlohmann::json{
      {"order_id", o.order_id},
      {"idempotency_key", o.idempotency_key},
      {"exchange_order_id", o.exchange_order_id},
      {"token_id", o.token_id},
      {"market_id", o.market_id},
      {"side", toString(o.side)},
      {"size", o.size},
      {"order_type", toString(o.order_type)},
      {"state", toString(o.state)},
      {"filled_size", o.filled_size},
      {"remaining_size", o.remaining_size},
      {"avg_fill_price", o.avg_fill_price},
      {"created_at", o.created_at_ms},
      {"retry_count", o.retry_count},
      {"max_retries", o.max_retries},
      {"error_message", o.error_message},
      {"parent_order_id", o.parent_order_id},
      {"child_depth", o.child_depth},
      {"position_id", o.position_id},
      {"whale_address", o.whale_address},
  };
  putOptional(j, "price", o.price);
  putOptional(j, "submitted_at", o.submitted_at_ms);
  putOptional(j, "filled_at", o.filled_at_ms);
  putOptional(j, "confirmed_at", o.confirmed_at_ms);
}

void from_json(const nlohmann::json& j, Order& o) {
  o.order_id = getString(j, "order_id");
  o.idempotency_key = getString(j, "idempotency_key");
  o.exchange_order_id = getString(j, "exchange_order_id");
  o.token_id = getString(j, "token_id");
  o.market_id = getString(j, "market_id");
  const std::string side = getString(j, "side");
  o.side = parseOrThrow(parseSide(side), side, "side");
  o.size = j.at("size").get<double>();
  o.price = getOptional<double>(j, "price");
  const std::string type = getString(j, "order_type");
  o.order_type = parseOrThrow(parseOrderType(type), type, "order type");
  const std::string state = getString(j, "state");
  o.state = parseOrThrow(parseOrderState(state), state, "order state");
  o.setFilled(j.at("filled_size").get<double>());
  o.avg_fill_price = j.at("avg_fill_price").get<double>();
  o.created_at_ms = j.at("created_at").get<std::int64_t>();
  o.submitted_at_ms = getOptional<std::int64_t>(j, "submitted_at");
  o.filled_at_ms = getOptional<std::int64_t>(j, "filled_at");
  o.confirmed_at_ms = getOptional<std::int64_t>(j, "confirmed_at");
  o.retry_count = j.at("retry_count").get<int>();
  o.max_retries = j.at("max_retries").get<int>();
  o.error_message = getString(j, "error_message");
  o.parent_order_id = j.value("parent_order_id", std::string());
  o.child_depth = j.value("child_depth", 0);
  o.position_id = j.value("position_id", std::string());
  o.whale_address = j.value("whale_address", std::string());
}

// -----------------------------------------------------------------------------
// OrderTransition
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const OrderTransition& t) {
  j = nlohmann::json{
      {"id", t.id},
      {"order_id", t.order_id},
      {"to_state", toString(t.to_state)},
      {"timestamp", t.timestamp_ms},
      {"reason", t.reason},
      {"metadata", t.metadata},
  };
  if (t.from_state) {
    j["from_state"] = toString(*t.from_state);
  } else {
    j["from_state"] = nullptr;
  }
}

void from_json(const nlohmann::json& j, OrderTransition& t) {
  t.id = j.at("id").get<std::uint64_t>();
  t.order_id = getString(j, "order_id");
  if (j.contains("from_state") && !j.at("from_state").is_null()) {
    const std::string from = getString(j, "from_state");
    t.from_state = parseOrThrow(parseOrderState(from), from, "order state");
  } else {
    t.from_state.reset();
  }
  const std::string to = getString(j, "to_state");
  t.to_state = parseOrThrow(parseOrderState(to), to, "order state");
  t.timestamp_ms = j.at("timestamp").get<std::int64_t>();
  t.reason = getString(j, "reason");
  t.metadata = j.value("metadata", nlohmann::json::object());
}

// -----------------------------------------------------------------------------
// Position
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Position& p) {
  j = nlohmann::json{
      {"position_id", p.position_id},
      {"whale_address", p.whale_address},
      {"token_id", p.token_id},
      {"market_id", p.market_id},
      {"category", p.category},
      {"side", toString(p.side)},
      {"entry_size", p.entry_size},
      {"entry_price", p.entry_price},
      {"entry_amount", p.entry_amount},
      {"current_size", p.current_size},
      {"current_price", p.current_price},
      {"market_value", p.market_value},
      {"unrealized_pnl", p.unrealized_pnl},
      {"realized_pnl", p.realized_pnl},
      {"total_pnl", p.totalPnl()},
      {"pnl_percentage", p.pnlPercentage()},
      {"max_drawdown", p.max_drawdown},
      {"max_profit", p.max_profit},
      {"kelly_fraction", p.kelly_fraction},
      {"edge", p.edge},
      {"win_rate", p.win_rate},
      {"status", toString(p.status)},
      {"opened_at", p.opened_at_ms},
      {"last_updated_at", p.last_updated_at_ms},
      {"whale_exit_pending", p.whale_exit_pending},
  };
  putOptional(j, "stop_loss_price", p.stop_loss_price);
  putOptional(j, "take_profit_price", p.take_profit_price);
  putOptional(j, "trailing_reference_price", p.trailing_reference_price);
  putOptional(j, "closed_at", p.closed_at_ms);
  putOptional(j, "resolution_time", p.resolution_time_ms);
  if (p.close_reason) {
    j["close_reason"] = toString(*p.close_reason);
  } else {
    j["close_reason"] = nullptr;
  }
}

void from_json(const nlohmann::json& j, Position& p) {
  p.position_id = getString(j, "position_id");
  p.whale_address = getString(j, "whale_address");
  p.token_id = getString(j, "token_id");
  p.market_id = j.value("market_id", std::string());
  p.category = j.value("category", std::string());
  const std::string side = getString(j, "side");
  p.side = parseOrThrow(parseOutcome(side), side, "outcome");
  p.entry_size = j.at("entry_size").get<double>();
  p.entry_price = j.at("entry_price").get<double>();
  p.entry_amount = j.at("entry_amount").get<double>();
  p.current_size = j.at("current_size").get<double>();
  p.current_price = j.at("current_price").get<double>();
  p.market_value = j.at("market_value").get<double>();
  p.unrealized_pnl = j.at("unrealized_pnl").get<double>();
  p.realized_pnl = j.at("realized_pnl").get<double>();
  p.max_drawdown = j.at("max_drawdown").get<double>();
  p.max_profit = j.at("max_profit").get<double>();
  p.stop_loss_price = getOptional<double>(j, "stop_loss_price");
  p.take_profit_price = getOptional<double>(j, "take_profit_price");
  p.trailing_reference_price = getOptional<double>(j, "trailing_reference_price");
  p.kelly_fraction = j.at("kelly_fraction").get<double>();
  p.edge = j.at("edge").get<double>();
  p.win_rate = j.at("win_rate").get<double>();
  const std::string status = getString(j, "status");
  p.status = parseOrThrow(parsePositionStatus(status), status, "position status");
  p.opened_at_ms = j.at("opened_at").get<std::int64_t>();
  p.last_updated_at_ms = j.at("last_updated_at").get<std::int64_t>();
  p.closed_at_ms = getOptional<std::int64_t>(j, "closed_at");
  p.resolution_time_ms = getOptional<std::int64_t>(j, "resolution_time");
  p.whale_exit_pending = j.value("whale_exit_pending", false);
  if (j.contains("close_reason") && !j.at("close_reason").is_null()) {
    const std::string reason = getString(j, "close_reason");
    p.close_reason = parseOrThrow(parseCloseReason(reason), reason, "close reason");
  } else {
    p.close_reason.reset();
  }
}

// -----------------------------------------------------------------------------
// PositionUpdate
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const PositionUpdate& u) {
  j = nlohmann::json{
      {"id", u.id},
      {"position_id", u.position_id},
      {"update_type", toString(u.update_type)},
      {"old_size", u.old_size},
      {"new_size", u.new_size},
      {"old_price", u.old_price},
      {"new_price", u.new_price},
      {"old_market_value", u.old_market_value},
      {"new_market_value", u.new_market_value},
      {"old_unrealized_pnl", u.old_unrealized_pnl},
      {"new_unrealized_pnl", u.new_unrealized_pnl},
      {"timestamp", u.timestamp_ms},
      {"reason", u.reason},
      {"metadata", u.metadata},
  };
}

void from_json(const nlohmann::json& j, PositionUpdate& u) {
  u.id = j.at("id").get<std::uint64_t>();
  u.position_id = getString(j, "position_id");
  const std::string type = getString(j, "update_type");
  u.update_type = parseOrThrow(parsePositionUpdateType(type), type, "update type");
  u.old_size = j.at("old_size").get<double>();
  u.new_size = j.at("new_size").get<double>();
  u.old_price = j.at("old_price").get<double>();
  u.new_price = j.at("new_price").get<double>();
  u.old_market_value = j.at("old_market_value").get<double>();
  u.new_market_value = j.at("new_market_value").get<double>();
  u.old_unrealized_pnl = j.at("old_unrealized_pnl").get<double>();
  u.new_unrealized_pnl = j.at("new_unrealized_pnl").get<double>();
  u.timestamp_ms = j.at("timestamp").get<std::int64_t>();
  u.reason = getString(j, "reason");
  u.metadata = j.value("metadata", nlohmann::json::object());
}

}  // namespace domain
}  // namespace whalecopy
