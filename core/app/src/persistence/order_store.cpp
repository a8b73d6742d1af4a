#include "whalecopy/persistence/order_store.hpp"
#include "whalecopy/errors.hpp"

namespace whalecopy {

void OrderStore::insert(const domain::Order& order) {
  std::lock_guard lock(mutex_);
  if (by_key_.count(order.idempotency_key) > 0) {
    throw DuplicateIdempotencyKeyError(order.idempotency_key);
  }
  if (orders_.count(order.order_id) > 0) {
    throw DataIntegrityError("duplicate order id: " + order.order_id);
  }
  orders_[order.order_id] = order;
  by_key_[order.idempotency_key] = order.order_id;
}

void OrderStore::update(const domain::Order& order) {
  std::lock_guard lock(mutex_);
  auto it = orders_.find(order.order_id);
  if (it == orders_.end()) {
    throw UnknownEntityError("unknown order id: " + order.order_id);
  }
  if (it->second.idempotency_key != order.idempotency_key) {
    throw DataIntegrityError("idempotency key of " + order.order_id +
                             " cannot change");
  }
  it->second = order;
}

std::optional<domain::Order> OrderStore::get(const domain::OrderId& order_id) const {
  std::lock_guard lock(mutex_);
  auto it = orders_.find(order_id);
  if (it == orders_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<domain::Order> OrderStore::findByKey(
    const std::string& idempotency_key) const {
  std::lock_guard lock(mutex_);
  auto key = by_key_.find(idempotency_key);
  if (key == by_key_.end()) {
    return std::nullopt;
  }
  return orders_.at(key->second);
}

std::optional<domain::Order> OrderStore::findByExchangeId(
    const std::string& exchange_order_id) const {
  if (exchange_order_id.empty()) {
    return std::nullopt;
  }
  std::lock_guard lock(mutex_);
  for (const auto& [id, order] : orders_) {
    if (order.exchange_order_id == exchange_order_id) {
      return order;
    }
  }
  return std::nullopt;
}

std::vector<domain::Order> OrderStore::byState(domain::OrderState state) const {
  std::lock_guard lock(mutex_);
  std::vector<domain::Order> result;
  for (const auto& [id, order] : orders_) {
    if (order.state == state) {
      result.push_back(order);
    }
  }
  return result;
}

std::vector<domain::Order> OrderStore::childrenOf(
    const domain::OrderId& parent_id) const {
  std::lock_guard lock(mutex_);
  std::vector<domain::Order> result;
  for (const auto& [id, order] : orders_) {
    if (order.parent_order_id == parent_id) {
      result.push_back(order);
    }
  }
  return result;
}

std::vector<domain::Order> OrderStore::all() const {
  std::lock_guard lock(mutex_);
  std::vector<domain::Order> result;
  result.reserve(orders_.size());
  for (const auto& [id, order] : orders_) {
    result.push_back(order);
  }
  return result;
}

std::size_t OrderStore::size() const {
  std::lock_guard lock(mutex_);
  return orders_.size();
}

void OrderStore::replaceAll(const std::vector<domain::Order>& orders) {
  std::map<domain::OrderId, domain::Order> next;
  std::unordered_map<std::string, domain::OrderId> next_keys;
  for (const auto& order : orders) {
    if (!next_keys.emplace(order.idempotency_key, order.order_id).second) {
      throw DuplicateIdempotencyKeyError(order.idempotency_key);
    }
    next[order.order_id] = order;
  }
  std::lock_guard lock(mutex_);
  orders_.swap(next);
  by_key_.swap(next_keys);
}

}  // namespace whalecopy
