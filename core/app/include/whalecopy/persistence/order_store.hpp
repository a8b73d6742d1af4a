#pragma once

#include "whalecopy/domain/order.hpp"
#include "whalecopy/domain/order_state.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace whalecopy {

// -----------------------------------------------------------------------------
// OrderStore - current state of every order, with the schema's constraints
// -----------------------------------------------------------------------------
//
// @brief  In-process mirror of the `orders` table: primary key on order_id,
//         UNIQUE on idempotency_key.
//
// @details
// insert() is the persistence boundary for idempotency: a second order with
// an already-stored key throws DuplicateIdempotencyKeyError no matter how
// the caller got there. update() refuses unknown ids.
//
// Thread model: one internal mutex. Reads return copies.
// -----------------------------------------------------------------------------
class OrderStore {
 public:
  OrderStore() = default;

  OrderStore(const OrderStore&) = delete;
  OrderStore& operator=(const OrderStore&) = delete;

  // Throws DuplicateIdempotencyKeyError or DataIntegrityError (duplicate id).
  void insert(const domain::Order& order);

  // Throws UnknownEntityError if the order was never inserted.
  void update(const domain::Order& order);

  std::optional<domain::Order> get(const domain::OrderId& order_id) const;
  std::optional<domain::Order> findByKey(const std::string& idempotency_key) const;
  std::optional<domain::Order> findByExchangeId(const std::string& exchange_order_id) const;

  std::vector<domain::Order> byState(domain::OrderState state) const;
  std::vector<domain::Order> childrenOf(const domain::OrderId& parent_id) const;
  std::vector<domain::Order> all() const;
  std::size_t size() const;

  // Replaces the whole content, e.g. with orders recovered from the audit
  // log. Throws DuplicateIdempotencyKeyError if the input violates the key
  // constraint; the store is left unchanged in that case.
  void replaceAll(const std::vector<domain::Order>& orders);

 private:
  mutable std::mutex mutex_;
  std::map<domain::OrderId, domain::Order> orders_;
  std::unordered_map<std::string, domain::OrderId> by_key_;
};

}  // namespace whalecopy
