#pragma once

#include "whalecopy/domain/order.hpp"
#include "whalecopy/domain/position.hpp"

#include <nlohmann/json.hpp>

namespace whalecopy {
namespace domain {

// -----------------------------------------------------------------------------
// JSON representation of the persisted records
// -----------------------------------------------------------------------------
// Used for audit metadata snapshots, the audit journal and IPC replies.
// Field names follow the column names of schema/*.sql. Enums are written
// with toString() and read with the parse*() functions; an unknown enum
// name throws DataIntegrityError, a missing field nlohmann::json::exception.
// Derived values (total_pnl, pnl_percentage) are written for readers but
// never read back.
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Order& order);
void from_json(const nlohmann::json& j, Order& order);

void to_json(nlohmann::json& j, const OrderTransition& transition);
void from_json(const nlohmann::json& j, OrderTransition& transition);

void to_json(nlohmann::json& j, const Position& position);
void from_json(const nlohmann::json& j, Position& position);

void to_json(nlohmann::json& j, const PositionUpdate& update);
void from_json(const nlohmann::json& j, PositionUpdate& update);

}  // namespace domain
}  // namespace whalecopy
