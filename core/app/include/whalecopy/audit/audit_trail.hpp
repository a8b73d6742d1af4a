#pragma once

#include "whalecopy/domain/order.hpp"
#include "whalecopy/domain/position.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace whalecopy {

// -----------------------------------------------------------------------------
// AuditTrail - append-only log of order transitions and position updates
// -----------------------------------------------------------------------------
//
// @brief  The durable record every order and position mutation is written
//         to before the mutation is considered committed.
//
// @details
// Records are immutable once appended; ids are assigned here and increase
// monotonically per record kind. Each record's metadata carries the full
// entity snapshot after the mutation ("order" / "position"), which is what
// recoverOrders() and recoverPositions() rebuild from.
//
// Journal: when constructed with a path, every record is also written as
// one JSON line ({"kind": "order_transition" | "position_update", ...}) and
// flushed before append returns. An existing journal is replayed first, so
// ids continue and recovery works across restarts. A line that cannot be
// parsed (typically a torn last write) is logged and skipped.
//
// Thread model: one internal mutex; appends from execution_loop, the
// signal loop and the feed thread interleave safely.
// -----------------------------------------------------------------------------
class AuditTrail {
 public:
  // In-memory only.
  AuditTrail() = default;

  // Replays and then appends to `journal_path`. Throws DataIntegrityError
  // if the file cannot be opened for appending.
  explicit AuditTrail(const std::string& journal_path);

  AuditTrail(const AuditTrail&) = delete;
  AuditTrail& operator=(const AuditTrail&) = delete;

  // Assigns the id and returns the stored record.
  domain::OrderTransition appendTransition(domain::OrderTransition transition);
  domain::PositionUpdate appendUpdate(domain::PositionUpdate update);

  std::vector<domain::OrderTransition> transitionsFor(const domain::OrderId& order_id) const;
  std::vector<domain::PositionUpdate> updatesFor(const domain::PositionId& position_id) const;

  std::optional<domain::OrderTransition> lastTransition(const domain::OrderId& order_id) const;

  std::size_t transitionCount() const;
  std::size_t updateCount() const;

  // Latest snapshot of every order / position that appears in the log.
  std::vector<domain::Order> recoverOrders() const;
  std::vector<domain::Position> recoverPositions() const;

  bool journaled() const { return journal_.is_open(); }

 private:
  void replay(const std::string& journal_path);
  void writeLine(const char* kind, const nlohmann::json& body);

  mutable std::mutex mutex_;
  std::vector<domain::OrderTransition> transitions_;
  std::vector<domain::PositionUpdate> updates_;
  std::map<domain::OrderId, std::vector<std::size_t>> by_order_;
  std::map<domain::PositionId, std::vector<std::size_t>> by_position_;
  std::uint64_t next_transition_id_{1};
  std::uint64_t next_update_id_{1};
  std::ofstream journal_;
};

}  // namespace whalecopy
