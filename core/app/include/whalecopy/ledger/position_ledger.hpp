#pragma once

#include "whalecopy/audit/audit_trail.hpp"
#include "whalecopy/concurrent/id_generator.hpp"
#include "whalecopy/config/engine_config.hpp"
#include "whalecopy/domain/position.hpp"
#include "whalecopy/events/event.hpp"
#include "whalecopy/ledger/ledger_types.hpp"
#include "whalecopy/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace whalecopy {

// -----------------------------------------------------------------------------
// PositionLedger - authoritative record of copied positions
// -----------------------------------------------------------------------------
//
// @brief  Opens positions from copy fills, revalues them on price ticks,
//         evaluates exit triggers and books closing fills.
//
// @details
// Prices: every stored price is on the YES reference. Methods that take a
// token price (fills, ticks) convert per position, so a NO position filled
// at 0.40 is booked at an entry of 0.60 with dir = -1.
//
// Exits: evaluateExits() checks the triggers of each OPEN position in
// LedgerConfig::exit_priority order. The first one met moves the position
// to CLOSING and yields an ExitSignal; a CLOSING position is never
// re-triggered. A failed closing order goes back to OPEN via abortClose().
//
// Every mutation appends a PositionUpdate to the AuditTrail (snapshot under
// metadata "position") and then emits a PositionUpdateEvent through the
// sink, after all locks are released.
//
// Thread model:
//   Map of positions under a std::shared_mutex. Opening or archiving takes
//   it exclusively; every other mutation takes it shared plus the
//   position's own mutex. Ticks for different positions proceed in
//   parallel.
// -----------------------------------------------------------------------------
class PositionLedger {
 public:
  PositionLedger(const ITimeProvider& clock, AuditTrail& audit,
                 LedgerConfig config, EventSink sink = {});

  PositionLedger(const PositionLedger&) = delete;
  PositionLedger& operator=(const PositionLedger&) = delete;
  PositionLedger(PositionLedger&&) = delete;
  PositionLedger& operator=(PositionLedger&&) = delete;

  // -------------------------------------------------------------------------
  // openPosition(open, fill_size, token_fill_price)
  // -------------------------------------------------------------------------
  // @brief  Books a copy fill.
  //
  // @details
  // If the same whale already holds an OPEN position on the token, the fill
  // is added to it (SIZE_INCREASE) at the size-weighted average entry and
  // the default stops are recomputed. Otherwise a new position is created
  // with default stop-loss and take-profit.
  //
  // @return Snapshot after the fill. Throws std::invalid_argument for a
  //         non-positive size or a price outside (0, 1).
  // -------------------------------------------------------------------------
  domain::Position openPosition(const PositionOpen& open, double fill_size,
                                double token_fill_price);

  // Revalues every live position on the token. Returns how many changed.
  std::size_t applyPrice(const std::string& token_id, double token_price);

  std::vector<ExitSignal> evaluateExits();

  // Flags the whale's OPEN positions on the token for a mirrored exit; the
  // next evaluateExits() turns the flag into a signal. Returns the ids.
  std::vector<domain::PositionId> markWhaleExit(const std::string& whale_address,
                                                const std::string& token_id);

  // Moves an OPEN position to CLOSING outside the trigger checks (manual
  // close, quarantine liquidation).
  std::optional<ExitSignal> beginClose(const domain::PositionId& position_id,
                                       domain::CloseReason reason,
                                       const std::string& detail);

  // CLOSING -> OPEN after a closing order that filled nothing.
  void abortClose(const domain::PositionId& position_id, const std::string& why);

  // -------------------------------------------------------------------------
  // applyCloseFill(position_id, fill_size, token_fill_price, reason)
  // -------------------------------------------------------------------------
  // @brief  Books the aggregated fill of a finished closing order.
  //
  // @details
  // Realized P&L of the fill is (exit - entry) * size * dir on the YES
  // reference. A remainder records PARTIAL_CLOSE and returns the position
  // to OPEN so its triggers apply again; closing the last share records
  // FULL_CLOSE, zeroes unrealized P&L and stamps closed_at.
  //
  // Throws UnknownEntityError for an unknown id.
  // -------------------------------------------------------------------------
  CloseResult applyCloseFill(const domain::PositionId& position_id,
                             double fill_size, double token_fill_price,
                             domain::CloseReason reason);

  // CLOSED positions older than archive_after_ms become ARCHIVED.
  std::size_t archiveClosed();

  std::optional<domain::Position> get(const domain::PositionId& position_id) const;
  std::vector<domain::Position> all() const;
  std::vector<domain::Position> live() const;
  std::vector<domain::Position> forWhale(const std::string& whale_address) const;
  std::map<domain::PositionStatus, std::size_t> countsByStatus() const;

  // CLOSING positions and OPEN ones with a trigger currently met.
  std::vector<domain::Position> requiringAction() const;

  double totalUnrealized() const;
  double totalRealized() const;

  // Entry cost of the shares still held by live positions.
  double totalExposure() const;

  std::vector<domain::PositionUpdate> updatesFor(
      const domain::PositionId& position_id) const;

  // Replaces the ledger content with positions recovered from the audit
  // trail. A position recovered as CLOSING returns to OPEN: its closing
  // order did not survive the restart.
  std::size_t recover(const std::vector<domain::Position>& positions);

  // Stop-loss and take-profit defaults for an entry on the YES reference.
  static std::pair<double, double> defaultStops(const LedgerConfig& config,
                                                domain::Outcome side,
                                                double entry_price);

 private:
  struct Slot {
    mutable std::mutex mutex;
    domain::Position position;
  };

  std::optional<domain::ExitTrigger> dueTrigger(const domain::Position& position,
                                                std::int64_t now) const;
  void trail(domain::Position& position) const;

  ExitSignal makeSignal(const domain::Position& position,
                        std::optional<domain::ExitTrigger> trigger,
                        domain::CloseReason reason, std::string detail) const;

  void record(const domain::Position& before, const domain::Position& after,
              domain::PositionUpdateType type, const std::string& reason,
              std::vector<Event>& events);
  void emit(std::vector<Event>& events) const;

  const ITimeProvider& clock_;
  AuditTrail& audit_;
  LedgerConfig config_;
  EventSink sink_;
  IdGenerator ids_{"pos"};

  mutable std::shared_mutex map_mutex_;
  std::map<domain::PositionId, Slot> positions_;
};

}  // namespace whalecopy
