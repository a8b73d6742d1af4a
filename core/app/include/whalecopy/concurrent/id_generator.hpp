#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <utility>

namespace whalecopy {

// -----------------------------------------------------------------------------
// IdGenerator - thread-safe source of prefixed, monotonically increasing ids
// -----------------------------------------------------------------------------
//
// @brief  Produces ids such as "ord-1", "ord-2", ... from an atomic counter.
//
// @details
// One generator per entity kind: OrderExecutor owns the "ord" generator and
// PositionLedger the "pos" generator. After a restart the owner calls
// observe() for every recovered id so new ids never collide with ids
// already in the audit log.
//
// Thread model: next() and observe() are safe to call concurrently.
// -----------------------------------------------------------------------------
class IdGenerator {
 public:
  explicit IdGenerator(std::string prefix) : prefix_(std::move(prefix)) {}

  IdGenerator(const IdGenerator&) = delete;
  IdGenerator& operator=(const IdGenerator&) = delete;
  IdGenerator(IdGenerator&&) = delete;
  IdGenerator& operator=(IdGenerator&&) = delete;

  // Returns the next unique id, e.g. "ord-42".
  std::string next() {
    return prefix_ + "-" +
           std::to_string(next_.fetch_add(1, std::memory_order_relaxed));
  }

  // -------------------------------------------------------------------------
  // observe(id)
  // -------------------------------------------------------------------------
  // @brief  Advances the counter past an id produced by an earlier run.
  //
  // @details
  // Ids with a different prefix or a non-numeric suffix are ignored. The
  // compare-exchange loop only ever moves the counter forward.
  // -------------------------------------------------------------------------
  void observe(const std::string& id) {
    const std::string head = prefix_ + "-";
    if (id.compare(0, head.size(), head) != 0) {
      return;
    }
    std::uint64_t value = 0;
    for (std::size_t i = head.size(); i < id.size(); ++i) {
      if (id[i] < '0' || id[i] > '9') {
        return;
      }
      value = value * 10 + static_cast<std::uint64_t>(id[i] - '0');
    }
    std::uint64_t current = next_.load(std::memory_order_relaxed);
    while (current <= value &&
           !next_.compare_exchange_weak(current, value + 1,
                                        std::memory_order_relaxed)) {
    }
  }

 private:
  std::string prefix_;
  std::atomic<std::uint64_t> next_{1};
};

}  // namespace whalecopy
