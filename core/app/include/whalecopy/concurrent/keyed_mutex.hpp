#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace whalecopy {

// -----------------------------------------------------------------------------
// KeyedMutex - one mutex per entity key
// -----------------------------------------------------------------------------
//
// @brief  Serializes work per order id or idempotency key while letting
//         different keys proceed in parallel.
//
// @details
// lock(key) returns a Guard that owns both the lock and a shared_ptr to the
// mutex. Every shared_ptr copy is taken under the table mutex, so when a
// releasing Guard finds the table and itself to be the only owners, no other
// caller holds or waits on that mutex and the entry is erased. The table
// only holds keys that are locked or contended at that moment.
//
// The table mutex is never held while a caller waits on an entity mutex.
//
// Thread model: all members are safe to call from any thread.
// -----------------------------------------------------------------------------
class KeyedMutex {
 public:
  class Guard {
   public:
    Guard(KeyedMutex& owner, std::string key, std::shared_ptr<std::mutex> mutex)
        : owner_(owner),
          key_(std::move(key)),
          mutex_(std::move(mutex)),
          lock_(*mutex_) {}

    ~Guard() {
      lock_.unlock();
      owner_.release(key_, mutex_);
    }

    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;
    Guard(Guard&&) = delete;
    Guard& operator=(Guard&&) = delete;

   private:
    KeyedMutex& owner_;
    std::string key_;
    std::shared_ptr<std::mutex> mutex_;   // Declared before lock_: outlives it
    std::unique_lock<std::mutex> lock_;
  };

  KeyedMutex() = default;
  KeyedMutex(const KeyedMutex&) = delete;
  KeyedMutex& operator=(const KeyedMutex&) = delete;

  // Blocks until the mutex for `key` is acquired.
  Guard lock(const std::string& key) { return Guard(*this, key, entry(key)); }

  // Keys currently locked or waited on.
  std::size_t size() const {
    std::lock_guard lock(table_mutex_);
    return table_.size();
  }

 private:
  std::shared_ptr<std::mutex> entry(const std::string& key) {
    std::lock_guard lock(table_mutex_);
    auto& slot = table_[key];
    if (!slot) {
      slot = std::make_shared<std::mutex>();
    }
    return slot;
  }

  void release(const std::string& key, const std::shared_ptr<std::mutex>& mutex) {
    std::lock_guard lock(table_mutex_);
    auto it = table_.find(key);
    if (it != table_.end() && it->second == mutex && mutex.use_count() == 2) {
      table_.erase(it);
    }
  }

  mutable std::mutex table_mutex_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> table_;
};

}  // namespace whalecopy
