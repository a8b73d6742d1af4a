#pragma once

#include <stdexcept>
#include <string>

namespace whalecopy {

// -----------------------------------------------------------------------------
// DataIntegrityError - a persistence or state-machine invariant was violated
// -----------------------------------------------------------------------------
//
// @brief  Base class for programming and integration errors surfaced at the
//         persistence boundary.
//
// @details
// Thrown when a caller attempts something the data model forbids: a
// duplicate idempotency key, an illegal order state transition, an update
// to an order that does not exist. The error is fatal to the request that
// triggered it only; engine loop handlers log it and keep running.
// -----------------------------------------------------------------------------
class DataIntegrityError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Unique constraint on orders.idempotency_key was violated.
class DuplicateIdempotencyKeyError : public DataIntegrityError {
 public:
  explicit DuplicateIdempotencyKeyError(const std::string& key)
      : DataIntegrityError("duplicate idempotency key: " + key), key_(key) {}

  const std::string& key() const { return key_; }

 private:
  std::string key_;
};

// An order state change outside the legal transition graph was attempted.
class InvalidTransitionError : public DataIntegrityError {
 public:
  using DataIntegrityError::DataIntegrityError;
};

// Lookup of an order or position id that the store does not hold.
class UnknownEntityError : public DataIntegrityError {
 public:
  using DataIntegrityError::DataIntegrityError;
};

// Configuration file could not be read or contains an invalid value.
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace whalecopy
