#pragma once

#include "ledger/domain/ids.hpp"

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>

namespace ledger {

// -----------------------------------------------------------------------------
// ErrorKind — machine-readable category of a ledger failure
// -----------------------------------------------------------------------------
//
// @brief  Lets calling layers branch on the kind of failure without string
//         matching (e.g. map OptimisticLock to HTTP 409).
//
// @details
//   OptimisticLock    → a concurrent writer won the race. Retryable by the
//                       caller after refetching the row.
//   InsufficientStock → business rule violation. Not retryable without a
//                       different request.
//   NotFound          → product, location or order does not exist (or the
//                       product is archived). Fatal for the call.
//   Validation        → malformed request (zero delta, empty batch, ...).
//   BatchItem         → one batch line failed; wraps one of the above.
//   Storage           → internal store failure unrelated to the above.
// -----------------------------------------------------------------------------
enum class ErrorKind {
  OptimisticLock,
  InsufficientStock,
  NotFound,
  Validation,
  BatchItem,
  Storage,
};

// Wire name, e.g. "OPTIMISTIC_LOCK_ERROR".
const char* errorKindToString(ErrorKind kind);

// HTTP-style status hint for the collaborator layer (409, 400, 404, 500).
int httpStatusFor(ErrorKind kind);

// -----------------------------------------------------------------------------
// LedgerError — root of every typed ledger failure
// -----------------------------------------------------------------------------
//
// @brief  Base exception thrown by the store, the transaction and the
//         services. what() carries the user-facing message.
//
// @details
// clone() exists so BatchItemError can hold on to the concrete cause after
// the original exception object has gone out of scope.
// -----------------------------------------------------------------------------
class LedgerError : public std::runtime_error {
 public:
  explicit LedgerError(const std::string& message)
      : std::runtime_error(message) {}

  virtual ErrorKind kind() const = 0;
  virtual std::shared_ptr<const LedgerError> clone() const = 0;

  bool retryable() const { return kind() == ErrorKind::OptimisticLock; }
};

// -----------------------------------------------------------------------------
// OptimisticLockError
// -----------------------------------------------------------------------------
// Thrown when the row version does not match the caller's expected_version,
// or when the store's conditional write finds that the row moved between
// read and commit. The engine never retries this itself.
// -----------------------------------------------------------------------------
class OptimisticLockError final : public LedgerError {
 public:
  OptimisticLockError(domain::ProductId product_id,
                      domain::LocationId location_id,
                      domain::Version current_version,
                      domain::Version expected_version);

  ErrorKind kind() const override { return ErrorKind::OptimisticLock; }
  std::shared_ptr<const LedgerError> clone() const override {
    return std::make_shared<OptimisticLockError>(*this);
  }

  domain::ProductId productId() const { return product_id_; }
  domain::LocationId locationId() const { return location_id_; }
  domain::Version currentVersion() const { return current_version_; }
  domain::Version expectedVersion() const { return expected_version_; }

 private:
  domain::ProductId product_id_;
  domain::LocationId location_id_;
  domain::Version current_version_;
  domain::Version expected_version_;
};

// -----------------------------------------------------------------------------
// InsufficientStockError
// -----------------------------------------------------------------------------
// requested is the number of units the caller tried to remove (a positive
// number). shortfall() = requested - current.
// -----------------------------------------------------------------------------
class InsufficientStockError final : public LedgerError {
 public:
  InsufficientStockError(domain::ProductId product_id,
                         domain::LocationId location_id,
                         domain::Quantity current,
                         domain::Quantity requested);

  ErrorKind kind() const override { return ErrorKind::InsufficientStock; }
  std::shared_ptr<const LedgerError> clone() const override {
    return std::make_shared<InsufficientStockError>(*this);
  }

  domain::ProductId productId() const { return product_id_; }
  domain::LocationId locationId() const { return location_id_; }
  domain::Quantity current() const { return current_; }
  domain::Quantity requested() const { return requested_; }
  domain::Quantity shortfall() const { return requested_ - current_; }

 private:
  domain::ProductId product_id_;
  domain::LocationId location_id_;
  domain::Quantity current_;
  domain::Quantity requested_;
};

// -----------------------------------------------------------------------------
// NotFoundError and its concrete referential failures
// -----------------------------------------------------------------------------
class NotFoundError : public LedgerError {
 public:
  NotFoundError(std::string entity, const std::string& message)
      : LedgerError(message), entity_(std::move(entity)) {}

  ErrorKind kind() const override { return ErrorKind::NotFound; }

  // "product", "location" or "order".
  const std::string& entity() const { return entity_; }

 private:
  std::string entity_;
};

class ProductNotFoundError final : public NotFoundError {
 public:
  explicit ProductNotFoundError(domain::ProductId product_id,
                                bool archived = false);

  std::shared_ptr<const LedgerError> clone() const override {
    return std::make_shared<ProductNotFoundError>(*this);
  }

  domain::ProductId productId() const { return product_id_; }
  bool archived() const { return archived_; }

 private:
  domain::ProductId product_id_;
  bool archived_;
};

class LocationNotFoundError final : public NotFoundError {
 public:
  explicit LocationNotFoundError(domain::LocationId location_id);

  std::shared_ptr<const LedgerError> clone() const override {
    return std::make_shared<LocationNotFoundError>(*this);
  }

  domain::LocationId locationId() const { return location_id_; }

 private:
  domain::LocationId location_id_;
};

class OrderNotFoundError final : public NotFoundError {
 public:
  explicit OrderNotFoundError(const std::string& reference);

  std::shared_ptr<const LedgerError> clone() const override {
    return std::make_shared<OrderNotFoundError>(*this);
  }

  const std::string& reference() const { return reference_; }

 private:
  std::string reference_;
};

// -----------------------------------------------------------------------------
// InvalidAdjustmentError — request rejected before touching the store
// -----------------------------------------------------------------------------
class InvalidAdjustmentError final : public LedgerError {
 public:
  explicit InvalidAdjustmentError(const std::string& message)
      : LedgerError(message) {}

  ErrorKind kind() const override { return ErrorKind::Validation; }
  std::shared_ptr<const LedgerError> clone() const override {
    return std::make_shared<InvalidAdjustmentError>(*this);
  }
};

// -----------------------------------------------------------------------------
// StorageError — store-level failure (constraint violation, corrupt input)
// -----------------------------------------------------------------------------
class StorageError final : public LedgerError {
 public:
  explicit StorageError(const std::string& message) : LedgerError(message) {}

  ErrorKind kind() const override { return ErrorKind::Storage; }
  std::shared_ptr<const LedgerError> clone() const override {
    return std::make_shared<StorageError>(*this);
  }
};

// -----------------------------------------------------------------------------
// BatchItemError — one batch line failed, so the whole batch aborted
// -----------------------------------------------------------------------------
//
// @brief  Wraps the item's own typed error together with its position and
//         identity so the caller can report which line failed.
//
// @details
// item_index is zero-based (position in the caller's item list). The
// message uses the one-based line number a person would read:
//   "item #2 for productId=42 at locationId=1: insufficient stock ..."
// -----------------------------------------------------------------------------
class BatchItemError final : public LedgerError {
 public:
  BatchItemError(std::size_t item_index,
                 domain::ProductId product_id,
                 domain::LocationId location_id,
                 std::shared_ptr<const LedgerError> cause);

  ErrorKind kind() const override { return ErrorKind::BatchItem; }
  std::shared_ptr<const LedgerError> clone() const override {
    return std::make_shared<BatchItemError>(*this);
  }

  std::size_t itemIndex() const { return item_index_; }
  domain::ProductId productId() const { return product_id_; }
  domain::LocationId locationId() const { return location_id_; }

  // The underlying failure. Never null.
  const LedgerError& cause() const { return *cause_; }
  ErrorKind causeKind() const { return cause_->kind(); }

 private:
  std::size_t item_index_;
  domain::ProductId product_id_;
  domain::LocationId location_id_;
  std::shared_ptr<const LedgerError> cause_;
};

}  // namespace ledger
