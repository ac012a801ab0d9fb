#include "ledger/errors/ledger_errors.hpp"

#include <sstream>
#include <utility>

namespace ledger {

namespace {

std::string lockMessage(domain::ProductId product_id,
                        domain::LocationId location_id,
                        domain::Version current_version,
                        domain::Version expected_version) {
  std::ostringstream oss;
  oss << "stock for productId=" << product_id << " at locationId="
      << location_id << " was modified by another user (expected version "
      << expected_version << ", current version " << current_version
      << "); refresh and retry";
  return oss.str();
}

std::string stockMessage(domain::ProductId product_id,
                         domain::LocationId location_id,
                         domain::Quantity current,
                         domain::Quantity requested) {
  std::ostringstream oss;
  oss << "insufficient stock for productId=" << product_id
      << " at locationId=" << location_id << ": current " << current
      << ", requested " << requested << ", shortfall "
      << (requested - current);
  return oss.str();
}

std::string batchMessage(std::size_t item_index,
                         domain::ProductId product_id,
                         domain::LocationId location_id,
                         const LedgerError* cause) {
  std::ostringstream oss;
  oss << "item #" << (item_index + 1) << " for productId=" << product_id
      << " at locationId=" << location_id << ": "
      << (cause != nullptr ? cause->what() : "unknown error");
  return oss.str();
}

}  // namespace

// -----------------------------------------------------------------------------
// ErrorKind helpers
// -----------------------------------------------------------------------------
const char* errorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::OptimisticLock:    return "OPTIMISTIC_LOCK_ERROR";
    case ErrorKind::InsufficientStock: return "INSUFFICIENT_STOCK";
    case ErrorKind::NotFound:          return "NOT_FOUND";
    case ErrorKind::Validation:        return "VALIDATION_ERROR";
    case ErrorKind::BatchItem:         return "BATCH_ITEM_ERROR";
    case ErrorKind::Storage:           return "STORAGE_ERROR";
  }
  return "UNKNOWN_ERROR";
}

int httpStatusFor(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::OptimisticLock:    return 409;
    case ErrorKind::InsufficientStock: return 400;
    case ErrorKind::NotFound:          return 404;
    case ErrorKind::Validation:        return 400;
    case ErrorKind::BatchItem:         return 400;
    case ErrorKind::Storage:           return 500;
  }
  return 500;
}

// -----------------------------------------------------------------------------
// Concrete error constructors
// -----------------------------------------------------------------------------
OptimisticLockError::OptimisticLockError(domain::ProductId product_id,
                                         domain::LocationId location_id,
                                         domain::Version current_version,
                                         domain::Version expected_version)
    : LedgerError(lockMessage(product_id, location_id, current_version,
                              expected_version)),
      product_id_(product_id),
      location_id_(location_id),
      current_version_(current_version),
      expected_version_(expected_version) {}

InsufficientStockError::InsufficientStockError(domain::ProductId product_id,
                                               domain::LocationId location_id,
                                               domain::Quantity current,
                                               domain::Quantity requested)
    : LedgerError(stockMessage(product_id, location_id, current, requested)),
      product_id_(product_id),
      location_id_(location_id),
      current_(current),
      requested_(requested) {}

ProductNotFoundError::ProductNotFoundError(domain::ProductId product_id,
                                           bool archived)
    : NotFoundError("product",
                    "productId=" + std::to_string(product_id) +
                        (archived ? " is archived" : " not found")),
      product_id_(product_id),
      archived_(archived) {}

LocationNotFoundError::LocationNotFoundError(domain::LocationId location_id)
    : NotFoundError("location",
                    "locationId=" + std::to_string(location_id) +
                        " not found"),
      location_id_(location_id) {}

OrderNotFoundError::OrderNotFoundError(const std::string& reference)
    : NotFoundError("order", "order '" + reference + "' not found"),
      reference_(reference) {}

BatchItemError::BatchItemError(std::size_t item_index,
                               domain::ProductId product_id,
                               domain::LocationId location_id,
                               std::shared_ptr<const LedgerError> cause)
    : LedgerError(batchMessage(item_index, product_id, location_id,
                               cause.get())),
      item_index_(item_index),
      product_id_(product_id),
      location_id_(location_id),
      cause_(cause ? std::move(cause)
                   : std::make_shared<StorageError>("unknown batch failure")) {}

}  // namespace ledger
