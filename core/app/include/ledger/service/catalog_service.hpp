#pragma once

#include "ledger/domain/adjustment_log_entry.hpp"
#include "ledger/domain/catalog.hpp"
#include "ledger/events/event.hpp"
#include "ledger/store/i_ledger_store.hpp"
#include "ledger/time/i_time_provider.hpp"

#include <vector>

namespace ledger {

// -----------------------------------------------------------------------------
// CatalogService — product and location lifecycle
// -----------------------------------------------------------------------------
//
// @brief  Registers catalog rows and soft-deletes, restores or purges
//         products.
//
// @details
// Archive and restore leave a trace in the audit trail: one zero-delta
// ARCHIVE / RESTORE marker per existing stock row of the product, committed
// in the same atomic unit as the flag change. Markers do not move
// quantities, so the reconciliation property still holds.
//
// An archived product keeps its rows and history (they stay readable) but
// every new adjustment or batch line against it fails with
// ProductNotFoundError.
//
// purgeProduct() is the only operation that removes log entries. It
// cascades over the product's rows and history and cannot be undone.
//
// Thread model: any thread. Archive/restore race with adjustments through
// the store's commit checks only.
// -----------------------------------------------------------------------------
class CatalogService {
 public:
  CatalogService(ILedgerStore& store,
                 const ITimeProvider& clock,
                 EventSink sink = {});

  CatalogService(const CatalogService&) = delete;
  CatalogService& operator=(const CatalogService&) = delete;

  // @throws InvalidAdjustmentError for a non-positive id or a negative
  //         threshold.
  void upsertProduct(const domain::Product& product);
  void upsertLocation(const domain::Location& location);

  // -------------------------------------------------------------------------
  // archiveProduct / restoreProduct
  // -------------------------------------------------------------------------
  // @return The committed marker entries (empty if the product has no rows).
  // @throws ProductNotFoundError if the product does not exist;
  //         InvalidAdjustmentError if it is already in the requested state;
  //         OptimisticLockError if a stock row of the product was created
  //         while the markers were prepared (nothing is written; retry).
  // -------------------------------------------------------------------------
  std::vector<domain::AdjustmentLogEntry> archiveProduct(
      domain::UserId user_id, domain::ProductId product_id);
  std::vector<domain::AdjustmentLogEntry> restoreProduct(
      domain::UserId user_id, domain::ProductId product_id);

  // @throws ProductNotFoundError if the product does not exist.
  void purgeProduct(domain::ProductId product_id);

 private:
  std::vector<domain::AdjustmentLogEntry> setArchived(
      domain::UserId user_id, domain::ProductId product_id, bool archived);

  ILedgerStore& store_;
  const ITimeProvider& clock_;
  EventSink sink_;
};

}  // namespace ledger
