#pragma once

#include "ledger/domain/adjustment.hpp"
#include "ledger/domain/stock_level.hpp"
#include "ledger/events/event.hpp"
#include "ledger/store/i_ledger_store.hpp"
#include "ledger/store/ledger_transaction.hpp"
#include "ledger/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>

namespace ledger {

// What stageAdjustment() put into the unit for one request.
struct StagedAdjustment {
  domain::StockLevel after;  // Row state as this unit now sees it
  std::size_t entry_index{0};  // Position of the log entry in the unit
};

// -----------------------------------------------------------------------------
// AdjustmentService — one signed delta against one (product, location)
// -----------------------------------------------------------------------------
//
// @brief  Applies a single adjustment: one StockLevel change plus one
//         AdjustmentLogEntry, committed together or not at all.
//
// @details
// Per-item rules (stageAdjustment), in order:
//   1. type must be a quantity-bearing type and delta must be non-zero
//      → InvalidAdjustmentError.
//   2. Product must exist and not be archived, location must exist
//      → ProductNotFoundError / LocationNotFoundError.
//   3. No row yet:
//        delta < 0                          → InsufficientStock{0, -delta}
//        expected_version set and != 0      → OptimisticLock{0, expected}
//        otherwise stage {quantity = delta, version = 1}.
//      Row exists:
//        expected_version set and != version → OptimisticLock{version, exp}
//        quantity + delta < 0               → InsufficientStock{qty, -delta}
//        otherwise stage {quantity + delta, version + 1}.
//   4. Stage the log entry (delta, type, user, now_ms()).
//
// Nothing is staged unless every check passed, so a throwing
// stageAdjustment() leaves the unit exactly as it was.
//
// adjust() wraps that in its own LedgerTransaction. The store's conditional
// write then catches any writer that slipped in between our read and our
// commit, which surfaces as OptimisticLockError. The service never retries.
//
// Thread model:
//   adjust() is safe from any number of request threads at once. The
//   EventSink is called on the request thread after the commit returned,
//   never while a store lock is held.
// -----------------------------------------------------------------------------
class AdjustmentService {
 public:
  AdjustmentService(ILedgerStore& store,
                    const ITimeProvider& clock,
                    EventSink sink = {});

  AdjustmentService(const AdjustmentService&) = delete;
  AdjustmentService& operator=(const AdjustmentService&) = delete;

  // -------------------------------------------------------------------------
  // adjust(request)
  // -------------------------------------------------------------------------
  // @return The committed log entry (with its id) and the row's new
  //         version and quantity.
  // @throws InvalidAdjustmentError, ProductNotFoundError,
  //         LocationNotFoundError, InsufficientStockError,
  //         OptimisticLockError.
  // Side-effects: one row write, one log entry, one StockAdjustedEvent.
  // -------------------------------------------------------------------------
  domain::AdjustmentResult adjust(const domain::AdjustmentRequest& request);

  // -------------------------------------------------------------------------
  // stageAdjustment(tx, request, timestamp_ms)
  // -------------------------------------------------------------------------
  // The per-item core shared with BatchTransactionService. Validates and
  // stages into tx; never commits. tx's transaction id is written into the
  // staged log entry.
  // -------------------------------------------------------------------------
  static StagedAdjustment stageAdjustment(
      LedgerTransaction& tx,
      const domain::AdjustmentRequest& request,
      std::int64_t timestamp_ms);

 private:
  ILedgerStore& store_;
  const ITimeProvider& clock_;
  EventSink sink_;
};

}  // namespace ledger
