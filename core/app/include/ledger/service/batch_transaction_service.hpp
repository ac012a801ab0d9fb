#pragma once

#include "ledger/concurrent/transaction_id_generator.hpp"
#include "ledger/domain/adjustment_type.hpp"
#include "ledger/domain/batch.hpp"
#include "ledger/errors/ledger_errors.hpp"
#include "ledger/events/event.hpp"
#include "ledger/service/adjustment_service.hpp"
#include "ledger/store/i_ledger_store.hpp"
#include "ledger/time/i_time_provider.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace ledger {

// -----------------------------------------------------------------------------
// Per-item outcome of a batch
// -----------------------------------------------------------------------------
// Closed set: every item either applied inside the open unit or failed with
// a typed reason. The batch loop handles both with std::visit, so adding a
// third outcome is a compile error until the abort path handles it.
// -----------------------------------------------------------------------------
struct ItemApplied {
  std::size_t index{0};
  StagedAdjustment staged;
};

struct ItemFailed {
  std::size_t index{0};
  std::shared_ptr<const LedgerError> reason;
};

using ItemOutcome = std::variant<ItemApplied, ItemFailed>;

// -----------------------------------------------------------------------------
// BatchTransactionService — N adjustments, one atomic unit
// -----------------------------------------------------------------------------
//
// @brief  Applies every item of a batch or none of them.
//
// @details
// Algorithm:
//   1. Reject empty or oversized batches (InvalidAdjustmentError).
//   2. Open one LedgerTransaction with a fresh "txn_<ms>_<seq>" id.
//   3. For each item in caller order, run AdjustmentService's per-item core
//      against the shared unit. Items touching the same pair see the
//      quantity and version staged by earlier items.
//   4. First ItemFailed → abort the unit, emit BatchAbortedEvent, throw
//      BatchItemError naming the failing line.
//   5. All applied → commit once. A conditional-write conflict at commit is
//      attributed to the first item on the conflicting pair and reported the
//      same way as step 4.
//   6. Emit one StockAdjustedEvent per item, then one BatchCommittedEvent.
//
// After an abort the store holds no row change and no log entry from the
// batch, including items processed before the failing one.
//
// Thread model:
//   applyBatch() and transfer() are safe from any number of threads. Two
//   batches on disjoint pairs commit independently; overlapping batches are
//   serialized by the store's version check, never by a lock held here.
// -----------------------------------------------------------------------------
class BatchTransactionService {
 public:
  BatchTransactionService(ILedgerStore& store,
                          const ITimeProvider& clock,
                          std::size_t max_items,
                          EventSink sink = {});

  BatchTransactionService(const BatchTransactionService&) = delete;
  BatchTransactionService& operator=(const BatchTransactionService&) = delete;

  // -------------------------------------------------------------------------
  // applyBatch(type, user_id, items, metadata)
  // -------------------------------------------------------------------------
  // @return transaction id plus one committed log entry per item, in input
  //         order, all carrying the transaction id.
  // @throws InvalidAdjustmentError for an empty or oversized batch or a
  //         marker type; BatchItemError for any per-item failure.
  // -------------------------------------------------------------------------
  domain::BatchResult applyBatch(domain::AdjustmentType type,
                                 domain::UserId user_id,
                                 const std::vector<domain::BatchItem>& items,
                                 const domain::BatchMetadata& metadata = {});

  // -------------------------------------------------------------------------
  // transfer(user_id, product_id, from, to, quantity, metadata)
  // -------------------------------------------------------------------------
  // Moves quantity units between two locations as a two-item TRANSFER
  // batch: -quantity at from, +quantity at to.
  // @throws InvalidAdjustmentError if from == to or quantity <= 0;
  //         otherwise as applyBatch().
  // -------------------------------------------------------------------------
  domain::BatchResult transfer(domain::UserId user_id,
                               domain::ProductId product_id,
                               domain::LocationId from_location,
                               domain::LocationId to_location,
                               domain::Quantity quantity,
                               const domain::BatchMetadata& metadata = {});

 private:
  static ItemOutcome applyItem(LedgerTransaction& tx,
                               std::size_t index,
                               domain::AdjustmentType type,
                               domain::UserId user_id,
                               const domain::BatchItem& item,
                               std::int64_t timestamp_ms);

  // Index of the item a commit-time failure belongs to.
  static std::size_t attributeCommitFailure(
      const LedgerError& error,
      const std::vector<domain::BatchItem>& items);

  void emit(Event event) const;

  ILedgerStore& store_;
  const ITimeProvider& clock_;
  std::size_t max_items_;
  EventSink sink_;
  TransactionIdGenerator id_generator_;
};

}  // namespace ledger
