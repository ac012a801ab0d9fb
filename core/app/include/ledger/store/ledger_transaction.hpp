#pragma once

#include "ledger/domain/adjustment_log_entry.hpp"
#include "ledger/domain/batch.hpp"
#include "ledger/domain/catalog.hpp"
#include "ledger/domain/stock_level.hpp"
#include "ledger/store/i_ledger_store.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ledger {

// -----------------------------------------------------------------------------
// LedgerTransaction — all-or-nothing unit of work over an ILedgerStore
// -----------------------------------------------------------------------------
//
// @brief  Stages row writes and log entries in memory and hands them to
//         ILedgerStore::commit() as one ChangeSet.
//
// @details
// Reads go through the unit: readStockLevel() first returns what this unit
// already staged for the key, otherwise fetches the row from the store and
// remembers the version it saw. That remembered version is what the commit
// is conditioned on, so a row that changed underneath us after the first
// read makes the whole unit fail with OptimisticLockError.
//
// Lifecycle (see domain::BatchStatus):
//
//   Open ──commit() ok──────> Committed
//     │
//     ├──commit() throws────> Aborted   (exception propagates)
//     ├──abort()────────────> Aborted
//     └──destructor─────────> Aborted   (nothing is written)
//
// Any staging or commit call on a closed unit throws std::logic_error; that
// is a programming error, not a ledger outcome.
//
// Thread model:
//   Not thread-safe. A unit belongs to the one thread that created it.
//   Concurrency between units is resolved by the store's conditional write.
// -----------------------------------------------------------------------------
class LedgerTransaction {
 public:
  explicit LedgerTransaction(ILedgerStore& store,
                             std::string transaction_id = {});
  ~LedgerTransaction();

  LedgerTransaction(const LedgerTransaction&) = delete;
  LedgerTransaction& operator=(const LedgerTransaction&) = delete;

  domain::BatchStatus status() const { return status_; }
  const std::string& transactionId() const { return transaction_id_; }

  // -------------------------------------------------------------------------
  // readStockLevel(key)
  // -------------------------------------------------------------------------
  // @return The row as this unit sees it, or std::nullopt when the pair has
  //         no row yet (neither in the store nor staged).
  // -------------------------------------------------------------------------
  std::optional<domain::StockLevel> readStockLevel(const domain::StockKey& key);

  // Catalog lookups. require* throw ProductNotFoundError (also for archived
  // products) / LocationNotFoundError.
  std::optional<domain::Product> findProduct(domain::ProductId product_id) const;
  domain::Product requireProduct(domain::ProductId product_id) const;
  domain::Location requireLocation(domain::LocationId location_id) const;

  // -------------------------------------------------------------------------
  // stageStockLevel(next)
  // -------------------------------------------------------------------------
  // Replaces the staged state of next.key(). The key must have been read
  // through readStockLevel() first and next.version must be exactly one
  // above what this unit currently sees for it.
  // -------------------------------------------------------------------------
  void stageStockLevel(const domain::StockLevel& next);

  // Appends a log entry. Its transaction_id is overwritten with this unit's
  // id; its id is assigned by the store on commit.
  void stageLogEntry(domain::AdjustmentLogEntry entry);

  void stageProductFlag(domain::ProductId product_id, bool archived);

  // -------------------------------------------------------------------------
  // commit()
  // -------------------------------------------------------------------------
  // @return The store's receipt. Log entries come back in staging order.
  // @throws Whatever ILedgerStore::commit() throws; the unit is Aborted.
  // -------------------------------------------------------------------------
  CommitReceipt commit();

  // Discards everything staged. No-op on a unit that is already Aborted.
  void abort();

  std::size_t stagedEntryCount() const { return entries_.size(); }

 private:
  struct StagedRow {
    domain::Version read_version{0};
    domain::StockLevel current;
    bool dirty{false};
  };

  void requireOpen(const char* operation) const;

  ILedgerStore& store_;
  std::string transaction_id_;
  domain::BatchStatus status_{domain::BatchStatus::Open};

  std::unordered_map<domain::StockKey, StagedRow, domain::StockKeyHash> rows_;
  std::vector<domain::StockKey> row_order_;  // First-read order
  std::vector<domain::AdjustmentLogEntry> entries_;
  std::vector<ProductFlagWrite> flags_;
};

}  // namespace ledger
