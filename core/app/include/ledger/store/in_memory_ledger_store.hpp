#pragma once

#include "ledger/store/i_ledger_store.hpp"

#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace ledger {

// -----------------------------------------------------------------------------
// InMemoryLedgerStore — process-local implementation of ILedgerStore
// -----------------------------------------------------------------------------
//
// @brief  Keeps stock rows, the append-only adjustment log and the catalog
//         in memory behind one std::shared_mutex.
//
// @details
// Locking:
//   Readers take a shared_lock and copy out what they need. commit(),
//   upsert*() and purgeProduct() take a unique_lock. commit() validates the
//   whole ChangeSet before it mutates anything, so an exception thrown from
//   the validation phase leaves the store untouched.
//
// Log ids:
//   next_log_id_ starts at 1 and is advanced only inside commit() under the
//   unique lock, so ids are strictly increasing in commit order and no two
//   entries ever share one.
//
// Ownership:
//   Owned by LedgerEngine via std::unique_ptr<ILedgerStore>, or directly by
//   tests. Services hold an ILedgerStore& and must not outlive it.
//
// Thread model:
//   Every public method is safe from any thread.
// -----------------------------------------------------------------------------
class InMemoryLedgerStore : public ILedgerStore {
 public:
  InMemoryLedgerStore() = default;

  InMemoryLedgerStore(const InMemoryLedgerStore&) = delete;
  InMemoryLedgerStore& operator=(const InMemoryLedgerStore&) = delete;

  std::optional<domain::StockLevel> findStockLevel(
      const domain::StockKey& key) const override;
  std::vector<domain::StockLevel> stockLevelsForProduct(
      domain::ProductId product_id) const override;
  std::vector<domain::StockLevel> allStockLevels() const override;

  std::optional<domain::Product> findProduct(
      domain::ProductId product_id) const override;
  std::optional<domain::Location> findLocation(
      domain::LocationId location_id) const override;
  std::vector<domain::Product> allProducts() const override;

  void upsertProduct(const domain::Product& product) override;
  void upsertLocation(const domain::Location& location) override;
  bool purgeProduct(domain::ProductId product_id) override;

  CommitReceipt commit(const ChangeSet& changes) override;

  LogSlice queryLog(const LogFilter& filter,
                    std::size_t offset,
                    std::size_t limit) const override;
  std::map<domain::StockKey, domain::Quantity> deltaTotalsAt(
      std::int64_t at_ms) const override;
  AuditView auditView() const override;

  // Number of log entries currently stored. Test and status helper.
  std::size_t logSize() const;

 private:
  // -------------------------------------------------------------------------
  // validateLocked(changes)
  // -------------------------------------------------------------------------
  // Runs every commit precondition against the current state. Throws the
  // first violation. Caller holds the unique lock.
  // -------------------------------------------------------------------------
  void validateLocked(const ChangeSet& changes) const;

  // Current total of every product the ChangeSet writes, before == after.
  std::vector<domain::ProductTotals> totalsBeforeLocked(
      const ChangeSet& changes) const;

  // Every stored row of flag.product_id needs its ARCHIVE/RESTORE marker in
  // changes. Otherwise OptimisticLockError for the uncovered row.
  void requireMarkerPerRowLocked(const ChangeSet& changes,
                                 const ProductFlagWrite& flag) const;

  void requireLiveProductLocked(domain::ProductId product_id) const;
  void requireLocationLocked(domain::LocationId location_id) const;

  mutable std::shared_mutex mutex_;

  std::unordered_map<domain::StockKey, domain::StockLevel, domain::StockKeyHash>
      rows_;
  std::vector<domain::AdjustmentLogEntry> log_;  // Append-only, id order
  std::unordered_map<domain::ProductId, domain::Product> products_;
  std::unordered_map<domain::LocationId, domain::Location> locations_;
  domain::LogEntryId next_log_id_{1};
};

}  // namespace ledger
