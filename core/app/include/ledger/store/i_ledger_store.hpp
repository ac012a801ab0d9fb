#pragma once

#include "ledger/domain/adjustment_log_entry.hpp"
#include "ledger/domain/adjustment_type.hpp"
#include "ledger/domain/catalog.hpp"
#include "ledger/domain/ids.hpp"
#include "ledger/domain/stock_level.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace ledger {

// -----------------------------------------------------------------------------
// RowWrite — one conditional StockLevel write inside a ChangeSet
// -----------------------------------------------------------------------------
// read_version is the version the writer observed. 0 means "the row did not
// exist when I looked", so the commit must fail if someone created it in the
// meantime.
// -----------------------------------------------------------------------------
struct RowWrite {
  domain::StockKey key;
  domain::Version read_version{0};
  domain::Quantity new_quantity{0};
  domain::Version new_version{0};
};

// Archive flag change applied in the same commit as its marker entries.
struct ProductFlagWrite {
  domain::ProductId product_id{0};
  bool archived{false};
};

// -----------------------------------------------------------------------------
// ChangeSet — everything one atomic unit wants to persist
// -----------------------------------------------------------------------------
// At most one RowWrite per key. log_entries ids are ignored and assigned by
// the store in vector order.
// -----------------------------------------------------------------------------
struct ChangeSet {
  std::vector<RowWrite> row_writes;
  std::vector<domain::AdjustmentLogEntry> log_entries;
  std::vector<ProductFlagWrite> product_flags;

  bool empty() const {
    return row_writes.empty() && log_entries.empty() && product_flags.empty();
  }
};

// What the store actually persisted, with assigned log ids. product_totals
// has one entry per product touched by a RowWrite, in first-write order.
struct CommitReceipt {
  std::vector<domain::AdjustmentLogEntry> log_entries;
  std::vector<domain::StockLevel> rows;
  std::vector<domain::ProductTotals> product_totals;

  std::optional<domain::ProductTotals> totalsFor(
      domain::ProductId product_id) const {
    for (const domain::ProductTotals& totals : product_totals) {
      if (totals.product_id == product_id) {
        return totals;
      }
    }
    return std::nullopt;
  }
};

// -----------------------------------------------------------------------------
// LogFilter — optional predicates for audit-trail queries
// -----------------------------------------------------------------------------
// Unset fields match everything. start_ms / end_ms are inclusive bounds on
// AdjustmentLogEntry::timestamp_ms.
// -----------------------------------------------------------------------------
struct LogFilter {
  std::optional<domain::ProductId> product_id;
  std::optional<domain::LocationId> location_id;
  std::optional<domain::UserId> user_id;
  std::optional<domain::AdjustmentType> type;
  std::optional<std::int64_t> start_ms;
  std::optional<std::int64_t> end_ms;

  bool matches(const domain::AdjustmentLogEntry& entry) const {
    if (product_id && entry.product_id != *product_id) return false;
    if (location_id && entry.location_id != *location_id) return false;
    if (user_id && entry.user_id != *user_id) return false;
    if (type && entry.type != *type) return false;
    if (start_ms && entry.timestamp_ms < *start_ms) return false;
    if (end_ms && entry.timestamp_ms > *end_ms) return false;
    return true;
  }
};

// Matching entries for one page, newest first, plus the overall match count.
struct LogSlice {
  std::vector<domain::AdjustmentLogEntry> entries;
  std::size_t total{0};
};

// Rows and per-pair delta sums captured under one read lock.
struct AuditView {
  std::vector<domain::StockLevel> rows;
  std::map<domain::StockKey, domain::Quantity> log_totals;
};

// -----------------------------------------------------------------------------
// ILedgerStore — persistence seam of the ledger
// -----------------------------------------------------------------------------
//
// @brief  Abstract interface over the rows, the audit trail and the minimal
//         catalog the ledger needs for referential checks.
//
// @details
// The single write path for stock is commit(ChangeSet). It is atomic:
//   1. Every RowWrite's read_version is compared with the stored version
//      (absent row = 0). Any mismatch throws OptimisticLockError.
//   2. Every referenced product must exist and not be archived, every
//      referenced location must exist. Otherwise ProductNotFoundError /
//      LocationNotFoundError.
//   3. A ProductFlagWrite must come with one ARCHIVE/RESTORE marker per
//      stored row of that product. A row the writer did not see throws
//      OptimisticLockError (read version 0).
//   4. Only when every check passed are rows written and log entries
//      appended. A failed commit leaves no trace.
//
// Readers always receive copies. A reader never observes the rows of a
// commit without its log entries or vice versa.
//
// Implementations:
//   InMemoryLedgerStore — std::shared_mutex guarded maps. Used by the
//   engine and by every test.
//
// Thread model:
//   Every method is safe to call concurrently from any thread.
// -----------------------------------------------------------------------------
class ILedgerStore {
 public:
  virtual ~ILedgerStore() = default;

  // --- Stock rows -----------------------------------------------------------
  virtual std::optional<domain::StockLevel> findStockLevel(
      const domain::StockKey& key) const = 0;
  virtual std::vector<domain::StockLevel> stockLevelsForProduct(
      domain::ProductId product_id) const = 0;
  virtual std::vector<domain::StockLevel> allStockLevels() const = 0;

  // --- Catalog --------------------------------------------------------------
  virtual std::optional<domain::Product> findProduct(
      domain::ProductId product_id) const = 0;
  virtual std::optional<domain::Location> findLocation(
      domain::LocationId location_id) const = 0;
  virtual std::vector<domain::Product> allProducts() const = 0;

  // Inserts or replaces. Replacing keeps the stored archived flag.
  virtual void upsertProduct(const domain::Product& product) = 0;
  virtual void upsertLocation(const domain::Location& location) = 0;

  // Hard delete of a product together with its rows and log entries.
  // Returns false if the product did not exist.
  virtual bool purgeProduct(domain::ProductId product_id) = 0;

  // --- Atomic write path ----------------------------------------------------
  virtual CommitReceipt commit(const ChangeSet& changes) = 0;

  // --- Audit trail ----------------------------------------------------------

  // Entries matching filter, ordered newest first (timestamp desc, then id
  // desc), skipping offset and returning at most limit.
  virtual LogSlice queryLog(const LogFilter& filter,
                            std::size_t offset,
                            std::size_t limit) const = 0;

  // Sum of deltas per pair over entries with timestamp_ms <= at_ms.
  virtual std::map<domain::StockKey, domain::Quantity> deltaTotalsAt(
      std::int64_t at_ms) const = 0;

  virtual AuditView auditView() const = 0;
};

}  // namespace ledger
