#pragma once

#include "ledger/domain/adjustment_log_entry.hpp"
#include "ledger/domain/catalog.hpp"
#include "ledger/domain/ids.hpp"
#include "ledger/domain/stock_level.hpp"
#include "ledger/store/i_ledger_store.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace ledger {

// One page of the audit trail. page is 1-based.
struct LogPage {
  std::vector<domain::AdjustmentLogEntry> entries;
  std::size_t page{1};
  std::size_t page_size{0};
  std::size_t total{0};
  std::size_t total_pages{0};
};

// Quantity of one pair reconstructed from the log at a point in time.
struct SnapshotLine {
  domain::StockKey key;
  domain::Quantity quantity{0};
};

// A monitored product at or below its threshold.
struct LowStockProduct {
  domain::Product product;
  domain::Quantity total_quantity{0};
};

// -----------------------------------------------------------------------------
// LedgerQueries — read side of the ledger
// -----------------------------------------------------------------------------
//
// @brief  Pure queries for the collaborator layer: current quantities,
//         paginated history, point-in-time snapshots and low-stock lists.
//
// @details
// Current quantities always come from StockLevel rows, never from summing
// the log. snapshotAt() is the one query that reads the log for quantities,
// because history is all it can use.
//
// Paging: page < 1 is treated as 1. page_size defaults to the configured
// default and is clamped to [1, max_page_size].
//
// Thread model: const and stateless apart from the store; any thread.
// -----------------------------------------------------------------------------
class LedgerQueries {
 public:
  LedgerQueries(const ILedgerStore& store,
                std::size_t default_page_size,
                std::size_t max_page_size);

  // 0 when the pair has no row.
  domain::Quantity quantity(domain::ProductId product_id,
                            domain::LocationId location_id) const;

  std::optional<domain::StockLevel> stockLevel(
      domain::ProductId product_id, domain::LocationId location_id) const;

  // Sum over every location.
  domain::Quantity totalQuantity(domain::ProductId product_id) const;

  std::vector<domain::StockLevel> stockLevelsForProduct(
      domain::ProductId product_id) const;

  // History of one pair, newest first.
  LogPage logEntries(domain::ProductId product_id,
                     domain::LocationId location_id,
                     std::size_t page = 1,
                     std::optional<std::size_t> page_size = std::nullopt) const;

  LogPage queryLog(const LogFilter& filter,
                   std::size_t page = 1,
                   std::optional<std::size_t> page_size = std::nullopt) const;

  // -------------------------------------------------------------------------
  // snapshotAt(timestamp_ms, location_id)
  // -------------------------------------------------------------------------
  // Per-pair sum of deltas over entries stamped at or before timestamp_ms,
  // optionally restricted to one location. Ordered by (product, location).
  // -------------------------------------------------------------------------
  std::vector<SnapshotLine> snapshotAt(
      std::int64_t timestamp_ms,
      std::optional<domain::LocationId> location_id = std::nullopt) const;

  // Live products with threshold > 0 and total <= threshold, lowest stock
  // first (ties by product id).
  std::vector<LowStockProduct> lowStockProducts() const;

 private:
  std::size_t clampPageSize(std::optional<std::size_t> requested) const;

  const ILedgerStore& store_;
  std::size_t default_page_size_;
  std::size_t max_page_size_;
};

}  // namespace ledger
