#include "ledger/service/ledger_queries.hpp"

#include <algorithm>
#include <limits>

namespace ledger {

LedgerQueries::LedgerQueries(const ILedgerStore& store,
                             std::size_t default_page_size,
                             std::size_t max_page_size)
    : store_(store),
      default_page_size_(default_page_size),
      max_page_size_(std::max<std::size_t>(1, max_page_size)) {}

domain::Quantity LedgerQueries::quantity(domain::ProductId product_id,
                                         domain::LocationId location_id) const {
  const auto row = stockLevel(product_id, location_id);
  return row ? row->quantity : 0;
}

std::optional<domain::StockLevel> LedgerQueries::stockLevel(
    domain::ProductId product_id, domain::LocationId location_id) const {
  return store_.findStockLevel(domain::StockKey{product_id, location_id});
}

domain::Quantity LedgerQueries::totalQuantity(
    domain::ProductId product_id) const {
  domain::Quantity total = 0;
  for (const auto& row : store_.stockLevelsForProduct(product_id)) {
    total += row.quantity;
  }
  return total;
}

std::vector<domain::StockLevel> LedgerQueries::stockLevelsForProduct(
    domain::ProductId product_id) const {
  return store_.stockLevelsForProduct(product_id);
}

std::size_t LedgerQueries::clampPageSize(
    std::optional<std::size_t> requested) const {
  const std::size_t size = requested.value_or(default_page_size_);
  return std::clamp<std::size_t>(size, 1, max_page_size_);
}

LogPage LedgerQueries::logEntries(domain::ProductId product_id,
                                  domain::LocationId location_id,
                                  std::size_t page,
                                  std::optional<std::size_t> page_size) const {
  LogFilter filter;
  filter.product_id = product_id;
  filter.location_id = location_id;
  return queryLog(filter, page, page_size);
}

// -----------------------------------------------------------------------------
// queryLog: page numbers are 1-based, offsets are computed here
// -----------------------------------------------------------------------------
LogPage LedgerQueries::queryLog(const LogFilter& filter,
                                std::size_t page,
                                std::optional<std::size_t> page_size) const {
  LogPage result;
  result.page = std::max<std::size_t>(1, page);
  result.page_size = clampPageSize(page_size);

  // Pages past the addressable range are simply past the end.
  const std::size_t max_offset = std::numeric_limits<std::size_t>::max();
  const std::size_t offset =
      (result.page - 1) > max_offset / result.page_size
          ? max_offset
          : (result.page - 1) * result.page_size;

  LogSlice slice = store_.queryLog(filter, offset, result.page_size);
  result.entries = std::move(slice.entries);
  result.total = slice.total;
  result.total_pages =
      (result.total + result.page_size - 1) / result.page_size;
  return result;
}

std::vector<SnapshotLine> LedgerQueries::snapshotAt(
    std::int64_t timestamp_ms,
    std::optional<domain::LocationId> location_id) const {
  std::vector<SnapshotLine> lines;
  for (const auto& [key, quantity] : store_.deltaTotalsAt(timestamp_ms)) {
    if (location_id && key.location_id != *location_id) {
      continue;
    }
    lines.push_back(SnapshotLine{key, quantity});
  }
  return lines;
}

std::vector<LowStockProduct> LedgerQueries::lowStockProducts() const {
  std::vector<LowStockProduct> result;
  for (const auto& product : store_.allProducts()) {
    if (product.archived || product.low_stock_threshold <= 0) {
      continue;
    }
    const domain::Quantity total = totalQuantity(product.id);
    if (total <= product.low_stock_threshold) {
      result.push_back(LowStockProduct{product, total});
    }
  }
  std::sort(result.begin(), result.end(),
            [](const LowStockProduct& a, const LowStockProduct& b) {
              if (a.total_quantity != b.total_quantity) {
                return a.total_quantity < b.total_quantity;
              }
              return a.product.id < b.product.id;
            });
  return result;
}

}  // namespace ledger
