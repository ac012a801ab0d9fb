#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

namespace ledger {
namespace domain {

// -----------------------------------------------------------------------------
// Identifier aliases
// -----------------------------------------------------------------------------
// Responsibility: Names the integer identifiers that flow through the ledger.
// Why strong aliases:
// - Signatures read as adjust(UserId, ProductId, LocationId, ...) rather than
//   a row of anonymous integers.
// - Still plain integers: cheap to copy, hashable, comparable.
// Thread-safety: Value types only.
// -----------------------------------------------------------------------------
using ProductId = std::int64_t;
using LocationId = std::int64_t;
using UserId = std::int64_t;

// Assigned by the store on insert. Strictly increasing in commit order.
using LogEntryId = std::uint64_t;

// Optimistic-lock token carried by every StockLevel row. A row that does
// not exist yet is treated as version 0; the first committed write sets 1.
using Version = std::uint64_t;

// Signed quantity and delta type. Stock counts are whole units.
using Quantity = std::int64_t;

// -----------------------------------------------------------------------------
// StockKey — composite identity of a StockLevel row
// -----------------------------------------------------------------------------
struct StockKey {
  ProductId product_id{0};
  LocationId location_id{0};

  bool operator==(const StockKey& other) const {
    return product_id == other.product_id && location_id == other.location_id;
  }
  bool operator!=(const StockKey& other) const { return !(*this == other); }
  bool operator<(const StockKey& other) const {
    if (product_id != other.product_id) {
      return product_id < other.product_id;
    }
    return location_id < other.location_id;
  }
};

// Hash functor so StockKey can key an unordered_map.
struct StockKeyHash {
  std::size_t operator()(const StockKey& key) const {
    std::size_t h1 = std::hash<ProductId>{}(key.product_id);
    std::size_t h2 = std::hash<LocationId>{}(key.location_id);
    return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
  }
};

}  // namespace domain
}  // namespace ledger
