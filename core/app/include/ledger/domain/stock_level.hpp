#pragma once

#include "ledger/domain/ids.hpp"

namespace ledger {
namespace domain {

// -----------------------------------------------------------------------------
// StockLevel — on-hand quantity for one (product, location) pair
// -----------------------------------------------------------------------------
//
// @brief  One row of the stock ledger. The single source of truth for how
//         much of a product sits at a location.
//
// @details
// Invariants (enforced by the adjustment engine, never by callers):
//   - quantity >= 0 after every committed adjustment.
//   - version increases by exactly 1 per successful mutation of the row and
//     is the token for the store's conditional write.
//
// Lifecycle:
//   Created lazily on the first stock-in for the pair with
//   quantity = delta and version = 1. Deleted only when the owning product
//   is purged.
//
// Thread model:
//   Plain value type. The authoritative copy lives inside the store; every
//   accessor hands out copies, so a StockLevel held by a caller is a
//   snapshot and may be stale by the time it is used.
// -----------------------------------------------------------------------------
struct StockLevel {
  ProductId product_id{0};
  LocationId location_id{0};
  Quantity quantity{0};
  Version version{0};

  StockKey key() const { return StockKey{product_id, location_id}; }
};

// A product's total over every location, just before and just after one
// commit. Both sides are read under the same store lock as the write, so
// later commits never leak into them.
struct ProductTotals {
  ProductId product_id{0};
  Quantity before{0};
  Quantity after{0};
};

}  // namespace domain
}  // namespace ledger
