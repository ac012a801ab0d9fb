#pragma once

#include "ledger/domain/ids.hpp"

#include <string>

namespace ledger {
namespace domain {

// -----------------------------------------------------------------------------
// Product / Location — catalog rows referenced by the ledger
// -----------------------------------------------------------------------------
//
// @brief  Minimal catalog entries the ledger needs for referential checks.
//
// @details
// The ledger does not manage product descriptions, prices or variants; it
// only needs to know whether an id refers to something real. An archived
// product still exists (its history stays readable) but rejects new
// adjustments with ProductNotFoundError.
//
// low_stock_threshold of 0 means the product is not monitored by
// LowStockMonitor.
// -----------------------------------------------------------------------------
struct Product {
  ProductId id{0};
  std::string name;
  Quantity low_stock_threshold{0};
  bool archived{false};
};

struct Location {
  LocationId id{0};
  std::string name;
};

}  // namespace domain
}  // namespace ledger
