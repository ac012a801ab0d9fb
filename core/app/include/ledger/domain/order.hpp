#pragma once

#include "ledger/domain/ids.hpp"

#include <string>
#include <vector>

namespace ledger {
namespace domain {

// -----------------------------------------------------------------------------
// OrderLine / Order — customer order as seen by the ledger
// -----------------------------------------------------------------------------
// Responsibility: Describes what must leave the shelf when an order ships.
// The ledger does not own orders; an IOrderSource hands them over by
// reference and OrderFulfillmentService turns the lines into one batch.
//
// Why a plain struct:
// - Value semantics: safe to copy out of the order source and across
//   threads.
// - No behaviour: pricing, customer data and shipping status belong to the
//   order system, not to the ledger.
//
// quantity is the positive number of units ordered. The fulfillment service
// negates it when building batch items.
// -----------------------------------------------------------------------------
struct OrderLine {
  ProductId product_id{0};
  Quantity quantity{0};
};

struct Order {
  std::string reference;          // External order reference, e.g. "WC-1042"
  LocationId location_id{0};      // Where the goods are picked from
  std::vector<OrderLine> lines;
};

}  // namespace domain
}  // namespace ledger
