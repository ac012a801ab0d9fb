#pragma once

#include "ledger/domain/adjustment_type.hpp"
#include "ledger/domain/ids.hpp"

#include <cstdint>
#include <string>

namespace ledger {
namespace domain {

// -----------------------------------------------------------------------------
// AdjustmentLogEntry — one immutable line of the audit trail
// -----------------------------------------------------------------------------
//
// @brief  Records who changed what, when, by how much and why.
//
// @details
// Written exactly once per successful adjustment, in the same atomic commit
// as the StockLevel change it justifies. Never updated afterwards; the only
// way an entry disappears is a product purge, which cascades.
//
// For every (product_id, location_id):
//   sum(delta of all entries) == StockLevel.quantity
// ReconciliationAuditor checks exactly this.
//
// transaction_id is empty for single adjustments and holds the batch id for
// entries produced by BatchTransactionService, so a batch can be found again
// after the fact.
// -----------------------------------------------------------------------------
struct AdjustmentLogEntry {
  LogEntryId id{0};               // Assigned by the store on commit
  ProductId product_id{0};
  LocationId location_id{0};
  UserId user_id{0};
  Quantity delta{0};              // Signed; 0 only for marker types
  AdjustmentType type{AdjustmentType::Adjustment};
  std::int64_t timestamp_ms{0};   // From the engine's ITimeProvider
  std::string transaction_id;     // Batch id, empty for single adjustments
};

}  // namespace domain
}  // namespace ledger
