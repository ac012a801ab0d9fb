#pragma once

#include "ledger/domain/adjustment_log_entry.hpp"
#include "ledger/domain/adjustment_type.hpp"
#include "ledger/domain/ids.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ledger {
namespace domain {

// -----------------------------------------------------------------------------
// BatchItem — one line of an all-or-nothing batch
// -----------------------------------------------------------------------------
struct BatchItem {
  ProductId product_id{0};
  LocationId location_id{0};
  Quantity quantity_change{0};
  std::optional<Version> expected_version;
};

// -----------------------------------------------------------------------------
// BatchMetadata — caller context attached to a batch
// -----------------------------------------------------------------------------
// reference is the shared identity of the batch (order reference, bulk
// correction name). It is echoed in BatchResult and in telemetry.
// -----------------------------------------------------------------------------
struct BatchMetadata {
  std::string reference;
  std::string notes;
};

// -----------------------------------------------------------------------------
// BatchStatus — lifecycle of one atomic unit
// -----------------------------------------------------------------------------
//
//   Open ───> Committed
//     │
//     └────> Aborted
//
// Committed and Aborted are terminal. Aborted yields zero side effects.
// No partial state between the two is ever visible to other readers.
// -----------------------------------------------------------------------------
enum class BatchStatus {
  Open,
  Committed,
  Aborted,
};

inline const char* batchStatusToString(BatchStatus status) {
  switch (status) {
    case BatchStatus::Open:      return "OPEN";
    case BatchStatus::Committed: return "COMMITTED";
    case BatchStatus::Aborted:   return "ABORTED";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// BatchResult — what a committed batch produced
// -----------------------------------------------------------------------------
struct BatchResult {
  std::string transaction_id;
  AdjustmentType type{AdjustmentType::Adjustment};
  UserId user_id{0};
  BatchMetadata metadata;
  std::vector<AdjustmentLogEntry> log_entries;  // One per item, input order
};

}  // namespace domain
}  // namespace ledger
