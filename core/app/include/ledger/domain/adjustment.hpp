#pragma once

#include "ledger/domain/adjustment_log_entry.hpp"
#include "ledger/domain/adjustment_type.hpp"
#include "ledger/domain/ids.hpp"

#include <optional>

namespace ledger {
namespace domain {

// -----------------------------------------------------------------------------
// AdjustmentRequest — input to a single adjustment
// -----------------------------------------------------------------------------
//
// @brief  One signed delta against one (product, location) pair.
//
// @details
// expected_version is the optimistic-lock token the caller read earlier
// (e.g. when it rendered a form). When present and different from the
// row's current version, the adjustment fails with OptimisticLockError.
// When absent, the service still guards against lost updates by keying the
// store write on the version it read itself.
// -----------------------------------------------------------------------------
struct AdjustmentRequest {
  UserId user_id{0};
  ProductId product_id{0};
  LocationId location_id{0};
  Quantity delta{0};
  AdjustmentType type{AdjustmentType::Adjustment};
  std::optional<Version> expected_version;
};

// -----------------------------------------------------------------------------
// AdjustmentResult — outcome of a committed single adjustment
// -----------------------------------------------------------------------------
struct AdjustmentResult {
  AdjustmentLogEntry log_entry;  // As committed, with its assigned id
  Version new_version{0};        // Row version after the commit
  Quantity new_quantity{0};      // Row quantity after the commit
};

}  // namespace domain
}  // namespace ledger
