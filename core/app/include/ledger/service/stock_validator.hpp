#pragma once

#include "ledger/domain/ids.hpp"
#include "ledger/domain/stock_validation.hpp"
#include "ledger/store/i_ledger_store.hpp"

namespace ledger {

// -----------------------------------------------------------------------------
// StockValidator — advisory availability check
// -----------------------------------------------------------------------------
//
// @brief  Answers "could I take required units from this location right
//         now?" without changing anything.
//
// @details
// Used by callers to pre-check a form before submitting it. The answer is a
// point-in-time read: a concurrent adjustment may change it before the
// caller acts, which is why AdjustmentService re-checks inside its own
// atomic unit and never relies on this result.
//
// A pair with no StockLevel row counts as 0 on hand.
//
// Thread model: stateless apart from the store reference; any thread.
// -----------------------------------------------------------------------------
class StockValidator {
 public:
  explicit StockValidator(const ILedgerStore& store) : store_(store) {}

  // -------------------------------------------------------------------------
  // validate(product_id, location_id, required)
  // -------------------------------------------------------------------------
  // @param  required  Units the caller wants to remove. Must be >= 0.
  // @return is_valid = current >= required. When invalid, shortfall and a
  //         human-readable message are filled in.
  // @throws InvalidAdjustmentError if required is negative.
  // -------------------------------------------------------------------------
  domain::StockValidation validate(domain::ProductId product_id,
                                   domain::LocationId location_id,
                                   domain::Quantity required) const;

 private:
  const ILedgerStore& store_;
};

}  // namespace ledger
