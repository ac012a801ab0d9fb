#include "ledger/service/stock_validator.hpp"
#include "ledger/errors/ledger_errors.hpp"

#include <string>

namespace ledger {

domain::StockValidation StockValidator::validate(
    domain::ProductId product_id,
    domain::LocationId location_id,
    domain::Quantity required) const {
  if (required < 0) {
    throw InvalidAdjustmentError("required quantity must not be negative");
  }

  domain::StockValidation result;
  const auto row =
      store_.findStockLevel(domain::StockKey{product_id, location_id});
  result.current_quantity = row ? row->quantity : 0;
  result.requested_quantity = required;
  result.is_valid = result.current_quantity >= required;

  if (!result.is_valid) {
    result.shortfall = required - result.current_quantity;
    result.message = "Insufficient stock. Available: " +
                     std::to_string(result.current_quantity) +
                     ", Required: " + std::to_string(required);
  }
  return result;
}

}  // namespace ledger
