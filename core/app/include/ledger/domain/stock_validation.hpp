#pragma once

#include "ledger/domain/ids.hpp"

#include <optional>
#include <string>

namespace ledger {
namespace domain {

// -----------------------------------------------------------------------------
// StockValidation — result of an advisory availability check
// -----------------------------------------------------------------------------
// shortfall and message are set only when is_valid is false.
// -----------------------------------------------------------------------------
struct StockValidation {
  bool is_valid{false};
  Quantity current_quantity{0};
  Quantity requested_quantity{0};
  std::optional<Quantity> shortfall;
  std::string message;

  bool operator==(const StockValidation& other) const {
    return is_valid == other.is_valid &&
           current_quantity == other.current_quantity &&
           requested_quantity == other.requested_quantity &&
           shortfall == other.shortfall && message == other.message;
  }
};

}  // namespace domain
}  // namespace ledger
