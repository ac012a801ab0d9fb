#pragma once

#include <optional>
#include <string>

namespace ledger {
namespace domain {

// -----------------------------------------------------------------------------
// AdjustmentType — why a quantity changed
// -----------------------------------------------------------------------------
//
// @brief  Classifies every AdjustmentLogEntry.
//
// @details
// Quantity-bearing types (everything except Archive and Restore) require a
// non-zero delta. Archive and Restore are audit markers written when a
// product is soft-deleted or brought back; they always carry delta 0 and
// never touch StockLevel.quantity.
//
// The string forms are the wire names used in JSON commands and telemetry.
// -----------------------------------------------------------------------------
enum class AdjustmentType {
  Adjustment,     // Manual correction (either sign)
  StockIn,        // Goods received
  Transfer,       // One leg of a location-to-location move
  Sale,           // Order line shipped to a customer
  Deduction,      // Write-off, damage, internal use
  ExternalOrder,  // Order imported from an external shop
  Archive,        // Zero-delta marker: product soft-deleted
  Restore,        // Zero-delta marker: product restored
};

// Returns true for the zero-delta audit marker types.
inline bool isMarkerType(AdjustmentType type) {
  return type == AdjustmentType::Archive || type == AdjustmentType::Restore;
}

inline const char* adjustmentTypeToString(AdjustmentType type) {
  switch (type) {
    case AdjustmentType::Adjustment:    return "ADJUSTMENT";
    case AdjustmentType::StockIn:       return "STOCK_IN";
    case AdjustmentType::Transfer:      return "TRANSFER";
    case AdjustmentType::Sale:          return "SALE";
    case AdjustmentType::Deduction:     return "DEDUCTION";
    case AdjustmentType::ExternalOrder: return "EXTERNAL_ORDER";
    case AdjustmentType::Archive:       return "ARCHIVE";
    case AdjustmentType::Restore:       return "RESTORE";
  }
  return "UNKNOWN";
}

// Parses a wire name. Returns std::nullopt for anything unrecognised.
inline std::optional<AdjustmentType> parseAdjustmentType(
    const std::string& name) {
  if (name == "ADJUSTMENT")     return AdjustmentType::Adjustment;
  if (name == "STOCK_IN")       return AdjustmentType::StockIn;
  if (name == "TRANSFER")       return AdjustmentType::Transfer;
  if (name == "SALE")           return AdjustmentType::Sale;
  if (name == "DEDUCTION")      return AdjustmentType::Deduction;
  if (name == "EXTERNAL_ORDER") return AdjustmentType::ExternalOrder;
  if (name == "ARCHIVE")        return AdjustmentType::Archive;
  if (name == "RESTORE")        return AdjustmentType::Restore;
  return std::nullopt;
}

}  // namespace domain
}  // namespace ledger
