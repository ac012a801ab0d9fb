#pragma once

#include "ledger/audit/reconciliation_auditor.hpp"
#include "ledger/domain/adjustment.hpp"
#include "ledger/domain/adjustment_log_entry.hpp"
#include "ledger/domain/batch.hpp"
#include "ledger/domain/stock_level.hpp"
#include "ledger/domain/stock_validation.hpp"
#include "ledger/errors/ledger_errors.hpp"
#include "ledger/events/event.hpp"
#include "ledger/service/ledger_queries.hpp"
#include "ledger/store/i_ledger_store.hpp"

#include <nlohmann/json.hpp>

#include <vector>

namespace ledger {
namespace wire {

// -----------------------------------------------------------------------------
// JSON wire format shared by the IPC command channel and telemetry
// -----------------------------------------------------------------------------
// Field names are snake_case. Enums travel as their wire names
// ("STOCK_IN", "OPTIMISTIC_LOCK_ERROR"). Timestamps are epoch milliseconds.
//
// Parsers throw nlohmann::json::exception for missing or mistyped fields
// and InvalidAdjustmentError for values the ledger cannot accept (unknown
// adjustment type). LedgerEngine maps both to a VALIDATION_ERROR reply.
// -----------------------------------------------------------------------------

nlohmann::json toJson(const domain::AdjustmentLogEntry& entry);
nlohmann::json toJson(const domain::StockLevel& row);
nlohmann::json toJson(const domain::AdjustmentResult& result);
nlohmann::json toJson(const domain::BatchResult& result);
nlohmann::json toJson(const domain::StockValidation& validation);
nlohmann::json toJson(const LogPage& page);
nlohmann::json toJson(const ReconciliationReport& report);
nlohmann::json toJson(const std::vector<SnapshotLine>& snapshot);
nlohmann::json toJson(const std::vector<LowStockProduct>& products);

// -----------------------------------------------------------------------------
// errorToJson(error)
// -----------------------------------------------------------------------------
// {"kind", "message", "http_status"} plus the structured fields of the
// concrete error:
//   OPTIMISTIC_LOCK_ERROR → current_version, expected_version
//   INSUFFICIENT_STOCK    → current, requested, shortfall
//   NOT_FOUND             → entity
//   BATCH_ITEM_ERROR      → item_index, product_id, location_id, cause{...}
// -----------------------------------------------------------------------------
nlohmann::json errorToJson(const LedgerError& error);

// Telemetry message for one notification event, with a "type" field.
nlohmann::json eventToJson(const Event& event);

domain::AdjustmentType adjustmentTypeFromJson(const nlohmann::json& value);
domain::AdjustmentRequest adjustmentRequestFromJson(const nlohmann::json& j);
domain::BatchItem batchItemFromJson(const nlohmann::json& j);
domain::BatchMetadata batchMetadataFromJson(const nlohmann::json& j);
LogFilter logFilterFromJson(const nlohmann::json& j);

}  // namespace wire
}  // namespace ledger
