#include "ledger/service/adjustment_service.hpp"
#include "ledger/errors/ledger_errors.hpp"

#include <limits>
#include <utility>

namespace ledger {

AdjustmentService::AdjustmentService(ILedgerStore& store,
                                     const ITimeProvider& clock,
                                     EventSink sink)
    : store_(store), clock_(clock), sink_(std::move(sink)) {}

// -----------------------------------------------------------------------------
// stageAdjustment: validate everything first, stage only at the end
// -----------------------------------------------------------------------------
StagedAdjustment AdjustmentService::stageAdjustment(
    LedgerTransaction& tx,
    const domain::AdjustmentRequest& request,
    std::int64_t timestamp_ms) {
  if (domain::isMarkerType(request.type)) {
    throw InvalidAdjustmentError(
        std::string(domain::adjustmentTypeToString(request.type)) +
        " is an audit marker and cannot change quantities");
  }
  if (request.delta == 0) {
    throw InvalidAdjustmentError("delta must not be zero");
  }
  if (request.delta == std::numeric_limits<domain::Quantity>::min()) {
    throw InvalidAdjustmentError("delta is out of range");
  }

  tx.requireProduct(request.product_id);
  tx.requireLocation(request.location_id);

  const domain::StockKey key{request.product_id, request.location_id};
  const std::optional<domain::StockLevel> row = tx.readStockLevel(key);

  domain::StockLevel next;
  next.product_id = request.product_id;
  next.location_id = request.location_id;

  if (!row) {
    if (request.delta < 0) {
      throw InsufficientStockError(request.product_id, request.location_id, 0,
                                   -request.delta);
    }
    if (request.expected_version && *request.expected_version != 0) {
      throw OptimisticLockError(request.product_id, request.location_id, 0,
                                *request.expected_version);
    }
    next.quantity = request.delta;
    next.version = 1;
  } else {
    if (request.expected_version &&
        *request.expected_version != row->version) {
      throw OptimisticLockError(request.product_id, request.location_id,
                                row->version, *request.expected_version);
    }
    if (request.delta > 0 &&
        row->quantity > std::numeric_limits<domain::Quantity>::max() -
                            request.delta) {
      throw InvalidAdjustmentError("adjustment would overflow the quantity");
    }
    next.quantity = row->quantity + request.delta;
    if (next.quantity < 0) {
      throw InsufficientStockError(request.product_id, request.location_id,
                                   row->quantity, -request.delta);
    }
    next.version = row->version + 1;
  }

  domain::AdjustmentLogEntry entry;
  entry.product_id = request.product_id;
  entry.location_id = request.location_id;
  entry.user_id = request.user_id;
  entry.delta = request.delta;
  entry.type = request.type;
  entry.timestamp_ms = timestamp_ms;

  StagedAdjustment staged;
  staged.after = next;
  staged.entry_index = tx.stagedEntryCount();

  tx.stageStockLevel(next);
  tx.stageLogEntry(std::move(entry));
  return staged;
}

// -----------------------------------------------------------------------------
// adjust: one request, one unit, one commit
// -----------------------------------------------------------------------------
domain::AdjustmentResult AdjustmentService::adjust(
    const domain::AdjustmentRequest& request) {
  LedgerTransaction tx(store_);
  const StagedAdjustment staged =
      stageAdjustment(tx, request, clock_.now_ms());
  CommitReceipt receipt = tx.commit();

  domain::AdjustmentResult result;
  result.log_entry = receipt.log_entries.at(staged.entry_index);
  result.new_version = staged.after.version;
  result.new_quantity = staged.after.quantity;

  if (sink_) {
    sink_(StockAdjustedEvent{result.log_entry, result.new_quantity,
                             result.new_version,
                             receipt.totalsFor(request.product_id)});
  }
  return result;
}

}  // namespace ledger
