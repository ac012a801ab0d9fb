#include "ledger/service/batch_transaction_service.hpp"

#include <iostream>
#include <optional>
#include <utility>

namespace ledger {

namespace {

// Sorts each ItemOutcome into the applied list or the single failure slot.
struct OutcomeCollector {
  std::vector<ItemApplied>& applied;
  std::optional<ItemFailed>& failure;

  void operator()(const ItemApplied& outcome) const {
    applied.push_back(outcome);
  }
  void operator()(const ItemFailed& outcome) const { failure = outcome; }
};

}  // namespace

BatchTransactionService::BatchTransactionService(ILedgerStore& store,
                                                 const ITimeProvider& clock,
                                                 std::size_t max_items,
                                                 EventSink sink)
    : store_(store),
      clock_(clock),
      max_items_(max_items),
      sink_(std::move(sink)) {}

void BatchTransactionService::emit(Event event) const {
  if (sink_) {
    sink_(std::move(event));
  }
}

// -----------------------------------------------------------------------------
// applyItem: run the single-adjustment core, capture failure as a value
// -----------------------------------------------------------------------------
ItemOutcome BatchTransactionService::applyItem(LedgerTransaction& tx,
                                               std::size_t index,
                                               domain::AdjustmentType type,
                                               domain::UserId user_id,
                                               const domain::BatchItem& item,
                                               std::int64_t timestamp_ms) {
  domain::AdjustmentRequest request;
  request.user_id = user_id;
  request.product_id = item.product_id;
  request.location_id = item.location_id;
  request.delta = item.quantity_change;
  request.type = type;
  request.expected_version = item.expected_version;

  try {
    return ItemApplied{index,
                       AdjustmentService::stageAdjustment(tx, request,
                                                          timestamp_ms)};
  } catch (const LedgerError& e) {
    return ItemFailed{index, e.clone()};
  }
}

std::size_t BatchTransactionService::attributeCommitFailure(
    const LedgerError& error, const std::vector<domain::BatchItem>& items) {
  for (std::size_t i = 0; i < items.size(); ++i) {
    const domain::BatchItem& item = items[i];
    if (const auto* lock = dynamic_cast<const OptimisticLockError*>(&error)) {
      if (item.product_id == lock->productId() &&
          item.location_id == lock->locationId()) {
        return i;
      }
    } else if (const auto* product =
                   dynamic_cast<const ProductNotFoundError*>(&error)) {
      if (item.product_id == product->productId()) {
        return i;
      }
    } else if (const auto* location =
                   dynamic_cast<const LocationNotFoundError*>(&error)) {
      if (item.location_id == location->locationId()) {
        return i;
      }
    }
  }
  return 0;
}

// -----------------------------------------------------------------------------
// applyBatch
// -----------------------------------------------------------------------------
domain::BatchResult BatchTransactionService::applyBatch(
    domain::AdjustmentType type,
    domain::UserId user_id,
    const std::vector<domain::BatchItem>& items,
    const domain::BatchMetadata& metadata) {
  if (items.empty()) {
    throw InvalidAdjustmentError("batch must contain at least one item");
  }
  if (items.size() > max_items_) {
    throw InvalidAdjustmentError("batch of " + std::to_string(items.size()) +
                                 " items exceeds the limit of " +
                                 std::to_string(max_items_));
  }
  if (domain::isMarkerType(type)) {
    throw InvalidAdjustmentError(
        std::string(domain::adjustmentTypeToString(type)) +
        " is an audit marker and cannot be used for a batch");
  }

  const std::int64_t now = clock_.now_ms();
  const std::string transaction_id = id_generator_.next(now);
  LedgerTransaction tx(store_, transaction_id);

  std::vector<ItemApplied> applied;
  applied.reserve(items.size());
  std::optional<ItemFailed> failure;

  for (std::size_t i = 0; i < items.size() && !failure; ++i) {
    std::visit(OutcomeCollector{applied, failure},
               applyItem(tx, i, type, user_id, items[i], now));
  }

  // Rejects the batch: nothing staged reaches the store.
  auto abortWith = [&](std::size_t index,
                       std::shared_ptr<const LedgerError> reason) {
    if (tx.status() == domain::BatchStatus::Open) {
      tx.abort();
    }
    const domain::BatchItem& item = items.at(index);
    std::cerr << "[BatchTransactionService] " << transaction_id
              << " aborted at item #" << (index + 1) << ": " << reason->what()
              << "\n";

    BatchAbortedEvent aborted;
    aborted.transaction_id = transaction_id;
    aborted.reference = metadata.reference;
    aborted.type = type;
    aborted.user_id = user_id;
    aborted.failed_item_index = index;
    aborted.error_kind = errorKindToString(reason->kind());
    aborted.reason = reason->what();
    aborted.timestamp_ms = now;
    emit(std::move(aborted));

    throw BatchItemError(index, item.product_id, item.location_id,
                         std::move(reason));
  };

  if (failure) {
    abortWith(failure->index, failure->reason);
  }

  CommitReceipt receipt;
  try {
    receipt = tx.commit();
  } catch (const LedgerError& e) {
    abortWith(attributeCommitFailure(e, items), e.clone());
  }

  domain::BatchResult result;
  result.transaction_id = transaction_id;
  result.type = type;
  result.user_id = user_id;
  result.metadata = metadata;
  result.log_entries = receipt.log_entries;

  for (std::size_t i = 0; i < applied.size(); ++i) {
    const ItemApplied& item = applied[i];
    const domain::ProductId product_id = items[item.index].product_id;
    bool last_for_product = true;
    for (std::size_t j = i + 1; j < applied.size(); ++j) {
      last_for_product =
          last_for_product && items[applied[j].index].product_id != product_id;
    }
    emit(StockAdjustedEvent{
        receipt.log_entries.at(item.staged.entry_index),
        item.staged.after.quantity, item.staged.after.version,
        last_for_product ? receipt.totalsFor(product_id) : std::nullopt});
  }

  BatchCommittedEvent committed;
  committed.transaction_id = transaction_id;
  committed.reference = metadata.reference;
  committed.type = type;
  committed.user_id = user_id;
  committed.item_count = items.size();
  committed.timestamp_ms = now;
  emit(std::move(committed));

  return result;
}

// -----------------------------------------------------------------------------
// transfer: a two-line TRANSFER batch
// -----------------------------------------------------------------------------
domain::BatchResult BatchTransactionService::transfer(
    domain::UserId user_id,
    domain::ProductId product_id,
    domain::LocationId from_location,
    domain::LocationId to_location,
    domain::Quantity quantity,
    const domain::BatchMetadata& metadata) {
  if (from_location == to_location) {
    throw InvalidAdjustmentError(
        "transfer source and destination must differ");
  }
  if (quantity <= 0) {
    throw InvalidAdjustmentError("transfer quantity must be positive");
  }

  std::vector<domain::BatchItem> items(2);
  items[0].product_id = product_id;
  items[0].location_id = from_location;
  items[0].quantity_change = -quantity;
  items[1].product_id = product_id;
  items[1].location_id = to_location;
  items[1].quantity_change = quantity;

  domain::BatchMetadata transfer_metadata = metadata;
  if (transfer_metadata.reference.empty()) {
    transfer_metadata.reference = "transfer " + std::to_string(from_location) +
                                  "->" + std::to_string(to_location);
  }
  return applyBatch(domain::AdjustmentType::Transfer, user_id, items,
                    transfer_metadata);
}

}  // namespace ledger
