#include "ledger/service/catalog_service.hpp"
#include "ledger/errors/ledger_errors.hpp"
#include "ledger/store/ledger_transaction.hpp"

#include <iostream>
#include <utility>

namespace ledger {

CatalogService::CatalogService(ILedgerStore& store,
                               const ITimeProvider& clock,
                               EventSink sink)
    : store_(store), clock_(clock), sink_(std::move(sink)) {}

void CatalogService::upsertProduct(const domain::Product& product) {
  if (product.id <= 0) {
    throw InvalidAdjustmentError("product id must be positive");
  }
  if (product.low_stock_threshold < 0) {
    throw InvalidAdjustmentError("low stock threshold must not be negative");
  }
  store_.upsertProduct(product);
}

void CatalogService::upsertLocation(const domain::Location& location) {
  if (location.id <= 0) {
    throw InvalidAdjustmentError("location id must be positive");
  }
  store_.upsertLocation(location);
}

std::vector<domain::AdjustmentLogEntry> CatalogService::archiveProduct(
    domain::UserId user_id, domain::ProductId product_id) {
  return setArchived(user_id, product_id, true);
}

std::vector<domain::AdjustmentLogEntry> CatalogService::restoreProduct(
    domain::UserId user_id, domain::ProductId product_id) {
  return setArchived(user_id, product_id, false);
}

// -----------------------------------------------------------------------------
// setArchived: flag change plus one marker per stock row, one commit
// -----------------------------------------------------------------------------
std::vector<domain::AdjustmentLogEntry> CatalogService::setArchived(
    domain::UserId user_id, domain::ProductId product_id, bool archived) {
  LedgerTransaction tx(store_);

  const std::optional<domain::Product> product = tx.findProduct(product_id);
  if (!product) {
    throw ProductNotFoundError(product_id);
  }
  if (product->archived == archived) {
    throw InvalidAdjustmentError(
        "productId=" + std::to_string(product_id) +
        (archived ? " is already archived" : " is not archived"));
  }

  const std::int64_t now = clock_.now_ms();
  const domain::AdjustmentType marker = archived
                                            ? domain::AdjustmentType::Archive
                                            : domain::AdjustmentType::Restore;

  for (const domain::StockLevel& row :
       store_.stockLevelsForProduct(product_id)) {
    domain::AdjustmentLogEntry entry;
    entry.product_id = product_id;
    entry.location_id = row.location_id;
    entry.user_id = user_id;
    entry.delta = 0;
    entry.type = marker;
    entry.timestamp_ms = now;
    tx.stageLogEntry(std::move(entry));
  }
  tx.stageProductFlag(product_id, archived);

  CommitReceipt receipt = tx.commit();

  std::cout << "[CatalogService] productId=" << product_id
            << (archived ? " archived" : " restored") << " by userId="
            << user_id << "\n";
  if (sink_) {
    sink_(ProductStatusEvent{product_id, archived, user_id, now});
  }
  return receipt.log_entries;
}

void CatalogService::purgeProduct(domain::ProductId product_id) {
  if (!store_.purgeProduct(product_id)) {
    throw ProductNotFoundError(product_id);
  }
  std::cout << "[CatalogService] productId=" << product_id
            << " purged with its stock rows and history\n";
}

}  // namespace ledger
