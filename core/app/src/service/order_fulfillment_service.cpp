#include "ledger/service/order_fulfillment_service.hpp"
#include "ledger/errors/ledger_errors.hpp"

#include <vector>

namespace ledger {

domain::BatchResult OrderFulfillmentService::fulfill(
    domain::UserId user_id,
    const std::string& order_reference,
    domain::AdjustmentType type) {
  const std::optional<domain::Order> order =
      orders_.findOrder(order_reference);
  if (!order) {
    throw OrderNotFoundError(order_reference);
  }
  if (order->lines.empty()) {
    throw InvalidAdjustmentError("order '" + order_reference +
                                 "' has no lines");
  }

  std::vector<domain::BatchItem> items;
  items.reserve(order->lines.size());
  for (const domain::OrderLine& line : order->lines) {
    if (line.quantity <= 0) {
      throw InvalidAdjustmentError(
          "order '" + order_reference + "' has a non-positive quantity for "
          "productId=" + std::to_string(line.product_id));
    }
    domain::BatchItem item;
    item.product_id = line.product_id;
    item.location_id = order->location_id;
    item.quantity_change = -line.quantity;
    items.push_back(item);
  }

  domain::BatchMetadata metadata;
  metadata.reference = order->reference;
  metadata.notes = "order fulfillment";
  return batches_.applyBatch(type, user_id, items, metadata);
}

}  // namespace ledger
