#pragma once

#include "ledger/domain/adjustment_type.hpp"
#include "ledger/domain/batch.hpp"
#include "ledger/orders/i_order_source.hpp"
#include "ledger/service/batch_transaction_service.hpp"

#include <string>

namespace ledger {

// -----------------------------------------------------------------------------
// OrderFulfillmentService — ship an order as one all-or-nothing batch
// -----------------------------------------------------------------------------
//
// @brief  Fetches an order from an IOrderSource and deducts every line from
//         the order's pick location in a single batch.
//
// @details
// Each OrderLine{product, quantity} becomes BatchItem{product, location,
// -quantity}. The order reference becomes the batch reference, so the log
// entries of a shipped order can be found again by transaction id and the
// telemetry names the order.
//
// Failures:
//   unknown reference             → OrderNotFoundError
//   order without lines           → InvalidAdjustmentError
//   line quantity <= 0            → InvalidAdjustmentError
//   any line cannot be deducted   → BatchItemError (nothing shipped)
//
// Thread model: same as BatchTransactionService.
// -----------------------------------------------------------------------------
class OrderFulfillmentService {
 public:
  OrderFulfillmentService(BatchTransactionService& batches,
                          const IOrderSource& orders)
      : batches_(batches), orders_(orders) {}

  domain::BatchResult fulfill(
      domain::UserId user_id,
      const std::string& order_reference,
      domain::AdjustmentType type = domain::AdjustmentType::Sale);

 private:
  BatchTransactionService& batches_;
  const IOrderSource& orders_;
};

}  // namespace ledger
