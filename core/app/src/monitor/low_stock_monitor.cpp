#include "ledger/monitor/low_stock_monitor.hpp"

#include <iostream>

namespace ledger {

LowStockMonitor::LowStockMonitor(EventBus& bus,
                                 const ILedgerStore& store,
                                 const ITimeProvider& clock)
    : bus_(bus), store_(store), clock_(clock) {
  subscription_ = bus_.subscribe<StockAdjustedEvent>(
      [this](const StockAdjustedEvent& e) { onStockAdjusted(e); });
}

LowStockMonitor::~LowStockMonitor() { bus_.unsubscribe(subscription_); }

void LowStockMonitor::onStockAdjusted(const StockAdjustedEvent& event) {
  if (!event.product_totals) {
    return;
  }
  const domain::ProductTotals& totals = *event.product_totals;
  if (totals.after >= totals.before) {
    return;
  }

  const auto product = store_.findProduct(totals.product_id);
  if (!product || product->archived || product->low_stock_threshold <= 0) {
    return;
  }
  if (totals.after > product->low_stock_threshold ||
      totals.before <= product->low_stock_threshold) {
    return;
  }

  const domain::Quantity total = totals.after;

  std::cout << "[LowStockMonitor] productId=" << product->id << " ("
            << product->name << ") at " << total << ", threshold "
            << product->low_stock_threshold << "\n";

  alerts_raised_.fetch_add(1);
  bus_.publish(LowStockEvent{product->id, product->name, total,
                             product->low_stock_threshold, clock_.now_ms()});
}

}  // namespace ledger
