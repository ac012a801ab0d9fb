#pragma once

#include "ledger/eventbus/event_bus.hpp"
#include "ledger/events/ledger_events.hpp"
#include "ledger/store/i_ledger_store.hpp"
#include "ledger/time/i_time_provider.hpp"

#include <atomic>
#include <cstddef>

namespace ledger {

// -----------------------------------------------------------------------------
// LowStockMonitor — threshold crossing detector
// -----------------------------------------------------------------------------
//
// @brief  Watches committed adjustments on the notification loop and
//         publishes a LowStockEvent when a monitored product's total stock
//         drops to or below its low_stock_threshold.
//
// @details
// Only events carrying product_totals are considered, i.e. one per product
// per commit. The alert fires on the crossing: the total before the commit
// was above the threshold and the total after it is at or below it. A
// product that stays low does not re-alert on every sale; it alerts again
// after it was restocked above the threshold and crosses down once more.
//
// Both totals come from the commit itself, so a transfer between locations
// (net change 0) never alerts, and commits that land before the event is
// delivered do not change the verdict.
//
// Thread model:
//   Lives on the notification EventLoopThread. onStockAdjusted() runs only
//   there; it reads the store (shared lock) and publishes back on the same
//   bus, which EventBus allows.
//
// Ownership:
//   Owned by LedgerEngine via std::unique_ptr. Unsubscribes in its
//   destructor, so it must be destroyed before the bus.
// -----------------------------------------------------------------------------
class LowStockMonitor {
 public:
  LowStockMonitor(EventBus& bus,
                  const ILedgerStore& store,
                  const ITimeProvider& clock);
  ~LowStockMonitor();

  LowStockMonitor(const LowStockMonitor&) = delete;
  LowStockMonitor& operator=(const LowStockMonitor&) = delete;

  // Number of LowStockEvents published so far.
  std::size_t alertsRaised() const { return alerts_raised_.load(); }

 private:
  void onStockAdjusted(const StockAdjustedEvent& event);

  EventBus& bus_;
  const ILedgerStore& store_;
  const ITimeProvider& clock_;
  EventBus::SubscriptionId subscription_{0};
  std::atomic<std::size_t> alerts_raised_{0};
};

}  // namespace ledger
