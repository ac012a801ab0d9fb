// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for ledger::EventBus.
//
// Validates:
//   - Generic subscription receives every ledger event type
//   - Typed subscription receives only its own type
//   - Unsubscribe stops delivery; unknown ids are harmless
//   - Re-entrant publish from a callback does not deadlock
//   - A throwing subscriber does not starve the others
//
// Design note: all tests are single-threaded. Cross-thread delivery is
// covered in event_loop_thread_test.cpp.
// =============================================================================

#include "ledger/eventbus/event_bus.hpp"
#include "ledger/events/event.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

class EventBusTest : public ::testing::Test {
 protected:
  ledger::EventBus bus;

  static ledger::StockAdjustedEvent makeAdjusted(
      ledger::domain::ProductId product, ledger::domain::Quantity quantity) {
    ledger::StockAdjustedEvent e;
    e.entry.product_id = product;
    e.entry.location_id = 1;
    e.entry.delta = -1;
    e.new_quantity = quantity;
    e.new_version = 2;
    return e;
  }

  static ledger::BatchCommittedEvent makeCommitted(const std::string& txn) {
    ledger::BatchCommittedEvent e;
    e.transaction_id = txn;
    e.item_count = 2;
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber sees every event type.
// Why: The telemetry bridge subscribes generically; a skipped type would
//      silently vanish from the PUB stream.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int call_count = 0;
  bus.subscribe([&call_count](const ledger::Event&) { ++call_count; });

  bus.publish(makeAdjusted(7, 9));
  bus.publish(makeCommitted("txn_1_1"));
  bus.publish(ledger::LowStockEvent{7, "Widget", 2, 5, 0});
  bus.publish(ledger::ProductStatusEvent{7, true, 1, 0});
  bus.publish(ledger::BatchAbortedEvent{});

  EXPECT_EQ(call_count, 5);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber fires only for its type.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersCorrectly) {
  int adjusted = 0;
  bus.subscribe<ledger::StockAdjustedEvent>(
      [&adjusted](const ledger::StockAdjustedEvent&) { ++adjusted; });

  bus.publish(makeAdjusted(7, 9));
  bus.publish(makeCommitted("txn_1_1"));

  EXPECT_EQ(adjusted, 1);
}

// -----------------------------------------------------------------------------
// 3. After unsubscribe(id), the callback no longer fires.
// Why: LowStockMonitor unsubscribes in its destructor; a late callback would
//      touch a destroyed object.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int call_count = 0;
  auto id = bus.subscribe<ledger::StockAdjustedEvent>(
      [&call_count](const ledger::StockAdjustedEvent&) { ++call_count; });
  EXPECT_EQ(bus.subscriberCount(), 1u);

  bus.publish(makeAdjusted(7, 9));
  bus.unsubscribe(id);
  bus.publish(makeAdjusted(7, 8));

  EXPECT_EQ(call_count, 1);
  EXPECT_EQ(bus.subscriberCount(), 0u);
}

// -----------------------------------------------------------------------------
// 4. Unknown ids and empty buses are harmless.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, EdgeCasesAreNoOps) {
  EXPECT_NO_FATAL_FAILURE(bus.unsubscribe(9999));
  EXPECT_NO_FATAL_FAILURE(bus.publish(makeAdjusted(7, 9)));
}

// -----------------------------------------------------------------------------
// 5. A callback may publish: the low-stock monitor does exactly this.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  int alerts = 0;
  bus.subscribe<ledger::LowStockEvent>(
      [&alerts](const ledger::LowStockEvent&) { ++alerts; });
  bus.subscribe<ledger::StockAdjustedEvent>(
      [this](const ledger::StockAdjustedEvent& e) {
        if (e.new_quantity < 5) {
          bus.publish(ledger::LowStockEvent{e.entry.product_id, "Widget",
                                            e.new_quantity, 5, 0});
        }
      });

  bus.publish(makeAdjusted(7, 9));
  bus.publish(makeAdjusted(7, 3));

  EXPECT_EQ(alerts, 1);
}

// -----------------------------------------------------------------------------
// 6. A throwing subscriber is logged and skipped; later ones still run.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, ThrowingSubscriberDoesNotBlockOthers) {
  int delivered = 0;
  bus.subscribe([](const ledger::Event&) {
    throw std::runtime_error("subscriber failure");
  });
  bus.subscribe([&delivered](const ledger::Event&) { ++delivered; });

  EXPECT_NO_THROW(bus.publish(makeCommitted("txn_1_1")));
  EXPECT_EQ(delivered, 1);
}

// -----------------------------------------------------------------------------
// 7. Payloads survive the variant dispatch unchanged.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberReceivesCorrectData) {
  std::string txn;
  std::size_t items = 0;
  bus.subscribe<ledger::BatchCommittedEvent>(
      [&](const ledger::BatchCommittedEvent& e) {
        txn = e.transaction_id;
        items = e.item_count;
      });

  bus.publish(makeCommitted("txn_1700000000000_42"));

  EXPECT_EQ(txn, "txn_1700000000000_42");
  EXPECT_EQ(items, 2u);
}
