// =============================================================================
// ledger_engine_test.cpp
// =============================================================================
// Unit tests for ledger::LedgerEngine.
//
// Validates:
//   - Construction seeds the catalog from LedgerConfig
//   - Lifecycle: start() / stop() / destructor, both idempotent
//   - Notifications reach notificationBus() subscribers on the loop thread
//   - Low-stock alerts are raised through the running engine
//   - executeCommand(): each command's reply shape and the error mapping
//   - Shutdown with the IPC server running while events are still flowing
//   - A failed IPC bind leaves the engine stopped and usable
//
// Design: most tests leave IPC endpoints empty so no sockets are bound; the
// command path is exercised directly through executeCommand(). The IPC
// tests bind inproc:// endpoints only.
// =============================================================================

#include "ledger/engine/ledger_engine.hpp"
#include "ledger/errors/ledger_errors.hpp"
#include "ledger/orders/i_order_source.hpp"
#include "ledger/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>

using nlohmann::json;

class LedgerEngineTest : public ::testing::Test {
 protected:
  ledger::SimulationTimeProvider clock{1'700'000'000'000};
  ledger::InMemoryOrderSource orders;

  static ledger::LedgerConfig makeConfig() {
    ledger::LedgerConfig config;
    config.default_page_size = 2;
    config.max_page_size = 10;
    config.max_batch_items = 5;
    config.locations = {{1, "Warehouse"}, {2, "Shop"}};
    config.products = {{42, "Widget", 10, false}, {43, "Gadget", 0, false}};
    return config;
  }

  static json run(ledger::LedgerEngine& engine, const json& command) {
    return json::parse(engine.executeCommand(command.dump()));
  }
};

// -----------------------------------------------------------------------------
// 1. The catalog from config is usable without start().
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, ConstructionSeedsCatalog) {
  ledger::LedgerEngine engine(clock, makeConfig());
  EXPECT_TRUE(engine.store().findProduct(42).has_value());
  EXPECT_TRUE(engine.store().findLocation(2).has_value());

  ledger::domain::AdjustmentRequest r;
  r.user_id = 1;
  r.product_id = 42;
  r.location_id = 1;
  r.delta = 12;
  r.type = ledger::domain::AdjustmentType::StockIn;
  EXPECT_EQ(engine.adjust(r).new_quantity, 12);
  EXPECT_EQ(engine.queries().quantity(42, 1), 12);
}

// -----------------------------------------------------------------------------
// 2. start()/stop() are idempotent and the destructor stops a running engine.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, IdempotentLifecycle) {
  {
    ledger::LedgerEngine engine(clock, makeConfig());
    engine.start();
    engine.start();
    EXPECT_TRUE(engine.running());
    engine.stop();
    engine.stop();
    EXPECT_FALSE(engine.running());
  }
  {
    ledger::LedgerEngine engine(clock, makeConfig());
    engine.start();
    // Destructor joins.
  }
}

// -----------------------------------------------------------------------------
// 3. A committed batch reaches notificationBus() subscribers.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, BatchCommittedIsNotified) {
  ledger::LedgerEngine engine(clock, makeConfig());
  std::promise<ledger::BatchCommittedEvent> promise;
  auto future = promise.get_future();
  engine.notificationBus().subscribe<ledger::BatchCommittedEvent>(
      [&promise](const ledger::BatchCommittedEvent& e) { promise.set_value(e); });
  engine.start();

  auto result = engine.applyBatch(ledger::domain::AdjustmentType::StockIn, 1,
                                  {{42, 1, 5, std::nullopt}}, {"PO-1", ""});

  ASSERT_EQ(future.wait_for(std::chrono::seconds(2)), std::future_status::ready);
  auto event = future.get();
  EXPECT_EQ(event.transaction_id, result.transaction_id);
  EXPECT_EQ(event.reference, "PO-1");
  engine.stop();
}

// -----------------------------------------------------------------------------
// 4. Selling below the threshold raises a LowStockEvent.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, LowStockAlertThroughEngine) {
  ledger::LedgerEngine engine(clock, makeConfig());
  std::promise<ledger::LowStockEvent> promise;
  auto future = promise.get_future();
  engine.notificationBus().subscribe<ledger::LowStockEvent>(
      [&promise](const ledger::LowStockEvent& e) { promise.set_value(e); });
  engine.start();

  engine.applyBatch(ledger::domain::AdjustmentType::StockIn, 1,
                    {{42, 1, 15, std::nullopt}});
  engine.applyBatch(ledger::domain::AdjustmentType::Sale, 1,
                    {{42, 1, -6, std::nullopt}});

  ASSERT_EQ(future.wait_for(std::chrono::seconds(2)), std::future_status::ready);
  auto alert = future.get();
  EXPECT_EQ(alert.product_id, 42);
  EXPECT_EQ(alert.total_quantity, 9);
  engine.stop();
}

// -----------------------------------------------------------------------------
// 5. ping / status.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, PingAndStatus) {
  ledger::LedgerEngine engine(clock, makeConfig());
  json pong = run(engine, {{"command", "ping"}});
  EXPECT_EQ(pong.at("status"), "ok");
  EXPECT_EQ(pong.at("result"), "pong");

  json status = run(engine, {{"command", "status"}});
  EXPECT_EQ(status.at("result").at("products"), 2);
  EXPECT_EQ(status.at("result").at("running"), false);
}

// -----------------------------------------------------------------------------
// 6. adjust, validate, quantity round through the command interface.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, AdjustValidateQuantityCommands) {
  ledger::LedgerEngine engine(clock, makeConfig());

  json adjusted = run(engine, {{"command", "adjust"},
                               {"user_id", 1},
                               {"product_id", 42},
                               {"location_id", 1},
                               {"delta", 10},
                               {"type", "STOCK_IN"}});
  ASSERT_EQ(adjusted.at("status"), "ok") << adjusted.dump();
  EXPECT_EQ(adjusted.at("result").at("new_quantity"), 10);
  EXPECT_EQ(adjusted.at("result").at("new_version"), 1);

  json check = run(engine, {{"command", "validate"},
                            {"product_id", 42},
                            {"location_id", 1},
                            {"required", 13}});
  EXPECT_EQ(check.at("result").at("is_valid"), false);
  EXPECT_EQ(check.at("result").at("shortfall"), 3);

  json single = run(engine, {{"command", "quantity"},
                             {"product_id", 42},
                             {"location_id", 1}});
  EXPECT_EQ(single.at("result").at("quantity"), 10);
  EXPECT_EQ(single.at("result").at("version"), 1);

  json total = run(engine, {{"command", "quantity"}, {"product_id", 42}});
  EXPECT_EQ(total.at("result").at("total_quantity"), 10);
  EXPECT_EQ(total.at("result").at("locations").size(), 1u);
}

// -----------------------------------------------------------------------------
// 7. Domain errors map to their kind and HTTP status.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, ErrorReplies) {
  ledger::LedgerEngine engine(clock, makeConfig());

  json insufficient = run(engine, {{"command", "adjust"},
                                   {"user_id", 1},
                                   {"product_id", 42},
                                   {"location_id", 1},
                                   {"delta", -1}});
  EXPECT_EQ(insufficient.at("status"), "error");
  EXPECT_EQ(insufficient.at("error").at("kind"), "INSUFFICIENT_STOCK");
  EXPECT_EQ(insufficient.at("error").at("http_status"), 400);

  json missing = run(engine, {{"command", "adjust"},
                              {"user_id", 1},
                              {"product_id", 999},
                              {"location_id", 1},
                              {"delta", 1}});
  EXPECT_EQ(missing.at("error").at("http_status"), 404);

  json malformed = json::parse(engine.executeCommand("{not json"));
  EXPECT_EQ(malformed.at("error").at("kind"), "VALIDATION_ERROR");

  json no_field = run(engine, {{"command", "adjust"}, {"user_id", 1}});
  EXPECT_EQ(no_field.at("error").at("http_status"), 400);

  json unknown = run(engine, {{"command", "teleport"}});
  EXPECT_EQ(unknown.at("error").at("kind"), "VALIDATION_ERROR");

  json unconfigured = run(engine, {{"command", "fulfill"},
                                   {"user_id", 1},
                                   {"reference", "WC-1"}});
  EXPECT_EQ(unconfigured.at("error").at("kind"), "VALIDATION_ERROR");
}

// -----------------------------------------------------------------------------
// 8. batch failure names the item; transfer and fulfill succeed.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, BatchTransferFulfillCommands) {
  orders.putOrder(ledger::domain::Order{"WC-1", 1, {{42, 2}}});
  ledger::LedgerEngine engine(clock, makeConfig(), &orders);

  json seeded = run(engine, {{"command", "batch"},
                             {"type", "STOCK_IN"},
                             {"user_id", 1},
                             {"reference", "PO-9"},
                             {"items",
                              {{{"product_id", 42},
                                {"location_id", 1},
                                {"quantity_change", 10}},
                               {{"product_id", 43},
                                {"location_id", 1},
                                {"quantity_change", 4}}}}});
  ASSERT_EQ(seeded.at("status"), "ok") << seeded.dump();
  EXPECT_EQ(seeded.at("result").at("log_entries").size(), 2u);
  EXPECT_EQ(seeded.at("result").at("reference"), "PO-9");

  json failed = run(engine, {{"command", "batch"},
                             {"type", "SALE"},
                             {"user_id", 1},
                             {"items",
                              {{{"product_id", 42},
                                {"location_id", 1},
                                {"quantity_change", -1}},
                               {{"product_id", 43},
                                {"location_id", 1},
                                {"quantity_change", -1000}}}}});
  EXPECT_EQ(failed.at("error").at("kind"), "BATCH_ITEM_ERROR");
  EXPECT_EQ(failed.at("error").at("cause").at("kind"), "INSUFFICIENT_STOCK");
  EXPECT_EQ(engine.queries().quantity(42, 1), 10);

  json moved = run(engine, {{"command", "transfer"},
                            {"user_id", 1},
                            {"product_id", 42},
                            {"from_location_id", 1},
                            {"to_location_id", 2},
                            {"quantity", 3}});
  ASSERT_EQ(moved.at("status"), "ok") << moved.dump();
  EXPECT_EQ(engine.queries().quantity(42, 2), 3);

  json shipped = run(engine, {{"command", "fulfill"},
                              {"user_id", 1},
                              {"reference", "WC-1"}});
  ASSERT_EQ(shipped.at("status"), "ok") << shipped.dump();
  EXPECT_EQ(shipped.at("result").at("type"), "SALE");
  EXPECT_EQ(engine.queries().quantity(42, 1), 5);
}

// -----------------------------------------------------------------------------
// 9. logs, snapshot, low_stock, archive/restore and reconcile commands.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, ReadAndLifecycleCommands) {
  ledger::LedgerEngine engine(clock, makeConfig());
  for (int i = 0; i < 3; ++i) {
    ledger::domain::AdjustmentRequest r;
    r.user_id = 1;
    r.product_id = 42;
    r.location_id = 1;
    r.delta = 2;
    engine.adjust(r);
    clock.advance_by(1'000);
  }

  json logs = run(engine, {{"command", "logs"}, {"product_id", 42}});
  EXPECT_EQ(logs.at("result").at("page_size"), 2);
  EXPECT_EQ(logs.at("result").at("total"), 3);
  EXPECT_EQ(logs.at("result").at("total_pages"), 2);

  json snapshot = run(engine, {{"command", "snapshot"},
                               {"timestamp_ms", 1'700'000'000'000}});
  ASSERT_EQ(snapshot.at("result").size(), 1u);
  EXPECT_EQ(snapshot.at("result")[0].at("quantity"), 2);

  json low = run(engine, {{"command", "low_stock"}});
  ASSERT_EQ(low.at("result").size(), 1u);
  EXPECT_EQ(low.at("result")[0].at("product_id"), 42);

  json archived = run(engine, {{"command", "archive"},
                               {"user_id", 1},
                               {"product_id", 42}});
  ASSERT_EQ(archived.at("status"), "ok") << archived.dump();
  EXPECT_EQ(archived.at("result").at("log_entries").size(), 1u);
  EXPECT_EQ(run(engine, {{"command", "low_stock"}}).at("result").size(), 0u);

  json restored = run(engine, {{"command", "restore"},
                               {"user_id", 1},
                               {"product_id", 42}});
  EXPECT_EQ(restored.at("result").at("archived"), false);

  json audit = run(engine, {{"command", "reconcile"}});
  EXPECT_EQ(audit.at("result").at("reconciled"), true);
}

// -----------------------------------------------------------------------------
// 10. stop() while a producer keeps committing and telemetry is bridged.
// Why: The telemetry bridge runs on the notification thread; the IPC server
//      must outlive every call into it.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, StopWithIpcWhileEventsFlow) {
  ledger::LedgerConfig config = makeConfig();
  config.command_endpoint = "inproc://ledger-commands";
  config.telemetry_endpoint = "inproc://ledger-telemetry";

  for (int round = 0; round < 5; ++round) {
    ledger::LedgerEngine engine(clock, config);
    engine.start();
    ASSERT_TRUE(engine.running());
    EXPECT_EQ(run(engine, {{"command", "status"}}).at("result").at("running"),
              true);

    std::atomic<bool> keep_going{true};
    std::thread producer([&engine, &keep_going] {
      ledger::domain::AdjustmentRequest r;
      r.user_id = 1;
      r.product_id = 42;
      r.location_id = 1;
      r.delta = 1;
      while (keep_going.load()) {
        engine.adjust(r);
      }
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    engine.stop();
    EXPECT_FALSE(engine.running());
    keep_going.store(false);
    producer.join();
  }
}

// -----------------------------------------------------------------------------
// 11. An endpoint that cannot be bound: start() throws and rolls back.
// -----------------------------------------------------------------------------
TEST_F(LedgerEngineTest, BindFailureLeavesEngineStopped) {
  ledger::LedgerConfig config = makeConfig();
  config.command_endpoint = "bogus://nowhere";
  config.telemetry_endpoint = "bogus://nowhere-else";

  ledger::LedgerEngine engine(clock, config);
  EXPECT_THROW(engine.start(), zmq::error_t);
  EXPECT_FALSE(engine.running());

  ledger::domain::AdjustmentRequest r;
  r.user_id = 1;
  r.product_id = 42;
  r.location_id = 1;
  r.delta = 3;
  EXPECT_EQ(engine.adjust(r).new_quantity, 3);
  EXPECT_NO_THROW(engine.stop());
}
