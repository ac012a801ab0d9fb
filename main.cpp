// -----------------------------------------------------------------------------
// stock_ledger — single executable entry point.
//
//   1) Load LedgerConfig (argv[1], default config/ledger.json).
//   2) Create the LedgerEngine on the wall clock; the catalog is seeded from
//      the config.
//   3) Subscribe logging callbacks on the notification bus.
//   4) Start the engine: notification loop, low-stock monitor and the
//      ZeroMQ command/telemetry server.
//   5) Idle on the main thread until Ctrl-C, then shut down cleanly.
//
// Thread layout:
//   main thread          → waits for SIGINT
//   notification thread  → EventBus callbacks, LowStockMonitor
//   ipc thread           → IpcServer (REP commands, PUB telemetry)
// -----------------------------------------------------------------------------

#include "ledger/config/ledger_config.hpp"
#include "ledger/domain/adjustment_type.hpp"
#include "ledger/engine/ledger_engine.hpp"
#include "ledger/events/ledger_events.hpp"
#include "ledger/orders/i_order_source.hpp"
#include "ledger/time/live_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

namespace {

// Set by the SIGINT handler, polled by the main loop.
std::atomic<bool> g_shutdown_requested{false};

void sigint_handler(int /*signum*/) { g_shutdown_requested.store(true); }

}  // namespace

int main(int argc, char** argv) {
  const std::string config_path = argc > 1 ? argv[1] : "config/ledger.json";

  // -------------------------------------------------------------------------
  // 1) Configuration. A bad file is fatal.
  // -------------------------------------------------------------------------
  ledger::LedgerConfig config;
  try {
    config = ledger::loadLedgerConfig(config_path);
  } catch (const ledger::ConfigError& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 2) Engine. Orders are registered by whoever embeds the engine; the
  //    standalone binary starts with an empty source.
  // -------------------------------------------------------------------------
  ledger::LiveTimeProvider clock;
  ledger::InMemoryOrderSource orders;
  ledger::LedgerEngine engine(clock, config, &orders);

  // -------------------------------------------------------------------------
  // 3) Logging callbacks. Subscribed before start() so nothing is missed.
  //    They run on the notification thread.
  // -------------------------------------------------------------------------
  auto& bus = engine.notificationBus();
  bus.subscribe<ledger::StockAdjustedEvent>(
      [](const ledger::StockAdjustedEvent& e) {
        std::cout << "[main] StockAdjusted: product=" << e.entry.product_id
                  << " location=" << e.entry.location_id
                  << " delta=" << e.entry.delta << " type="
                  << ledger::domain::adjustmentTypeToString(e.entry.type)
                  << " qty=" << e.new_quantity << " v=" << e.new_version
                  << "\n";
      });
  bus.subscribe<ledger::BatchCommittedEvent>(
      [](const ledger::BatchCommittedEvent& e) {
        std::cout << "[main] BatchCommitted: " << e.transaction_id
                  << " items=" << e.item_count << " ref='" << e.reference
                  << "'\n";
      });
  bus.subscribe<ledger::BatchAbortedEvent>(
      [](const ledger::BatchAbortedEvent& e) {
        std::cout << "[main] BatchAborted: " << e.transaction_id
                  << " item #" << (e.failed_item_index + 1) << ": "
                  << e.reason << "\n";
      });
  bus.subscribe<ledger::LowStockEvent>([](const ledger::LowStockEvent& e) {
    std::cout << "[LowStock] product=" << e.product_id << " ('"
              << e.product_name << "') total=" << e.total_quantity
              << " threshold=" << e.threshold << "\n";
  });

  try {
    engine.start();
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] cannot open IPC endpoints: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 4) Wait for Ctrl-C.
  // -------------------------------------------------------------------------
  std::signal(SIGINT, sigint_handler);
  std::cout << "[main] stock ledger running";
  if (!config.command_endpoint.empty()) {
    std::cout << "; commands on " << config.command_endpoint
              << ", telemetry on " << config.telemetry_endpoint;
  }
  std::cout << ".\n[main] Press Ctrl-C to shut down.\n";

  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  // -------------------------------------------------------------------------
  // 5) Clean shutdown.
  // -------------------------------------------------------------------------
  std::cout << "\n[main] SIGINT received. Stopping engine...\n";
  engine.stop();

  return 0;
}
