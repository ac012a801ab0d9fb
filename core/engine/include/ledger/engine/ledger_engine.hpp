#pragma once

#include "ledger/audit/reconciliation_auditor.hpp"
#include "ledger/concurrent/event_loop_thread.hpp"
#include "ledger/config/ledger_config.hpp"
#include "ledger/domain/adjustment.hpp"
#include "ledger/domain/batch.hpp"
#include "ledger/domain/stock_validation.hpp"
#include "ledger/monitor/low_stock_monitor.hpp"
#include "ledger/network/ipc_server.hpp"
#include "ledger/orders/i_order_source.hpp"
#include "ledger/service/adjustment_service.hpp"
#include "ledger/service/batch_transaction_service.hpp"
#include "ledger/service/catalog_service.hpp"
#include "ledger/service/ledger_queries.hpp"
#include "ledger/service/order_fulfillment_service.hpp"
#include "ledger/service/stock_validator.hpp"
#include "ledger/store/i_ledger_store.hpp"
#include "ledger/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ledger {

// -----------------------------------------------------------------------------
// LedgerEngine — composition root of the stock ledger
// -----------------------------------------------------------------------------
//
// @brief  Owns the store, the services, the notification loop, the
//         low-stock monitor and the IPC server, and exposes the
//         collaborator-facing operations in one place.
//
// @details
// Construction wires everything that has no thread: the store (an
// InMemoryLedgerStore unless one is injected), the catalog seeded from
// LedgerConfig, and every service. The direct API (adjust, applyBatch, ...)
// is usable immediately after construction.
//
// start() adds the threads:
//   1. notification EventLoopThread
//   2. LowStockMonitor on the loop's bus (if config.low_stock_alerts)
//   3. IpcServer plus a telemetry bridge from the loop's bus (if both
//      endpoints are configured)
//
// Services publish through an EventSink that pushes into the notification
// loop. Events raised before start() are queued and delivered once the loop
// runs.
//
// Shutdown order (stop() and the destructor):
//   IPC server stopped first (no new commands), then the notification loop
//   is stopped and drained, and only once it is joined is the telemetry
//   bridge unsubscribed and the server destroyed. The monitor goes last.
//   Telemetry for events drained in that last step is not published.
//
// If the IPC server cannot bind, start() rolls back the loop and the
// monitor and rethrows; the engine stays stopped and usable.
//
// Thread model:
//   The direct API and executeCommand() are safe from any number of
//   threads. start()/stop() belong to the owning thread.
// -----------------------------------------------------------------------------
class LedgerEngine {
 public:
  // clock and order_source are borrowed and must outlive the engine.
  // order_source may be nullptr; fulfillOrder() then fails with a
  // validation error.
  explicit LedgerEngine(const ITimeProvider& clock,
                        LedgerConfig config = {},
                        IOrderSource* order_source = nullptr,
                        std::unique_ptr<ILedgerStore> store = nullptr);
  ~LedgerEngine();

  LedgerEngine(const LedgerEngine&) = delete;
  LedgerEngine& operator=(const LedgerEngine&) = delete;
  LedgerEngine(LedgerEngine&&) = delete;
  LedgerEngine& operator=(LedgerEngine&&) = delete;

  void start();
  void stop();
  bool running() const { return running_.load(); }

  // --- Collaborator-facing operations ---------------------------------------
  domain::StockValidation validate(domain::ProductId product_id,
                                   domain::LocationId location_id,
                                   domain::Quantity required) const;

  domain::AdjustmentResult adjust(const domain::AdjustmentRequest& request);

  domain::BatchResult applyBatch(domain::AdjustmentType type,
                                 domain::UserId user_id,
                                 const std::vector<domain::BatchItem>& items,
                                 const domain::BatchMetadata& metadata = {});

  domain::BatchResult transfer(domain::UserId user_id,
                               domain::ProductId product_id,
                               domain::LocationId from_location,
                               domain::LocationId to_location,
                               domain::Quantity quantity,
                               const domain::BatchMetadata& metadata = {});

  domain::BatchResult fulfillOrder(
      domain::UserId user_id,
      const std::string& reference,
      domain::AdjustmentType type = domain::AdjustmentType::Sale);

  ReconciliationReport reconcile() const;

  CatalogService& catalog() { return catalog_; }
  const LedgerQueries& queries() const { return queries_; }

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  // @brief  JSON command interface used by the IPC server and by tests.
  //
  // @param  cmd  {"command": "<name>", ...arguments}. Names: ping, status,
  //              validate, adjust, batch, transfer, fulfill, quantity,
  //              logs, snapshot, low_stock, archive, restore, reconcile.
  //
  // @return {"status":"ok", "result": ...} or
  //         {"status":"error", "error": wire::errorToJson(...)}.
  //         Never throws: malformed input becomes a VALIDATION_ERROR reply,
  //         anything unexpected a STORAGE_ERROR reply.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  // Bus of the notification loop. Subscribe before start() to see every
  // event.
  EventBus& notificationBus() { return notification_loop_.eventBus(); }

  ILedgerStore& store() { return *store_; }

 private:
  nlohmann::json dispatch(const std::string& command,
                          const nlohmann::json& args);
  void seedCatalog();

  const ITimeProvider& clock_;
  LedgerConfig config_;
  IOrderSource* order_source_;

  std::unique_ptr<ILedgerStore> store_;
  EventLoopThread notification_loop_;

  StockValidator validator_;
  AdjustmentService adjustments_;
  BatchTransactionService batches_;
  CatalogService catalog_;
  LedgerQueries queries_;
  ReconciliationAuditor auditor_;
  std::unique_ptr<OrderFulfillmentService> fulfillment_;

  std::unique_ptr<LowStockMonitor> low_stock_monitor_;
  std::unique_ptr<IpcServer> ipc_server_;
  std::optional<EventBus::SubscriptionId> telemetry_subscription_;

  std::atomic<bool> running_{false};
};

}  // namespace ledger
