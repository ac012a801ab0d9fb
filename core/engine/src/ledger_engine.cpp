#include "ledger/engine/ledger_engine.hpp"
#include "ledger/errors/ledger_errors.hpp"
#include "ledger/network/wire_format.hpp"
#include "ledger/store/in_memory_ledger_store.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace ledger {

using nlohmann::json;

namespace {

std::unique_ptr<ILedgerStore> orDefaultStore(
    std::unique_ptr<ILedgerStore> store) {
  if (store) {
    return store;
  }
  return std::make_unique<InMemoryLedgerStore>();
}

json errorReply(const json& error) {
  return json{{"status", "error"}, {"error", error}};
}

json okReply(json result) {
  return json{{"status", "ok"}, {"result", std::move(result)}};
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: store, catalog seed, services. No threads yet.
// -----------------------------------------------------------------------------
LedgerEngine::LedgerEngine(const ITimeProvider& clock,
                           LedgerConfig config,
                           IOrderSource* order_source,
                           std::unique_ptr<ILedgerStore> store)
    : clock_(clock),
      config_(std::move(config)),
      order_source_(order_source),
      store_(orDefaultStore(std::move(store))),
      validator_(*store_),
      adjustments_(*store_, clock_,
                   [this](Event e) { notification_loop_.push(std::move(e)); }),
      batches_(*store_, clock_, config_.max_batch_items,
               [this](Event e) { notification_loop_.push(std::move(e)); }),
      catalog_(*store_, clock_,
               [this](Event e) { notification_loop_.push(std::move(e)); }),
      queries_(*store_, config_.default_page_size, config_.max_page_size),
      auditor_(*store_) {
  if (order_source_ != nullptr) {
    fulfillment_ =
        std::make_unique<OrderFulfillmentService>(batches_, *order_source_);
  }
  seedCatalog();
}

LedgerEngine::~LedgerEngine() { stop(); }

void LedgerEngine::seedCatalog() {
  for (const domain::Location& location : config_.locations) {
    catalog_.upsertLocation(location);
  }
  for (const domain::Product& product : config_.products) {
    catalog_.upsertProduct(product);
  }
  if (!config_.locations.empty() || !config_.products.empty()) {
    std::cout << "[LedgerEngine] catalog seeded: " << config_.locations.size()
              << " location(s), " << config_.products.size()
              << " product(s).\n";
  }
}

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void LedgerEngine::start() {
  if (running_) {
    return;
  }

  // ---  1) Monitor subscribes before the loop delivers anything -------------
  if (config_.low_stock_alerts) {
    low_stock_monitor_ = std::make_unique<LowStockMonitor>(
        notification_loop_.eventBus(), *store_, clock_);
  }

  // ---  2) Notification loop ------------------------------------------------
  notification_loop_.start();

  // ---  3) IpcServer (commands + telemetry) ----------------------------------
  if (!config_.command_endpoint.empty() &&
      !config_.telemetry_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.command_endpoint, config_.telemetry_endpoint);
    try {
      ipc_server_->start();
    } catch (const std::exception& e) {
      std::cerr << "[LedgerEngine] start aborted: " << e.what() << "\n";
      ipc_server_.reset();
      notification_loop_.stop();
      low_stock_monitor_.reset();
      throw;
    }

    // The server outlives the bridge: stop() joins the loop before the
    // server is destroyed.
    IpcServer* server = ipc_server_.get();
    telemetry_subscription_ = notification_loop_.eventBus().subscribe(
        [server](const Event& e) { server->pushTelemetry(e); });
  }

  running_ = true;

  std::cout << "[LedgerEngine] started. Threads: notifications"
            << (ipc_server_ ? ", ipc" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void LedgerEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) No new commands --------------------------------------------------
  if (ipc_server_) {
    ipc_server_->stop();
  }

  // ---  2) Deliver what is queued, join the loop -----------------------------
  notification_loop_.stop();

  // ---  3) Loop is joined: nothing can call the bridge any more --------------
  if (telemetry_subscription_) {
    notification_loop_.eventBus().unsubscribe(*telemetry_subscription_);
    telemetry_subscription_.reset();
  }
  ipc_server_.reset();

  // ---  4) Monitor unsubscribes ----------------------------------------------
  low_stock_monitor_.reset();

  running_ = false;

  std::cout << "[LedgerEngine] stopped. All threads joined.\n";
}

// -----------------------------------------------------------------------------
// Direct API
// -----------------------------------------------------------------------------
domain::StockValidation LedgerEngine::validate(domain::ProductId product_id,
                                               domain::LocationId location_id,
                                               domain::Quantity required) const {
  return validator_.validate(product_id, location_id, required);
}

domain::AdjustmentResult LedgerEngine::adjust(
    const domain::AdjustmentRequest& request) {
  return adjustments_.adjust(request);
}

domain::BatchResult LedgerEngine::applyBatch(
    domain::AdjustmentType type,
    domain::UserId user_id,
    const std::vector<domain::BatchItem>& items,
    const domain::BatchMetadata& metadata) {
  return batches_.applyBatch(type, user_id, items, metadata);
}

domain::BatchResult LedgerEngine::transfer(domain::UserId user_id,
                                           domain::ProductId product_id,
                                           domain::LocationId from_location,
                                           domain::LocationId to_location,
                                           domain::Quantity quantity,
                                           const domain::BatchMetadata& metadata) {
  return batches_.transfer(user_id, product_id, from_location, to_location,
                           quantity, metadata);
}

domain::BatchResult LedgerEngine::fulfillOrder(domain::UserId user_id,
                                               const std::string& reference,
                                               domain::AdjustmentType type) {
  if (!fulfillment_) {
    throw InvalidAdjustmentError("order fulfillment is not configured");
  }
  return fulfillment_->fulfill(user_id, reference, type);
}

ReconciliationReport LedgerEngine::reconcile() const {
  return auditor_.audit();
}

// -----------------------------------------------------------------------------
// executeCommand(): JSON request/reply
// -----------------------------------------------------------------------------
std::string LedgerEngine::executeCommand(const std::string& cmd) {
  std::string command;
  try {
    const json request = json::parse(cmd);
    command = request.at("command").get<std::string>();
    return dispatch(command, request).dump();
  } catch (const LedgerError& e) {
    std::cerr << "[LedgerEngine] command '" << command << "' rejected: "
              << e.what() << "\n";
    return errorReply(wire::errorToJson(e)).dump();
  } catch (const json::exception& e) {
    std::cerr << "[LedgerEngine] malformed command: " << e.what() << "\n";
    return errorReply(json{{"kind", errorKindToString(ErrorKind::Validation)},
                           {"message", e.what()},
                           {"http_status",
                            httpStatusFor(ErrorKind::Validation)}})
        .dump();
  } catch (const std::exception& e) {
    std::cerr << "[LedgerEngine] command '" << command
              << "' failed unexpectedly: " << e.what() << "\n";
    return errorReply(json{{"kind", errorKindToString(ErrorKind::Storage)},
                           {"message", e.what()},
                           {"http_status", httpStatusFor(ErrorKind::Storage)}})
        .dump();
  }
}

json LedgerEngine::dispatch(const std::string& command, const json& args) {
  if (command == "ping") {
    return okReply("pong");
  }

  if (command == "status") {
    return okReply(json{
        {"running", running_.load()},
        {"products", store_->allProducts().size()},
        {"stock_rows", store_->allStockLevels().size()},
        {"pending_notifications", notification_loop_.pending()},
        {"low_stock_alerts",
         low_stock_monitor_ ? low_stock_monitor_->alertsRaised() : 0},
        {"ipc_commands_served",
         ipc_server_ ? ipc_server_->commandsServed() : 0}});
  }

  if (command == "validate") {
    return okReply(wire::toJson(
        validate(args.at("product_id").get<domain::ProductId>(),
                 args.at("location_id").get<domain::LocationId>(),
                 args.at("required").get<domain::Quantity>())));
  }

  if (command == "adjust") {
    return okReply(wire::toJson(adjust(wire::adjustmentRequestFromJson(args))));
  }

  if (command == "batch") {
    std::vector<domain::BatchItem> items;
    for (const json& item : args.at("items")) {
      items.push_back(wire::batchItemFromJson(item));
    }
    return okReply(wire::toJson(
        applyBatch(wire::adjustmentTypeFromJson(args.at("type")),
                   args.at("user_id").get<domain::UserId>(), items,
                   wire::batchMetadataFromJson(args))));
  }

  if (command == "transfer") {
    return okReply(wire::toJson(
        transfer(args.at("user_id").get<domain::UserId>(),
                 args.at("product_id").get<domain::ProductId>(),
                 args.at("from_location_id").get<domain::LocationId>(),
                 args.at("to_location_id").get<domain::LocationId>(),
                 args.at("quantity").get<domain::Quantity>(),
                 wire::batchMetadataFromJson(args))));
  }

  if (command == "fulfill") {
    const domain::AdjustmentType type =
        args.contains("type") ? wire::adjustmentTypeFromJson(args.at("type"))
                              : domain::AdjustmentType::Sale;
    return okReply(wire::toJson(
        fulfillOrder(args.at("user_id").get<domain::UserId>(),
                     args.at("reference").get<std::string>(), type)));
  }

  if (command == "quantity") {
    const auto product_id = args.at("product_id").get<domain::ProductId>();
    if (args.contains("location_id")) {
      const auto location_id = args.at("location_id").get<domain::LocationId>();
      const std::optional<domain::StockLevel> row =
          queries_.stockLevel(product_id, location_id);
      return okReply(json{{"product_id", product_id},
                          {"location_id", location_id},
                          {"quantity", row ? row->quantity : 0},
                          {"version", row ? row->version : 0}});
    }
    json rows = json::array();
    for (const domain::StockLevel& row :
         queries_.stockLevelsForProduct(product_id)) {
      rows.push_back(wire::toJson(row));
    }
    return okReply(json{{"product_id", product_id},
                        {"total_quantity", queries_.totalQuantity(product_id)},
                        {"locations", std::move(rows)}});
  }

  if (command == "logs") {
    const std::size_t page = args.value("page", std::size_t{1});
    std::optional<std::size_t> page_size;
    if (args.contains("page_size")) {
      page_size = args.at("page_size").get<std::size_t>();
    }
    return okReply(wire::toJson(
        queries_.queryLog(wire::logFilterFromJson(args), page, page_size)));
  }

  if (command == "snapshot") {
    std::optional<domain::LocationId> location_id;
    if (args.contains("location_id")) {
      location_id = args.at("location_id").get<domain::LocationId>();
    }
    return okReply(wire::toJson(queries_.snapshotAt(
        args.at("timestamp_ms").get<std::int64_t>(), location_id)));
  }

  if (command == "low_stock") {
    return okReply(wire::toJson(queries_.lowStockProducts()));
  }

  if (command == "archive" || command == "restore") {
    const auto user_id = args.at("user_id").get<domain::UserId>();
    const auto product_id = args.at("product_id").get<domain::ProductId>();
    const std::vector<domain::AdjustmentLogEntry> markers =
        command == "archive" ? catalog_.archiveProduct(user_id, product_id)
                             : catalog_.restoreProduct(user_id, product_id);
    json entries = json::array();
    for (const auto& entry : markers) {
      entries.push_back(wire::toJson(entry));
    }
    return okReply(json{{"product_id", product_id},
                        {"archived", command == "archive"},
                        {"log_entries", std::move(entries)}});
  }

  if (command == "reconcile") {
    return okReply(wire::toJson(reconcile()));
  }

  throw InvalidAdjustmentError("unknown command: " + command);
}

}  // namespace ledger
