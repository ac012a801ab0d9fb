#include "ledger/network/wire_format.hpp"

#include <string>

namespace ledger {
namespace wire {

using nlohmann::json;

// -----------------------------------------------------------------------------
// Serialization
// -----------------------------------------------------------------------------
json toJson(const domain::AdjustmentLogEntry& entry) {
  json j;
  j["id"] = entry.id;
  j["product_id"] = entry.product_id;
  j["location_id"] = entry.location_id;
  j["user_id"] = entry.user_id;
  j["delta"] = entry.delta;
  j["type"] = domain::adjustmentTypeToString(entry.type);
  j["timestamp_ms"] = entry.timestamp_ms;
  if (!entry.transaction_id.empty()) {
    j["transaction_id"] = entry.transaction_id;
  }
  return j;
}

json toJson(const domain::StockLevel& row) {
  return json{{"product_id", row.product_id},
              {"location_id", row.location_id},
              {"quantity", row.quantity},
              {"version", row.version}};
}

json toJson(const domain::AdjustmentResult& result) {
  return json{{"log_entry", toJson(result.log_entry)},
              {"new_version", result.new_version},
              {"new_quantity", result.new_quantity}};
}

json toJson(const domain::BatchResult& result) {
  json entries = json::array();
  for (const auto& entry : result.log_entries) {
    entries.push_back(toJson(entry));
  }
  return json{{"transaction_id", result.transaction_id},
              {"type", domain::adjustmentTypeToString(result.type)},
              {"user_id", result.user_id},
              {"reference", result.metadata.reference},
              {"notes", result.metadata.notes},
              {"log_entries", entries}};
}

json toJson(const domain::StockValidation& validation) {
  json j{{"is_valid", validation.is_valid},
         {"current_quantity", validation.current_quantity},
         {"requested_quantity", validation.requested_quantity}};
  if (validation.shortfall) {
    j["shortfall"] = *validation.shortfall;
    j["message"] = validation.message;
  }
  return j;
}

json toJson(const LogPage& page) {
  json entries = json::array();
  for (const auto& entry : page.entries) {
    entries.push_back(toJson(entry));
  }
  return json{{"entries", entries},
              {"page", page.page},
              {"page_size", page.page_size},
              {"total", page.total},
              {"total_pages", page.total_pages}};
}

json toJson(const ReconciliationReport& report) {
  json discrepancies = json::array();
  for (const auto& d : report.discrepancies) {
    discrepancies.push_back(json{{"product_id", d.key.product_id},
                                 {"location_id", d.key.location_id},
                                 {"row_quantity", d.row_quantity},
                                 {"log_total", d.log_total}});
  }
  return json{{"reconciled", report.reconciled()},
              {"pairs_checked", report.pairs_checked},
              {"discrepancies", discrepancies}};
}

json toJson(const std::vector<SnapshotLine>& snapshot) {
  json lines = json::array();
  for (const auto& line : snapshot) {
    lines.push_back(json{{"product_id", line.key.product_id},
                         {"location_id", line.key.location_id},
                         {"quantity", line.quantity}});
  }
  return lines;
}

json toJson(const std::vector<LowStockProduct>& products) {
  json items = json::array();
  for (const auto& item : products) {
    items.push_back(json{{"product_id", item.product.id},
                         {"name", item.product.name},
                         {"threshold", item.product.low_stock_threshold},
                         {"total_quantity", item.total_quantity}});
  }
  return items;
}

json errorToJson(const LedgerError& error) {
  json j{{"kind", errorKindToString(error.kind())},
         {"message", error.what()},
         {"http_status", httpStatusFor(error.kind())}};

  if (const auto* e = dynamic_cast<const OptimisticLockError*>(&error)) {
    j["product_id"] = e->productId();
    j["location_id"] = e->locationId();
    j["current_version"] = e->currentVersion();
    j["expected_version"] = e->expectedVersion();
  } else if (const auto* e =
                 dynamic_cast<const InsufficientStockError*>(&error)) {
    j["product_id"] = e->productId();
    j["location_id"] = e->locationId();
    j["current"] = e->current();
    j["requested"] = e->requested();
    j["shortfall"] = e->shortfall();
  } else if (const auto* e = dynamic_cast<const NotFoundError*>(&error)) {
    j["entity"] = e->entity();
  } else if (const auto* e = dynamic_cast<const BatchItemError*>(&error)) {
    j["item_index"] = e->itemIndex();
    j["product_id"] = e->productId();
    j["location_id"] = e->locationId();
    j["cause"] = errorToJson(e->cause());
  }
  return j;
}

// -----------------------------------------------------------------------------
// eventToJson: one overload per alternative of Event
// -----------------------------------------------------------------------------
namespace {

struct TelemetryFormatter {
  json operator()(const StockAdjustedEvent& e) const {
    json j{{"type", "stock_adjusted"},
           {"entry", toJson(e.entry)},
           {"new_quantity", e.new_quantity},
           {"new_version", e.new_version}};
    if (e.product_totals) {
      j["product_total_before"] = e.product_totals->before;
      j["product_total_after"] = e.product_totals->after;
    }
    return j;
  }
  json operator()(const BatchCommittedEvent& e) const {
    return json{{"type", "batch_committed"},
                {"transaction_id", e.transaction_id},
                {"reference", e.reference},
                {"adjustment_type", domain::adjustmentTypeToString(e.type)},
                {"user_id", e.user_id},
                {"item_count", e.item_count},
                {"timestamp_ms", e.timestamp_ms}};
  }
  json operator()(const BatchAbortedEvent& e) const {
    return json{{"type", "batch_aborted"},
                {"transaction_id", e.transaction_id},
                {"reference", e.reference},
                {"adjustment_type", domain::adjustmentTypeToString(e.type)},
                {"user_id", e.user_id},
                {"failed_item_index", e.failed_item_index},
                {"error_kind", e.error_kind},
                {"reason", e.reason},
                {"timestamp_ms", e.timestamp_ms}};
  }
  json operator()(const LowStockEvent& e) const {
    return json{{"type", "low_stock"},
                {"product_id", e.product_id},
                {"name", e.product_name},
                {"total_quantity", e.total_quantity},
                {"threshold", e.threshold},
                {"timestamp_ms", e.timestamp_ms}};
  }
  json operator()(const ProductStatusEvent& e) const {
    return json{{"type", "product_status"},
                {"product_id", e.product_id},
                {"archived", e.archived},
                {"user_id", e.user_id},
                {"timestamp_ms", e.timestamp_ms}};
  }
};

}  // namespace

json eventToJson(const Event& event) {
  return std::visit(TelemetryFormatter{}, event);
}

// -----------------------------------------------------------------------------
// Parsing
// -----------------------------------------------------------------------------
domain::AdjustmentType adjustmentTypeFromJson(const json& value) {
  const std::string name = value.get<std::string>();
  const auto type = domain::parseAdjustmentType(name);
  if (!type) {
    throw InvalidAdjustmentError("unknown adjustment type '" + name + "'");
  }
  return *type;
}

domain::AdjustmentRequest adjustmentRequestFromJson(const json& j) {
  domain::AdjustmentRequest request;
  request.user_id = j.at("user_id").get<domain::UserId>();
  request.product_id = j.at("product_id").get<domain::ProductId>();
  request.location_id = j.at("location_id").get<domain::LocationId>();
  request.delta = j.at("delta").get<domain::Quantity>();
  request.type = j.contains("type") ? adjustmentTypeFromJson(j.at("type"))
                                    : domain::AdjustmentType::Adjustment;
  if (j.contains("expected_version") && !j.at("expected_version").is_null()) {
    request.expected_version = j.at("expected_version").get<domain::Version>();
  }
  return request;
}

domain::BatchItem batchItemFromJson(const json& j) {
  domain::BatchItem item;
  item.product_id = j.at("product_id").get<domain::ProductId>();
  item.location_id = j.at("location_id").get<domain::LocationId>();
  item.quantity_change = j.at("quantity_change").get<domain::Quantity>();
  if (j.contains("expected_version") && !j.at("expected_version").is_null()) {
    item.expected_version = j.at("expected_version").get<domain::Version>();
  }
  return item;
}

domain::BatchMetadata batchMetadataFromJson(const json& j) {
  domain::BatchMetadata metadata;
  metadata.reference = j.value("reference", std::string{});
  metadata.notes = j.value("notes", std::string{});
  return metadata;
}

LogFilter logFilterFromJson(const json& j) {
  LogFilter filter;
  if (j.contains("product_id")) {
    filter.product_id = j.at("product_id").get<domain::ProductId>();
  }
  if (j.contains("location_id")) {
    filter.location_id = j.at("location_id").get<domain::LocationId>();
  }
  if (j.contains("user_id")) {
    filter.user_id = j.at("user_id").get<domain::UserId>();
  }
  if (j.contains("type")) {
    filter.type = adjustmentTypeFromJson(j.at("type"));
  }
  if (j.contains("start_ms")) {
    filter.start_ms = j.at("start_ms").get<std::int64_t>();
  }
  if (j.contains("end_ms")) {
    filter.end_ms = j.at("end_ms").get<std::int64_t>();
  }
  return filter;
}

}  // namespace wire
}  // namespace ledger
