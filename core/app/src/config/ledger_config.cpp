#include "ledger/config/ledger_config.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <set>
#include <sstream>

namespace ledger {

namespace {

using json = nlohmann::json;

std::size_t readPositiveSize(const json& j, const char* key,
                             std::size_t fallback) {
  if (!j.contains(key)) {
    return fallback;
  }
  const std::int64_t value = j.at(key).get<std::int64_t>();
  if (value < 1) {
    throw ConfigError(std::string(key) + " must be at least 1");
  }
  return static_cast<std::size_t>(value);
}

void validate(const LedgerConfig& config) {
  if (config.default_page_size > config.max_page_size) {
    throw ConfigError("default_page_size exceeds max_page_size");
  }
  if (config.default_low_stock_threshold < 0) {
    throw ConfigError("default_low_stock_threshold is negative");
  }
  if (config.command_endpoint.empty() != config.telemetry_endpoint.empty()) {
    throw ConfigError(
        "ipc.command_endpoint and ipc.telemetry_endpoint must be set together");
  }

  std::set<domain::LocationId> location_ids;
  for (const auto& location : config.locations) {
    if (location.id <= 0) {
      throw ConfigError("location id must be positive");
    }
    if (!location_ids.insert(location.id).second) {
      throw ConfigError("duplicate location id " + std::to_string(location.id));
    }
  }

  std::set<domain::ProductId> product_ids;
  for (const auto& product : config.products) {
    if (product.id <= 0) {
      throw ConfigError("product id must be positive");
    }
    if (product.low_stock_threshold < 0) {
      throw ConfigError("low_stock_threshold of product " +
                        std::to_string(product.id) + " is negative");
    }
    if (!product_ids.insert(product.id).second) {
      throw ConfigError("duplicate product id " + std::to_string(product.id));
    }
  }
}

}  // namespace

LedgerConfig parseLedgerConfig(const std::string& json_text) {
  LedgerConfig config;
  try {
    const json root = json::parse(json_text);
    if (!root.is_object()) {
      throw ConfigError("top level must be a JSON object");
    }

    config.default_page_size =
        readPositiveSize(root, "default_page_size", config.default_page_size);
    config.max_page_size =
        readPositiveSize(root, "max_page_size", config.max_page_size);
    config.max_batch_items =
        readPositiveSize(root, "max_batch_items", config.max_batch_items);
    config.low_stock_alerts =
        root.value("low_stock_alerts", config.low_stock_alerts);
    config.default_low_stock_threshold = root.value(
        "default_low_stock_threshold", config.default_low_stock_threshold);

    if (root.contains("ipc")) {
      const json& ipc = root.at("ipc");
      config.command_endpoint = ipc.value("command_endpoint", std::string{});
      config.telemetry_endpoint =
          ipc.value("telemetry_endpoint", std::string{});
    }

    if (root.contains("locations")) {
      for (const json& item : root.at("locations")) {
        domain::Location location;
        location.id = item.at("id").get<domain::LocationId>();
        location.name = item.value("name", std::string{});
        config.locations.push_back(location);
      }
    }

    if (root.contains("products")) {
      for (const json& item : root.at("products")) {
        domain::Product product;
        product.id = item.at("id").get<domain::ProductId>();
        product.name = item.value("name", std::string{});
        product.low_stock_threshold =
            item.value("low_stock_threshold",
                       config.default_low_stock_threshold);
        config.products.push_back(product);
      }
    }
  } catch (const json::exception& e) {
    throw ConfigError(e.what());
  }

  validate(config);
  return config;
}

LedgerConfig loadLedgerConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return parseLedgerConfig(buffer.str());
}

}  // namespace ledger
