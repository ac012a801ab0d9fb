#pragma once

#include "ledger/domain/catalog.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace ledger {

// -----------------------------------------------------------------------------
// LedgerConfig — engine-wide settings
// -----------------------------------------------------------------------------
//
// @brief  Everything LedgerEngine needs at construction: paging limits,
//         batch limits, IPC endpoints and the catalog to seed.
//
// @details
// Loaded once from a JSON file by loadLedgerConfig() and then copied by
// value into the engine. Nothing reads it after start(), so no
// synchronization is needed.
//
// Defaults mirror the behaviour the collaborator HTTP layer expects:
// 50 log entries per page unless asked otherwise, never more than 100.
//
// Empty endpoints disable the IPC server (tests run that way).
// -----------------------------------------------------------------------------
struct LedgerConfig {
  std::size_t default_page_size{50};
  std::size_t max_page_size{100};
  std::size_t max_batch_items{500};
  bool low_stock_alerts{true};

  // Applied to configured products that do not name their own threshold.
  // 0 leaves them unmonitored.
  domain::Quantity default_low_stock_threshold{0};

  std::string command_endpoint;    // e.g. "tcp://127.0.0.1:5556"
  std::string telemetry_endpoint;  // e.g. "tcp://127.0.0.1:5557"

  std::vector<domain::Location> locations;
  std::vector<domain::Product> products;
};

// Malformed or inconsistent configuration. Not a LedgerError: it happens
// before any ledger operation and is fatal for startup.
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& message)
      : std::runtime_error("config: " + message) {}
};

// Parses JSON text. Missing keys keep their defaults.
// Throws ConfigError on syntax errors, wrong types or invalid values.
LedgerConfig parseLedgerConfig(const std::string& json_text);

// Reads path and forwards to parseLedgerConfig().
LedgerConfig loadLedgerConfig(const std::string& path);

}  // namespace ledger
