#pragma once

#include "ledger/domain/adjustment_log_entry.hpp"
#include "ledger/domain/adjustment_type.hpp"
#include "ledger/domain/ids.hpp"
#include "ledger/domain/stock_level.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ledger {

// -----------------------------------------------------------------------------
// Ledger notification events
// -----------------------------------------------------------------------------
// Responsibility: Value types emitted by the services after a commit (or an
// abort) and carried through the notification EventLoopThread to
// LowStockMonitor and the IPC telemetry publisher.
//
// Emission rules:
// - Published only after the store lock is released; subscribers may read
//   the store freely.
// - A StockAdjustedEvent exists only for entries that are durably
//   committed. An aborted batch produces exactly one BatchAbortedEvent and
//   no StockAdjustedEvent.
// -----------------------------------------------------------------------------

// One committed quantity change. Emitted for single adjustments and for
// every line of a committed batch.
//
// product_totals is set on the last line of each product within a commit
// and holds that product's total across locations around the whole commit.
// A transfer's two lines therefore report one net change, not a dip.
struct StockAdjustedEvent {
  domain::AdjustmentLogEntry entry;
  domain::Quantity new_quantity{0};
  domain::Version new_version{0};
  std::optional<domain::ProductTotals> product_totals;
};

// A batch committed as a whole.
struct BatchCommittedEvent {
  std::string transaction_id;
  std::string reference;
  domain::AdjustmentType type{domain::AdjustmentType::Adjustment};
  domain::UserId user_id{0};
  std::size_t item_count{0};
  std::int64_t timestamp_ms{0};
};

// A batch rolled back. failed_item_index is zero-based.
struct BatchAbortedEvent {
  std::string transaction_id;
  std::string reference;
  domain::AdjustmentType type{domain::AdjustmentType::Adjustment};
  domain::UserId user_id{0};
  std::size_t failed_item_index{0};
  std::string error_kind;
  std::string reason;
  std::int64_t timestamp_ms{0};
};

// Total stock of a monitored product fell to or below its threshold.
struct LowStockEvent {
  domain::ProductId product_id{0};
  std::string product_name;
  domain::Quantity total_quantity{0};
  domain::Quantity threshold{0};
  std::int64_t timestamp_ms{0};
};

// A product was archived or restored.
struct ProductStatusEvent {
  domain::ProductId product_id{0};
  bool archived{false};
  domain::UserId user_id{0};
  std::int64_t timestamp_ms{0};
};

}  // namespace ledger
