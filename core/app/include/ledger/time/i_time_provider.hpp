#pragma once

#include <cstdint>

namespace ledger {

// -----------------------------------------------------------------------------
// ITimeProvider — source of "now" for log entry timestamps
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual clock interface. Every AdjustmentLogEntry and every
//         notification event is stamped through it.
//
// @details
// Services never call std::chrono directly. They receive
// `const ITimeProvider&` and call now_ms() when they build a log entry:
//   - LiveTimeProvider       → wall clock, used by the stock_ledger binary.
//   - SimulationTimeProvider → value set by the caller, used by tests that
//                              need snapshotAt() and log ordering to be
//                              deterministic.
//
// Milliseconds since the Unix epoch as int64_t is also the JSON wire form
// (timestamp_ms) used by the IPC server, so no conversion is needed at the
// boundary.
//
// Thread-safety contract:
//   Implementations must be safe for concurrent now_ms() calls from every
//   request thread.
//
// Ownership:
//   Borrowed by const reference. The provider outlives every service that
//   holds it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Milliseconds since 1970-01-01 00:00:00 UTC.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace ledger
