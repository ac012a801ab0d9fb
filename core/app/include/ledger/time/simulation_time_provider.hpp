#pragma once

#include "ledger/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace ledger {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — caller-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose current time only moves when told to.
//
// @details
// Log history queries depend on timestamps: snapshotAt(t) sums the deltas of
// entries stamped at or before t, and queryLog() orders by timestamp. Tests
// pin the clock with set_time(), perform adjustments, move it with
// advance_by(), and then assert exact snapshot values.
//
// Storage is a std::atomic<int64_t> so request threads may read while a
// test thread moves the clock, without a mutex on the adjustment path.
//
// Thread model:
//   now_ms() from any thread. set_time()/advance_by() from any thread,
//   normally a single test or harness thread.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Sets the clock to an absolute value. Going backwards is allowed; log
  // ordering then falls back to commit order for equal timestamps only.
  void set_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms and returns the new value.
  std::int64_t advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace ledger
