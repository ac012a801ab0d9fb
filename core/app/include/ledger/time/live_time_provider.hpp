#pragma once

#include "ledger/time/i_time_provider.hpp"

namespace ledger {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall clock for production runs
// -----------------------------------------------------------------------------
// Reads std::chrono::system_clock. No state, so no synchronization.
// Created in main() and lent to LedgerEngine.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace ledger
