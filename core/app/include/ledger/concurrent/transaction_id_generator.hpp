#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace ledger {

// -----------------------------------------------------------------------------
// TransactionIdGenerator — unique ids for batch transactions
// -----------------------------------------------------------------------------
//
// @brief  Produces "txn_<timestamp_ms>_<sequence>" strings.
//
// @details
// The sequence part comes from a lock-free atomic counter, so two batches
// started in the same millisecond on different threads still get different
// ids. The timestamp part keeps ids from different process runs apart and
// makes them sortable by eye in the audit trail.
//
// memory_order_relaxed is enough: only uniqueness of the counter value
// matters, not ordering relative to other memory operations.
//
// Thread model:
//   next() is safe from any thread. One instance per BatchTransactionService.
// -----------------------------------------------------------------------------
class TransactionIdGenerator {
 public:
  TransactionIdGenerator() = default;

  TransactionIdGenerator(const TransactionIdGenerator&) = delete;
  TransactionIdGenerator& operator=(const TransactionIdGenerator&) = delete;

  std::string next(std::int64_t now_ms) {
    const std::uint64_t seq = next_seq_.fetch_add(1, std::memory_order_relaxed);
    return "txn_" + std::to_string(now_ms) + "_" + std::to_string(seq);
  }

 private:
  std::atomic<std::uint64_t> next_seq_{1};
};

}  // namespace ledger
