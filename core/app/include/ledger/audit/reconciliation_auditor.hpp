#pragma once

#include "ledger/domain/ids.hpp"
#include "ledger/store/i_ledger_store.hpp"

#include <cstddef>
#include <vector>

namespace ledger {

// A pair whose row disagrees with its history.
struct Discrepancy {
  domain::StockKey key;
  domain::Quantity row_quantity{0};  // 0 when the pair has entries but no row
  domain::Quantity log_total{0};
};

struct ReconciliationReport {
  std::size_t pairs_checked{0};
  std::vector<Discrepancy> discrepancies;

  bool reconciled() const { return discrepancies.empty(); }
};

// -----------------------------------------------------------------------------
// ReconciliationAuditor — on-demand check of the ledger's core property
// -----------------------------------------------------------------------------
//
// @brief  Verifies that for every (product, location) the sum of log deltas
//         equals StockLevel.quantity.
//
// @details
// StockLevel.quantity is the source of truth for reads; the log is the
// audit trail. This auditor is the explicit, on-demand check that the two
// never drift apart. It reads rows and log totals under one store read lock
// (ILedgerStore::auditView), so a commit in flight can never show up as a
// false discrepancy.
//
// Every pair that has a row or at least one log entry is checked. A
// non-empty report means the store was corrupted outside the adjustment
// path; the engine logs it at WARNING level and never repairs it itself.
//
// Thread model: any thread.
// -----------------------------------------------------------------------------
class ReconciliationAuditor {
 public:
  explicit ReconciliationAuditor(const ILedgerStore& store) : store_(store) {}

  ReconciliationReport audit() const;

 private:
  const ILedgerStore& store_;
};

}  // namespace ledger
