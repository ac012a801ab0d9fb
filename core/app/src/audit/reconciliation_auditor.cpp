#include "ledger/audit/reconciliation_auditor.hpp"

#include <iostream>
#include <map>

namespace ledger {

ReconciliationReport ReconciliationAuditor::audit() const {
  const AuditView view = store_.auditView();

  // Union of pairs that have a row and pairs that have history.
  std::map<domain::StockKey, Discrepancy> pairs;
  for (const auto& row : view.rows) {
    Discrepancy& d = pairs[row.key()];
    d.key = row.key();
    d.row_quantity = row.quantity;
  }
  for (const auto& [key, total] : view.log_totals) {
    Discrepancy& d = pairs[key];
    d.key = key;
    d.log_total = total;
  }

  ReconciliationReport report;
  report.pairs_checked = pairs.size();
  for (const auto& [key, pair] : pairs) {
    if (pair.row_quantity != pair.log_total) {
      report.discrepancies.push_back(pair);
    }
  }

  if (!report.reconciled()) {
    std::cerr << "[ReconciliationAuditor] WARNING: "
              << report.discrepancies.size() << " of " << report.pairs_checked
              << " pairs do not match their history\n";
  }
  return report;
}

}  // namespace ledger
