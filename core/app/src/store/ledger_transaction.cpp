#include "ledger/store/ledger_transaction.hpp"
#include "ledger/errors/ledger_errors.hpp"

#include <stdexcept>
#include <utility>

namespace ledger {

LedgerTransaction::LedgerTransaction(ILedgerStore& store,
                                     std::string transaction_id)
    : store_(store), transaction_id_(std::move(transaction_id)) {}

// -----------------------------------------------------------------------------
// Destructor: an open unit that goes out of scope is rolled back. Nothing
// was written to the store yet, so rolling back means dropping the staging.
// -----------------------------------------------------------------------------
LedgerTransaction::~LedgerTransaction() {
  if (status_ == domain::BatchStatus::Open) {
    abort();
  }
}

void LedgerTransaction::requireOpen(const char* operation) const {
  if (status_ != domain::BatchStatus::Open) {
    throw std::logic_error(std::string("LedgerTransaction::") + operation +
                           " on a " +
                           domain::batchStatusToString(status_) + " unit");
  }
}

// -----------------------------------------------------------------------------
// readStockLevel: staged state first, store second
// -----------------------------------------------------------------------------
std::optional<domain::StockLevel> LedgerTransaction::readStockLevel(
    const domain::StockKey& key) {
  requireOpen("readStockLevel");

  auto it = rows_.find(key);
  if (it == rows_.end()) {
    StagedRow staged;
    std::optional<domain::StockLevel> stored = store_.findStockLevel(key);
    if (stored) {
      staged.read_version = stored->version;
      staged.current = *stored;
    } else {
      staged.current.product_id = key.product_id;
      staged.current.location_id = key.location_id;
    }
    it = rows_.emplace(key, staged).first;
    row_order_.push_back(key);
  }

  // version 0 marks a pair that has no row yet.
  if (it->second.current.version == 0) {
    return std::nullopt;
  }
  return it->second.current;
}

std::optional<domain::Product> LedgerTransaction::findProduct(
    domain::ProductId product_id) const {
  return store_.findProduct(product_id);
}

domain::Product LedgerTransaction::requireProduct(
    domain::ProductId product_id) const {
  std::optional<domain::Product> product = store_.findProduct(product_id);
  if (!product) {
    throw ProductNotFoundError(product_id);
  }
  if (product->archived) {
    throw ProductNotFoundError(product_id, true);
  }
  return *product;
}

domain::Location LedgerTransaction::requireLocation(
    domain::LocationId location_id) const {
  std::optional<domain::Location> location = store_.findLocation(location_id);
  if (!location) {
    throw LocationNotFoundError(location_id);
  }
  return *location;
}

// -----------------------------------------------------------------------------
// Staging
// -----------------------------------------------------------------------------
void LedgerTransaction::stageStockLevel(const domain::StockLevel& next) {
  requireOpen("stageStockLevel");

  auto it = rows_.find(next.key());
  if (it == rows_.end()) {
    throw std::logic_error(
        "LedgerTransaction::stageStockLevel on a row that was never read");
  }
  if (next.version != it->second.current.version + 1) {
    throw std::logic_error(
        "LedgerTransaction::stageStockLevel must advance the version by one");
  }
  it->second.current = next;
  it->second.dirty = true;
}

void LedgerTransaction::stageLogEntry(domain::AdjustmentLogEntry entry) {
  requireOpen("stageLogEntry");
  entry.id = 0;
  entry.transaction_id = transaction_id_;
  entries_.push_back(std::move(entry));
}

void LedgerTransaction::stageProductFlag(domain::ProductId product_id,
                                         bool archived) {
  requireOpen("stageProductFlag");
  flags_.push_back(ProductFlagWrite{product_id, archived});
}

// -----------------------------------------------------------------------------
// commit: one ChangeSet, one conditional store write
// -----------------------------------------------------------------------------
CommitReceipt LedgerTransaction::commit() {
  requireOpen("commit");

  ChangeSet changes;
  for (const domain::StockKey& key : row_order_) {
    const StagedRow& staged = rows_.at(key);
    if (!staged.dirty) {
      continue;
    }
    // Several staged mutations of one row collapse into a single write that
    // is conditioned on the version first read. Each mutation still counted
    // one version step.
    changes.row_writes.push_back(RowWrite{key, staged.read_version,
                                          staged.current.quantity,
                                          staged.current.version});
  }
  changes.log_entries = entries_;
  changes.product_flags = flags_;

  try {
    CommitReceipt receipt = store_.commit(changes);
    status_ = domain::BatchStatus::Committed;
    return receipt;
  } catch (const LedgerError&) {
    abort();
    throw;
  }
}

void LedgerTransaction::abort() {
  if (status_ == domain::BatchStatus::Committed) {
    throw std::logic_error("LedgerTransaction::abort on a COMMITTED unit");
  }
  status_ = domain::BatchStatus::Aborted;
  rows_.clear();
  row_order_.clear();
  entries_.clear();
  flags_.clear();
}

}  // namespace ledger
