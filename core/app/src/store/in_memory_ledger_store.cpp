#include "ledger/store/in_memory_ledger_store.hpp"
#include "ledger/errors/ledger_errors.hpp"

#include <algorithm>
#include <mutex>
#include <unordered_set>

namespace ledger {

namespace {

// Newest first: later timestamp wins, ties broken by the later commit.
bool newerThan(const domain::AdjustmentLogEntry* a,
               const domain::AdjustmentLogEntry* b) {
  if (a->timestamp_ms != b->timestamp_ms) {
    return a->timestamp_ms > b->timestamp_ms;
  }
  return a->id > b->id;
}

}  // namespace

// -----------------------------------------------------------------------------
// Stock row reads
// -----------------------------------------------------------------------------
std::optional<domain::StockLevel> InMemoryLedgerStore::findStockLevel(
    const domain::StockKey& key) const {
  std::shared_lock lock(mutex_);
  auto it = rows_.find(key);
  if (it == rows_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::StockLevel> InMemoryLedgerStore::stockLevelsForProduct(
    domain::ProductId product_id) const {
  std::vector<domain::StockLevel> result;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [key, row] : rows_) {
      if (key.product_id == product_id) {
        result.push_back(row);
      }
    }
  }
  std::sort(result.begin(), result.end(),
            [](const domain::StockLevel& a, const domain::StockLevel& b) {
              return a.location_id < b.location_id;
            });
  return result;
}

std::vector<domain::StockLevel> InMemoryLedgerStore::allStockLevels() const {
  std::vector<domain::StockLevel> result;
  {
    std::shared_lock lock(mutex_);
    result.reserve(rows_.size());
    for (const auto& [key, row] : rows_) {
      result.push_back(row);
    }
  }
  std::sort(result.begin(), result.end(),
            [](const domain::StockLevel& a, const domain::StockLevel& b) {
              return a.key() < b.key();
            });
  return result;
}

// -----------------------------------------------------------------------------
// Catalog
// -----------------------------------------------------------------------------
std::optional<domain::Product> InMemoryLedgerStore::findProduct(
    domain::ProductId product_id) const {
  std::shared_lock lock(mutex_);
  auto it = products_.find(product_id);
  if (it == products_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<domain::Location> InMemoryLedgerStore::findLocation(
    domain::LocationId location_id) const {
  std::shared_lock lock(mutex_);
  auto it = locations_.find(location_id);
  if (it == locations_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Product> InMemoryLedgerStore::allProducts() const {
  std::vector<domain::Product> result;
  {
    std::shared_lock lock(mutex_);
    result.reserve(products_.size());
    for (const auto& [id, product] : products_) {
      result.push_back(product);
    }
  }
  std::sort(result.begin(), result.end(),
            [](const domain::Product& a, const domain::Product& b) {
              return a.id < b.id;
            });
  return result;
}

void InMemoryLedgerStore::upsertProduct(const domain::Product& product) {
  std::unique_lock lock(mutex_);
  auto it = products_.find(product.id);
  if (it == products_.end()) {
    products_.emplace(product.id, product);
    return;
  }
  const bool archived = it->second.archived;
  it->second = product;
  it->second.archived = archived;
}

void InMemoryLedgerStore::upsertLocation(const domain::Location& location) {
  std::unique_lock lock(mutex_);
  locations_[location.id] = location;
}

// -----------------------------------------------------------------------------
// purgeProduct: cascade delete of rows and history
// -----------------------------------------------------------------------------
bool InMemoryLedgerStore::purgeProduct(domain::ProductId product_id) {
  std::unique_lock lock(mutex_);
  if (products_.erase(product_id) == 0) {
    return false;
  }

  for (auto it = rows_.begin(); it != rows_.end();) {
    if (it->first.product_id == product_id) {
      it = rows_.erase(it);
    } else {
      ++it;
    }
  }

  log_.erase(std::remove_if(log_.begin(), log_.end(),
                            [product_id](const domain::AdjustmentLogEntry& e) {
                              return e.product_id == product_id;
                            }),
             log_.end());
  return true;
}

// -----------------------------------------------------------------------------
// commit: validate everything, then apply everything
// -----------------------------------------------------------------------------
CommitReceipt InMemoryLedgerStore::commit(const ChangeSet& changes) {
  CommitReceipt receipt;
  if (changes.empty()) {
    return receipt;
  }

  std::unique_lock lock(mutex_);
  validateLocked(changes);

  // Reserve up front so the apply phase below cannot fail half way.
  log_.reserve(log_.size() + changes.log_entries.size());
  receipt.log_entries.reserve(changes.log_entries.size());
  receipt.rows.reserve(changes.row_writes.size());
  receipt.product_totals = totalsBeforeLocked(changes);

  for (const RowWrite& write : changes.row_writes) {
    for (domain::ProductTotals& totals : receipt.product_totals) {
      if (totals.product_id == write.key.product_id) {
        auto it = rows_.find(write.key);
        totals.after += write.new_quantity -
                        (it == rows_.end() ? 0 : it->second.quantity);
      }
    }
    domain::StockLevel& row = rows_[write.key];
    row.product_id = write.key.product_id;
    row.location_id = write.key.location_id;
    row.quantity = write.new_quantity;
    row.version = write.new_version;
    receipt.rows.push_back(row);
  }

  for (const ProductFlagWrite& flag : changes.product_flags) {
    products_[flag.product_id].archived = flag.archived;
  }

  for (const domain::AdjustmentLogEntry& staged : changes.log_entries) {
    domain::AdjustmentLogEntry entry = staged;
    entry.id = next_log_id_++;
    log_.push_back(entry);
    receipt.log_entries.push_back(std::move(entry));
  }

  return receipt;
}

std::vector<domain::ProductTotals> InMemoryLedgerStore::totalsBeforeLocked(
    const ChangeSet& changes) const {
  std::vector<domain::ProductTotals> totals;
  for (const RowWrite& write : changes.row_writes) {
    const domain::ProductId product_id = write.key.product_id;
    bool known = false;
    for (const domain::ProductTotals& t : totals) {
      known = known || t.product_id == product_id;
    }
    if (known) {
      continue;
    }
    domain::Quantity total = 0;
    for (const auto& [key, row] : rows_) {
      if (key.product_id == product_id) {
        total += row.quantity;
      }
    }
    totals.push_back(domain::ProductTotals{product_id, total, total});
  }
  return totals;
}

void InMemoryLedgerStore::validateLocked(const ChangeSet& changes) const {
  std::unordered_set<domain::StockKey, domain::StockKeyHash> seen;

  for (const RowWrite& write : changes.row_writes) {
    if (!seen.insert(write.key).second) {
      throw StorageError("duplicate row write for productId=" +
                         std::to_string(write.key.product_id) +
                         " at locationId=" +
                         std::to_string(write.key.location_id));
    }
    requireLiveProductLocked(write.key.product_id);
    requireLocationLocked(write.key.location_id);

    auto it = rows_.find(write.key);
    const domain::Version current =
        (it == rows_.end()) ? 0 : it->second.version;
    if (current != write.read_version) {
      throw OptimisticLockError(write.key.product_id, write.key.location_id,
                                current, write.read_version);
    }
    if (write.new_quantity < 0) {
      throw StorageError("negative quantity rejected for productId=" +
                         std::to_string(write.key.product_id) +
                         " at locationId=" +
                         std::to_string(write.key.location_id));
    }
    if (write.new_version <= write.read_version) {
      throw StorageError("row version must advance on every write");
    }
  }

  for (const ProductFlagWrite& flag : changes.product_flags) {
    auto it = products_.find(flag.product_id);
    if (it == products_.end()) {
      throw ProductNotFoundError(flag.product_id);
    }
    // A concurrent archive/restore already flipped the flag.
    if (it->second.archived == flag.archived) {
      throw InvalidAdjustmentError(
          "productId=" + std::to_string(flag.product_id) +
          (flag.archived ? " is already archived" : " is not archived"));
    }
    requireMarkerPerRowLocked(changes, flag);
  }

  for (const domain::AdjustmentLogEntry& entry : changes.log_entries) {
    if (domain::isMarkerType(entry.type)) {
      if (entry.delta != 0) {
        throw StorageError("marker log entries must carry delta 0");
      }
      if (products_.find(entry.product_id) == products_.end()) {
        throw ProductNotFoundError(entry.product_id);
      }
    } else {
      requireLiveProductLocked(entry.product_id);
    }
    requireLocationLocked(entry.location_id);
  }
}

// A row created after the writer listed the product's rows has no marker in
// the ChangeSet; the flip must then be redone against the current rows.
void InMemoryLedgerStore::requireMarkerPerRowLocked(
    const ChangeSet& changes, const ProductFlagWrite& flag) const {
  const domain::AdjustmentType marker = flag.archived
                                            ? domain::AdjustmentType::Archive
                                            : domain::AdjustmentType::Restore;
  for (const auto& [key, row] : rows_) {
    if (key.product_id != flag.product_id) {
      continue;
    }
    const bool covered = std::any_of(
        changes.log_entries.begin(), changes.log_entries.end(),
        [&key, marker](const domain::AdjustmentLogEntry& entry) {
          return entry.type == marker && entry.product_id == key.product_id &&
                 entry.location_id == key.location_id;
        });
    if (!covered) {
      throw OptimisticLockError(key.product_id, key.location_id, row.version,
                                0);
    }
  }
}

void InMemoryLedgerStore::requireLiveProductLocked(
    domain::ProductId product_id) const {
  auto it = products_.find(product_id);
  if (it == products_.end()) {
    throw ProductNotFoundError(product_id);
  }
  if (it->second.archived) {
    throw ProductNotFoundError(product_id, true);
  }
}

void InMemoryLedgerStore::requireLocationLocked(
    domain::LocationId location_id) const {
  if (locations_.find(location_id) == locations_.end()) {
    throw LocationNotFoundError(location_id);
  }
}

// -----------------------------------------------------------------------------
// Audit trail reads
// -----------------------------------------------------------------------------
LogSlice InMemoryLedgerStore::queryLog(const LogFilter& filter,
                                       std::size_t offset,
                                       std::size_t limit) const {
  LogSlice slice;
  std::shared_lock lock(mutex_);

  std::vector<const domain::AdjustmentLogEntry*> matches;
  for (const auto& entry : log_) {
    if (filter.matches(entry)) {
      matches.push_back(&entry);
    }
  }
  std::sort(matches.begin(), matches.end(), newerThan);

  slice.total = matches.size();
  if (offset >= matches.size()) {
    return slice;
  }
  const std::size_t end = limit < matches.size() - offset
                              ? offset + limit
                              : matches.size();
  slice.entries.reserve(end - offset);
  for (std::size_t i = offset; i < end; ++i) {
    slice.entries.push_back(*matches[i]);
  }
  return slice;
}

std::map<domain::StockKey, domain::Quantity> InMemoryLedgerStore::deltaTotalsAt(
    std::int64_t at_ms) const {
  std::map<domain::StockKey, domain::Quantity> totals;
  std::shared_lock lock(mutex_);
  for (const auto& entry : log_) {
    if (entry.timestamp_ms <= at_ms) {
      totals[domain::StockKey{entry.product_id, entry.location_id}] +=
          entry.delta;
    }
  }
  return totals;
}

AuditView InMemoryLedgerStore::auditView() const {
  AuditView view;
  std::shared_lock lock(mutex_);
  view.rows.reserve(rows_.size());
  for (const auto& [key, row] : rows_) {
    view.rows.push_back(row);
  }
  for (const auto& entry : log_) {
    view.log_totals[domain::StockKey{entry.product_id, entry.location_id}] +=
        entry.delta;
  }
  return view;
}

std::size_t InMemoryLedgerStore::logSize() const {
  std::shared_lock lock(mutex_);
  return log_.size();
}

}  // namespace ledger
