#include "ledger/orders/i_order_source.hpp"

namespace ledger {

void InMemoryOrderSource::putOrder(const domain::Order& order) {
  std::lock_guard lock(mutex_);
  orders_[order.reference] = order;
}

bool InMemoryOrderSource::removeOrder(const std::string& reference) {
  std::lock_guard lock(mutex_);
  return orders_.erase(reference) > 0;
}

std::optional<domain::Order> InMemoryOrderSource::findOrder(
    const std::string& reference) const {
  std::lock_guard lock(mutex_);
  auto it = orders_.find(reference);
  if (it == orders_.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace ledger
