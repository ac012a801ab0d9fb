#pragma once

#include "ledger/domain/order.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace ledger {

// -----------------------------------------------------------------------------
// IOrderSource — where orders to fulfil come from
// -----------------------------------------------------------------------------
//
// @brief  Looks up an order by its external reference so
//         OrderFulfillmentService can turn it into a batch.
//
// @details
// The ledger does not store orders. A shop import, a webhook handler or a
// test fixture implements this interface and keeps ownership of the data.
//
// Ownership:
//   LedgerEngine receives a non-owning IOrderSource* at construction. The
//   caller keeps the source alive for the engine's lifetime. nullptr turns
//   order fulfillment off.
//
// Thread model:
//   findOrder() may be called concurrently from request threads.
// -----------------------------------------------------------------------------
class IOrderSource {
 public:
  virtual ~IOrderSource() = default;

  // std::nullopt if no order with that reference exists.
  virtual std::optional<domain::Order> findOrder(
      const std::string& reference) const = 0;
};

// -----------------------------------------------------------------------------
// InMemoryOrderSource — map-backed order source for tests and demos
// -----------------------------------------------------------------------------
class InMemoryOrderSource final : public IOrderSource {
 public:
  // Inserts or replaces by reference.
  void putOrder(const domain::Order& order);

  // Returns false if nothing was removed.
  bool removeOrder(const std::string& reference);

  std::optional<domain::Order> findOrder(
      const std::string& reference) const override;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, domain::Order> orders_;
};

}  // namespace ledger
