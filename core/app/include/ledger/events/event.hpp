#pragma once

#include "ledger/events/ledger_events.hpp"

#include <functional>
#include <variant>

namespace ledger {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// The single envelope for every notification the ledger emits. One variant
// lets one EventBus and one queue carry all kinds; subscribers pick their
// type with EventBus::subscribe<T>() or std::visit.
// -----------------------------------------------------------------------------
using Event = std::variant<
    StockAdjustedEvent,
    BatchCommittedEvent,
    BatchAbortedEvent,
    LowStockEvent,
    ProductStatusEvent>;

// Where services hand their events. LedgerEngine wires it to the
// notification loop; tests capture into a vector. An empty sink drops.
using EventSink = std::function<void(Event)>;

}  // namespace ledger
