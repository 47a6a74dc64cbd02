#pragma once

#include "agrovest/events/event_types.hpp"

#include <functional>
#include <variant>

namespace agrovest {

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// The single envelope carried by EventBus and EventLoopThread. Adding a new
// notification means adding it here and to every std::visit / get_if site
// that must handle it (IpcServer::formatTelemetry, the console audit log).
// -----------------------------------------------------------------------------
using Event = std::variant<
    PaymentConfirmedEvent,
    PaymentFailedEvent,
    InvestmentUpdateEvent,
    PaymentUpdateEvent,
    LedgerEntryEvent,
    InventoryUpdateEvent,
    WithdrawalUpdateEvent,
    ReconciliationAlertEvent>;

// Where components hand their post-commit notifications. The engine binds
// it to the audit loop's push(); tests bind it to a vector.
using EventSink = std::function<void(Event)>;

}  // namespace agrovest
