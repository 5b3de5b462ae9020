#pragma once

#include "capital/events/allocation_events.hpp"
#include "capital/events/event_types.hpp"
#include "capital/events/execution_events.hpp"

#include <variant>

namespace capital {

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// Closed set of everything that travels over an EventBus or a
// ThreadSafeQueue<Event>. Adding a new event type means adding it here and
// nowhere else; subscribers select alternatives with the typed subscribe().
// -----------------------------------------------------------------------------
using Event = std::variant<
    SignalBatchEvent,
    MarketSnapshotEvent,
    PnlUpdateEvent,
    HeartbeatEvent,
    ProposalFilledEvent,
    ProposalRejectedEvent,
    PositionClosedEvent,
    TrancheReleaseEvent,
    BlockCloseEvent,
    TradeProposalEvent,
    BlockRecordEvent,
    CapitalTransactionEvent,
    KillSwitchEvent,
    PositionUpdateEvent>;

}  // namespace capital
