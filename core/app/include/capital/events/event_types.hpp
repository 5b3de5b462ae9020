#pragma once

#include "capital/domain/market_snapshot.hpp"
#include "capital/domain/signal.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace capital {

using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// Inbound events: pushed by collaborators into the allocation loop
// -----------------------------------------------------------------------------

// A batch of ranked signals from the signal generator. The engine runs every
// active account against the whole batch.
struct SignalBatchEvent {
  std::vector<domain::Signal> signals;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// Latest market inputs for one symbol (price, ATR, ADV, regime, events).
struct MarketSnapshotEvent {
  domain::MarketSnapshot snapshot;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// P&L push from the P&L collaborator. Drives the KillSwitchMonitor.
//   realized_daily_pnl  Realized P&L since the start of the trading day.
//   unrealized_pnl      Mark-to-market P&L of all OPEN positions.
struct PnlUpdateEvent {
  std::string account_id;
  double realized_daily_pnl{0.0};
  double unrealized_pnl{0.0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// Liveness tick. The engine sweeps expired reservations on every heartbeat.
struct HeartbeatEvent {
  std::string component_id;
  std::string status;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace capital
