#pragma once

#include "capital/domain/capital_transaction.hpp"
#include "capital/domain/kill_switch.hpp"
#include "capital/domain/position.hpp"
#include "capital/domain/trade_proposal.hpp"
#include "capital/events/event_types.hpp"

#include <cstdint>

namespace capital {

// -----------------------------------------------------------------------------
// Outbound events: published by the AllocationEngine
// -----------------------------------------------------------------------------
//
// @brief  Immutable copies of engine output for the execution, audit and
//         telemetry collaborators.
//
// @details
// Each carries a full value copy, never a reference into engine state, so a
// subscriber may keep it as long as it likes or hand it to another thread.
//
//   TradeProposalEvent       a cash-backed proposal ready for execution
//   BlockRecordEvent         a NEW block record (re-evaluations that hit an
//                            open block do not publish again)
//   CapitalTransactionEvent  one ledger audit entry
//   KillSwitchEvent          a switch tripped or was reset
//   PositionUpdateEvent      a position opened or closed
// -----------------------------------------------------------------------------
struct TradeProposalEvent {
  domain::TradeProposal proposal;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

struct BlockRecordEvent {
  domain::BlockRecord block;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

struct CapitalTransactionEvent {
  domain::CapitalTransaction transaction;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

struct KillSwitchEvent {
  domain::KillSwitch kill_switch;
  bool reset{false};  // false: tripped, true: manually reset
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

struct PositionUpdateEvent {
  domain::Position position;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace capital
