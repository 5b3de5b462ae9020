#pragma once

#include "capital/domain/position.hpp"
#include "capital/domain/trade_proposal.hpp"
#include "capital/events/event_types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace capital {

// -----------------------------------------------------------------------------
// Execution-side notices
// -----------------------------------------------------------------------------
//
// @brief  What the execution collaborator tells the engine about proposals
//         it was handed.
//
// @details
// The engine does not place orders or track fills itself. It only needs to
// know the outcome of each TradeProposal so the Ledger can move the
// reservation onward:
//
//   ProposalFilledEvent    reserved → deployed, position opened
//   ProposalRejectedEvent  reserved → available (approver or broker said no)
//   PositionClosedEvent    deployed → available, realized P&L booked
//   TrancheReleaseEvent    a later tranche's release condition is met
//   BlockCloseEvent        the blocked (signal, account) pair may be
//                          evaluated again
//
// A fill that arrives after the reservation's TTL is stale; the engine
// discards the proposal and logs it instead of deploying.
// -----------------------------------------------------------------------------
struct ProposalFilledEvent {
  domain::ProposalId proposal_id{0};
  double filled_quantity{0.0};
  double fill_price{0.0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

struct ProposalRejectedEvent {
  domain::ProposalId proposal_id{0};
  std::string reason;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

struct PositionClosedEvent {
  domain::PositionId position_id{0};
  double exit_price{0.0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// Releases one deferred tranche of a split proposal. proposal_id is the
// proposal that carried the first tranche; tranche_index counts from 0.
struct TrancheReleaseEvent {
  domain::ProposalId proposal_id{0};
  std::size_t tranche_index{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

struct BlockCloseEvent {
  domain::BlockId block_id{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace capital
