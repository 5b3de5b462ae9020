#pragma once

#include "capital/domain/guardrail_result.hpp"
#include "capital/domain/signal.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace capital {
namespace domain {

using ProposalId = std::uint64_t;
using ReservationId = std::uint64_t;
using BlockId = std::uint64_t;

// -----------------------------------------------------------------------------
// Tranche: one staged leg of a sized position
// -----------------------------------------------------------------------------
// Only the first tranche is backed by a reservation when the proposal is
// emitted. A later tranche is released by a TrancheReleaseEvent or, once
// delay_days have passed, by the heartbeat sweep. It is then sized again
// against deployable cash and reserved as a follow-on proposal of its own.
// -----------------------------------------------------------------------------
struct Tranche {
  double quantity{0.0};
  int delay_days{0};
  std::string release_condition;
};

// -----------------------------------------------------------------------------
// TradeProposal: output handed to the trade-card / execution collaborator
// -----------------------------------------------------------------------------
//
// @brief  A sized, guardrail-checked and cash-backed trade for one account.
//
// @details
// Emitted only when the GuardrailResult has no critical failure and the
// Ledger accepted the reservation. reserved_amount is what was moved from
// available_cash to reserved_cash; reservation_id is needed to deploy or
// release it. The reservation expires at expires_at_ms, after which a late
// fill is rejected as stale.
//
// quantity is what the executor may fill against this reservation: the
// first tranche of a split, or a released later tranche.
// planned_quantity is the total across every leg, the figure the guardrails
// evaluated. tranches lists every leg including the first. A follow-on
// proposal has parent_id set to the proposal that carried tranche 0.
// -----------------------------------------------------------------------------
struct TradeProposal {
  ProposalId id{0};
  std::string account_id;
  std::string signal_id;
  std::string symbol;
  std::string sector;
  Direction direction{Direction::Long};

  double quantity{0.0};
  double planned_quantity{0.0};
  std::vector<Tranche> tranches;
  std::size_t tranche_index{0};
  ProposalId parent_id{0};

  double entry_price{0.0};
  double stop_loss{0.0};
  double take_profit{0.0};

  double risk_amount{0.0};
  double reward_amount{0.0};
  double score{0.0};

  double reserved_amount{0.0};
  ReservationId reservation_id{0};
  std::int64_t expires_at_ms{0};

  GuardrailResult guardrails;
};

// -----------------------------------------------------------------------------
// BlockRecord: why a (signal, account) pair was refused
// -----------------------------------------------------------------------------
// Stays open until the execution layer (or an operator) closes it. While
// open, re-evaluating the same pair returns this record instead of creating
// a duplicate.
// -----------------------------------------------------------------------------
struct BlockRecord {
  BlockId id{0};
  std::string account_id;
  std::string signal_id;
  std::string symbol;
  std::vector<std::string> reason_codes;
  std::int64_t created_at_ms{0};
  bool open{true};
};

}  // namespace domain
}  // namespace capital
