#pragma once

#include "capital/concurrent/sequence_generator.hpp"
#include "capital/domain/position.hpp"
#include "capital/domain/trade_proposal.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace capital {

// -----------------------------------------------------------------------------
// PositionBook: OPEN and CLOSED positions for every account
// -----------------------------------------------------------------------------
//
// @brief  Records the positions that fills open and closes end, and answers
//         the exposure questions the guardrails ask.
//
// @details
// A Position belongs to exactly one account: the one whose proposal was
// filled. Positions are never merged across proposals; two fills in the same
// symbol for the same account are two Positions.
//
// P&L on close:
//   LONG   realized = (exit - entry) * quantity
//   SHORT  realized = (entry - exit) * quantity
//
// The Ledger is not touched here. The AllocationEngine first books the
// position's cost_basis and realizedPnl() with Ledger::returnToAvailable()
// and only then calls close(), so a close the Ledger refuses leaves the
// position OPEN.
//
// Thread model:
//   Writers (open, close, hydratePosition) take the exclusive lock; every
//   reader takes a shared lock and gets a copy. The sector exposure check
//   reads sectorNotional() while the engine holds the account's allocation
//   lock, so no other proposal for that account can change the answer
//   between evaluation and reservation.
//
// Ownership: owned by the AllocationEngine via std::unique_ptr.
// -----------------------------------------------------------------------------
class PositionBook {
 public:
  PositionBook() = default;

  PositionBook(const PositionBook&) = delete;
  PositionBook& operator=(const PositionBook&) = delete;
  PositionBook(PositionBook&&) = delete;
  PositionBook& operator=(PositionBook&&) = delete;

  // -------------------------------------------------------------------------
  // open(proposal, quantity, fill_price)
  // -------------------------------------------------------------------------
  // @brief  Opens a position for the proposal's account at the fill price.
  //
  // @details
  // Symbol, sector, direction, stop and target come from the proposal.
  // cost_basis = quantity * fill_price, the amount the Ledger deployed.
  // -------------------------------------------------------------------------
  domain::Position open(const domain::TradeProposal& proposal, double quantity,
                        double fill_price);

  // -------------------------------------------------------------------------
  // close(position_id, exit_price)
  // -------------------------------------------------------------------------
  // @brief  Marks an OPEN position CLOSED and computes its realized P&L.
  //
  // @return The closed position, or nullopt when the id is unknown or the
  //         position was already closed.
  // -------------------------------------------------------------------------
  std::optional<domain::Position> close(domain::PositionId position_id,
                                        double exit_price);

  // Signed P&L of closing pos at exit_price. Does not change the book.
  static double realizedPnl(const domain::Position& pos, double exit_price);

  // -------------------------------------------------------------------------
  // hydratePosition(pos)
  // -------------------------------------------------------------------------
  // @brief  Injects an existing OPEN position, e.g. carried over from a
  //         previous session.
  //
  // @details
  // A position id of 0 is replaced with a fresh one. The engine calls it at
  // startup for every position listed under an account in the
  // configuration, after the Ledger has deployed its cost basis.
  // -------------------------------------------------------------------------
  domain::Position hydratePosition(domain::Position pos);

  std::optional<domain::Position> position(domain::PositionId position_id) const;

  std::vector<domain::Position> openPositions(
      const std::string& account_id) const;

  // Sum of cost_basis over the account's OPEN positions in sector.
  double sectorNotional(const std::string& account_id,
                        const std::string& sector) const;

  std::size_t openCount(const std::string& account_id) const;

  // Copy of every position, open and closed, ordered by id.
  std::vector<domain::Position> getSnapshots() const;

 private:
  SequenceGenerator position_ids_;

  mutable std::shared_mutex mutex_;
  std::map<domain::PositionId, domain::Position> positions_;
};

}  // namespace capital
