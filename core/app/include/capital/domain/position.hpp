#pragma once

#include "capital/domain/signal.hpp"

#include <cstdint>
#include <string>

namespace capital {
namespace domain {

using PositionId = std::uint64_t;

enum class PositionStatus {
  Open,
  Closed,
};

// -----------------------------------------------------------------------------
// Position: one filled trade held by one account
// -----------------------------------------------------------------------------
//
// @brief  Tracks quantity, entry and exit levels of a single position.
//
// @details
// A position belongs exclusively to the account that opened it. It is created
// by PositionBook::open() when a TradeProposal is filled and becomes CLOSED
// exactly once, at which point realized_pnl is fixed:
//
//   LONG:  quantity * (exit_price - entry_price)
//   SHORT: quantity * (entry_price - exit_price)
//
// cost_basis is the cash the Ledger moved into deployed_cash for this
// position. On close the same amount is returned to available_cash together
// with realized_pnl.
//
// Value type. The authoritative copy lives inside PositionBook; snapshots
// handed out are copies.
// -----------------------------------------------------------------------------
struct Position {
  PositionId id{0};
  std::string account_id;
  std::string symbol;
  std::string sector;
  Direction direction{Direction::Long};
  double quantity{0.0};
  double entry_price{0.0};
  double stop_loss{0.0};
  double take_profit{0.0};
  double cost_basis{0.0};
  PositionStatus status{PositionStatus::Open};
  double exit_price{0.0};
  double realized_pnl{0.0};

  double notional() const { return quantity * entry_price; }
};

}  // namespace domain
}  // namespace capital
