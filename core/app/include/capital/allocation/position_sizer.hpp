#pragma once

#include "capital/allocation/playbook.hpp"
#include "capital/domain/account.hpp"
#include "capital/domain/mandate.hpp"
#include "capital/domain/market_snapshot.hpp"
#include "capital/domain/risk_limits.hpp"
#include "capital/domain/signal.hpp"
#include "capital/domain/trade_proposal.hpp"

#include <vector>

namespace capital {

// Which cap produced the final quantity.
enum class BindingConstraint {
  RiskBudget,       // max_risk_per_trade% of capital / risk per unit
  MaxPositionSize,  // mandate position cap
  KellyCap,         // Kelly-lite fraction of capital
  Cash,             // deployable cash
  InvalidPrice,     // no usable entry price or zero stop distance
};

const char* bindingConstraintToString(BindingConstraint constraint);

// -----------------------------------------------------------------------------
// SizingResult
// -----------------------------------------------------------------------------
// quantity is the total planned across all tranches; tranches[0] is the only
// part that will be reserved now. A quantity of 0 means no size fits: it is
// a normal outcome, filtered out by the engine, not an error.
// -----------------------------------------------------------------------------
struct SizingResult {
  double quantity{0.0};
  std::vector<domain::Tranche> tranches;

  double entry_price{0.0};
  double stop_loss{0.0};
  double take_profit{0.0};
  double risk_per_unit{0.0};

  double risk_amount{0.0};    // quantity * risk_per_unit
  double reward_amount{0.0};  // quantity * |target - entry|
  double reward_risk_ratio{0.0};

  BindingConstraint binding{BindingConstraint::RiskBudget};

  double firstTrancheQuantity() const {
    return tranches.empty() ? 0.0 : tranches.front().quantity;
  }
  double notional() const { return quantity * entry_price; }
};

// -----------------------------------------------------------------------------
// PositionSizer: signal + capital → concrete quantity
// -----------------------------------------------------------------------------
//
// @brief  Volatility-targeted sizing with three caps.
//
// @details
//   entry   signal.entry_price, else snapshot.price
//   ATR     snapshot.atr, else entry * default_atr_fraction
//   stop    signal.stop_loss, else entry -/+ ATR * stop multiplier
//   target  signal.take_profit, else entry +/- ATR * take-profit multiplier
//
//   q_risk  = max_risk_per_trade% * total_capital / |entry - stop|
//   q_pos   = max_position_size(total_capital) / entry
//   q_kelly = clamp(c * e / assumed_variance, 0, kelly_cap)
//             * total_capital / entry          (e = edge_estimate / 100)
//   q_cash  = deployable_cash / entry
//
// Single lot: quantity = min(q_risk, q_pos, q_kelly, q_cash), rounded down
// to whole units when configured, floored at 0.
//
// Tranche split: the planned total min(q_risk, q_pos, q_kelly) is divided
// by leg percentage. Only the first leg is capped by q_cash; the later legs
// are released after their delay and must pass a fresh Ledger check then.
//
// Raising max_risk_per_trade can only raise q_risk, so sized quantity is
// monotone non-decreasing in it.
//
// Thread-safety: const and stateless after construction.
// -----------------------------------------------------------------------------
class PositionSizer {
 public:
  explicit PositionSizer(const domain::SizingLimits& limits);

  SizingResult size(const domain::Signal& signal,
                    const domain::Mandate& mandate,
                    const domain::Account& account,
                    const domain::MarketSnapshot& market,
                    const SizingParameters& params,
                    double deployable_cash) const;

  // Quantity of a deferred tranche at release time: the planned leg,
  // capped by what deployable cash buys at entry_price and rounded like any
  // other leg. 0 when nothing fits.
  double sizeTranche(double planned_quantity, double entry_price,
                     double deployable_cash) const;

  // The Kelly-lite fraction of capital, already clamped to [0, kelly_cap].
  double kellyFraction(const domain::Signal& signal) const;

 private:
  double roundQuantity(double quantity) const;

  domain::SizingLimits limits_;
};

}  // namespace capital
