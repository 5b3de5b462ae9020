#include "capital/allocation/position_sizer.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace capital {

const char* bindingConstraintToString(BindingConstraint constraint) {
  switch (constraint) {
    case BindingConstraint::RiskBudget:
      return "RISK_BUDGET";
    case BindingConstraint::MaxPositionSize:
      return "MAX_POSITION_SIZE";
    case BindingConstraint::KellyCap:
      return "KELLY_CAP";
    case BindingConstraint::Cash:
      return "CASH";
    case BindingConstraint::InvalidPrice:
      return "INVALID_PRICE";
  }
  return "UNKNOWN";
}

PositionSizer::PositionSizer(const domain::SizingLimits& limits)
    : limits_(limits) {}

double PositionSizer::kellyFraction(const domain::Signal& signal) const {
  if (limits_.assumed_variance <= 0.0) {
    return 0.0;
  }
  const double edge = std::max(signal.edge_estimate, 0.0) / 100.0;
  const double raw = signal.confidence * edge / limits_.assumed_variance;
  return std::clamp(raw, 0.0, limits_.kelly_cap);
}

double PositionSizer::roundQuantity(double quantity) const {
  if (!std::isfinite(quantity) || quantity <= 0.0) {
    return 0.0;
  }
  return limits_.whole_units ? std::floor(quantity) : quantity;
}

double PositionSizer::sizeTranche(double planned_quantity, double entry_price,
                                  double deployable_cash) const {
  if (!(entry_price > 0.0) || !(deployable_cash > 0.0)) {
    return 0.0;
  }
  return roundQuantity(
      std::min(planned_quantity, deployable_cash / entry_price));
}

// -----------------------------------------------------------------------------
// size
// -----------------------------------------------------------------------------
SizingResult PositionSizer::size(const domain::Signal& signal,
                                 const domain::Mandate& mandate,
                                 const domain::Account& account,
                                 const domain::MarketSnapshot& market,
                                 const SizingParameters& params,
                                 double deployable_cash) const {
  SizingResult result;

  // --- Price levels -----------------------------------------------------------
  const double entry = signal.entry_price.value_or(market.price);
  if (!std::isfinite(entry) || entry <= 0.0) {
    result.binding = BindingConstraint::InvalidPrice;
    return result;
  }
  const double atr =
      market.atr > 0.0 ? market.atr : entry * limits_.default_atr_fraction;
  const double sign = signal.direction == domain::Direction::Long ? 1.0 : -1.0;

  result.entry_price = entry;
  result.stop_loss = signal.stop_loss.value_or(
      entry - sign * atr * params.stop_loss_atr_multiplier);
  result.take_profit = signal.take_profit.value_or(
      entry + sign * atr * params.take_profit_atr_multiplier);
  result.risk_per_unit = std::abs(entry - result.stop_loss);

  if (!std::isfinite(result.risk_per_unit) || result.risk_per_unit <= 0.0) {
    result.binding = BindingConstraint::InvalidPrice;
    return result;
  }

  // --- Caps -------------------------------------------------------------------
  const double capital = account.total_capital;
  const double risk_budget = mandate.max_risk_per_trade_pct / 100.0 * capital;

  double planned = risk_budget / result.risk_per_unit;
  result.binding = BindingConstraint::RiskBudget;

  const double q_pos = mandate.max_position_size.resolve(capital) / entry;
  if (q_pos < planned) {
    planned = q_pos;
    result.binding = BindingConstraint::MaxPositionSize;
  }

  const double q_kelly = kellyFraction(signal) * capital / entry;
  if (q_kelly < planned) {
    planned = q_kelly;
    result.binding = BindingConstraint::KellyCap;
  }

  const double q_cash = std::max(deployable_cash, 0.0) / entry;

  // --- Lots -------------------------------------------------------------------
  if (params.tranche_legs.empty()) {
    double quantity = planned;
    if (q_cash < quantity) {
      quantity = q_cash;
      result.binding = BindingConstraint::Cash;
    }
    quantity = roundQuantity(quantity);
    if (quantity > 0.0) {
      result.tranches.push_back(domain::Tranche{quantity, 0, "immediate"});
    }
    result.quantity = quantity;
  } else {
    double total = 0.0;
    for (std::size_t i = 0; i < params.tranche_legs.size(); ++i) {
      const auto& leg = params.tranche_legs[i];
      double quantity = planned * leg.percent / 100.0;
      if (i == 0 && q_cash < quantity) {
        quantity = q_cash;
        result.binding = BindingConstraint::Cash;
      }
      quantity = roundQuantity(quantity);
      if (i == 0 && quantity <= 0.0) {
        break;
      }
      const std::string condition =
          leg.delay_days == 0
              ? std::string("immediate")
              : "after_" + std::to_string(leg.delay_days) + "_days";
      result.tranches.push_back(
          domain::Tranche{quantity, leg.delay_days, condition});
      total += quantity;
    }
    result.quantity = result.tranches.empty() ? 0.0 : total;
  }

  // --- Metrics ----------------------------------------------------------------
  result.risk_amount = result.quantity * result.risk_per_unit;
  result.reward_amount =
      result.quantity * std::abs(result.take_profit - result.entry_price);
  result.reward_risk_ratio = result.risk_amount > 0.0
                                 ? result.reward_amount / result.risk_amount
                                 : 0.0;
  return result;
}

}  // namespace capital
