#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace capital {
namespace domain {

enum class RegimeLevel {
  Unknown,
  Low,
  Medium,
  High,
};

// -----------------------------------------------------------------------------
// MarketSnapshot: already-fetched market inputs for one symbol
// -----------------------------------------------------------------------------
//
// @brief  Everything the sizer and the guardrails need to know about a
//         symbol, supplied by the market-data collaborator.
//
// @details
// The engine never fetches data itself. The collaborator pushes snapshots
// (MarketSnapshotEvent) and the AllocationEngine keeps the latest one per
// symbol.
//
//   price                 Last traded price, used as entry when the signal
//                         carries no entry hint.
//   atr                   Average true range in price units. atr / price is
//                         the volatility estimate used by the ranker.
//   adv_value             Trailing average daily traded VALUE (currency),
//                         default lookback 20 days. 0 means unknown.
//   corporate_action_ms   Known earnings / corporate-action dates.
//   catalyst_ms           Timestamp of the event behind an event-driven
//                         signal, if known.
// -----------------------------------------------------------------------------
struct MarketSnapshot {
  std::string symbol;
  double price{0.0};
  double atr{0.0};
  double adv_value{0.0};
  RegimeLevel volatility_regime{RegimeLevel::Unknown};
  RegimeLevel liquidity_regime{RegimeLevel::Unknown};
  std::vector<std::int64_t> corporate_action_ms;
  std::optional<std::int64_t> catalyst_ms;
  std::int64_t as_of_ms{0};

  // Relative volatility. Zero when price is unknown.
  double volatility() const { return price > 0.0 ? atr / price : 0.0; }
};

const char* regimeLevelToString(RegimeLevel level);

}  // namespace domain
}  // namespace capital
