#pragma once

#include <cstdint>

namespace capital {
namespace domain {

// -----------------------------------------------------------------------------
// GuardrailLimits: engine-wide thresholds for the six pre-trade checks
// -----------------------------------------------------------------------------
//
// @brief  Plain data with the defaults used when the configuration file does
//         not override them.
//
// @details
// Per-account limits (risk per trade, sector exposure, blackout days) live on
// the Mandate. The values here apply to every account.
//
//   max_adv_fraction           Order notional may not exceed this share of
//                              the symbol's average daily traded value.
//   adv_lookback_days          Informational; the collaborator computes the
//                              ADV over this window.
//   default_blackout_days      Event window when the mandate sets none.
//   catalyst_freshness_hours   Maximum age of the event behind a hot-path
//                              signal.
//   default_sector_exposure_pct
//                              Used when a mandate carries a zero limit.
//   block_on_warning           Deployment switch: treat WARNING outcomes as
//                              blocking. Off by default.
//
// Thread model: value type, copied into components at construction.
// -----------------------------------------------------------------------------
struct GuardrailLimits {
  double max_adv_fraction{0.05};
  int adv_lookback_days{20};
  int default_blackout_days{2};
  double catalyst_freshness_hours{24.0};
  double default_sector_exposure_pct{30.0};
  bool block_on_warning{false};
};

// -----------------------------------------------------------------------------
// SizingLimits: Kelly-lite parameters for the PositionSizer
// -----------------------------------------------------------------------------
// fraction = clamp(confidence * edge / assumed_variance, 0, kelly_cap)
// where edge is a fraction (edge_estimate / 100). kelly_cap keeps sizing well
// below full Kelly.
// -----------------------------------------------------------------------------
struct SizingLimits {
  double kelly_cap{0.25};
  double assumed_variance{0.04};
  double default_atr_fraction{0.02};  // ATR guess when none is supplied
  bool whole_units{true};             // Round quantities down to integers
};

// -----------------------------------------------------------------------------
// TreasuryLimits: cash management rules applied by the Ledger and engine
// -----------------------------------------------------------------------------
struct TreasuryLimits {
  // Share of available cash kept back from sizing, in percent.
  double emergency_buffer_pct{5.0};

  // Lifetime of a reservation backing an unfilled TradeProposal.
  std::int64_t reservation_ttl_ms{15 * 60 * 1000};

  // Maximum proposals emitted per account for one signal batch.
  int max_proposals_per_batch{5};
};

}  // namespace domain
}  // namespace capital
