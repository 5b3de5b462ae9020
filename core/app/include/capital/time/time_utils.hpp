#pragma once

#include "capital/events/event_types.hpp"

#include <chrono>
#include <cstdint>

namespace capital {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
// Events carry a Timestamp (system_clock::time_point); ITimeProvider, the
// Ledger and the wire format use int64 epoch milliseconds. These bridge the
// two. Stateless.
// -----------------------------------------------------------------------------

constexpr std::int64_t kMillisPerHour = 60LL * 60LL * 1000LL;
constexpr std::int64_t kMillisPerDay = 24LL * kMillisPerHour;

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

}  // namespace capital
