#pragma once

#include "capital/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace capital {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose current time only moves when told to.
//
// @details
// Used by tests to step past a reservation's TTL or age a catalyst, and by
// the signal gateway in replay mode, where each inbound message carries the
// timestamp that should become "now".
//
// The value is a std::atomic<int64_t>: one writer (the test or the gateway
// thread), many readers (allocation loop, IPC thread), no locking needed.
// Monotonicity is the caller's responsibility.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Sets the clock to new_time_ms.
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace capital
