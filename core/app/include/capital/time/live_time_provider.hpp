#pragma once

#include "capital/time/i_time_provider.hpp"

namespace capital {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock ITimeProvider
// -----------------------------------------------------------------------------
// Delegates to std::chrono::system_clock. Used by the capital_guard binary
// when it runs against live collaborators.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace capital
