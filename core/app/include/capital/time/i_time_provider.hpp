#pragma once

#include <cstdint>

namespace capital {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source
// -----------------------------------------------------------------------------
//
// @brief  Injected "now" for every time-dependent rule in the engine.
//
// @details
// Reservation TTLs, catalyst freshness, event blackout windows and kill
// switch timestamps all depend on the current time. Reading the system
// clock directly would make those rules untestable, so components take a
// const ITimeProvider& and call now_ms():
//
//   LiveTimeProvider        wall clock (production)
//   SimulationTimeProvider  set explicitly (tests, replays)
//
// Time is int64 milliseconds since the Unix epoch, the same representation
// collaborators use on the wire.
//
// Thread-safety: implementations must allow concurrent now_ms() calls.
// Ownership: components borrow the provider; it must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Milliseconds since 1970-01-01 00:00:00 UTC.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace capital
