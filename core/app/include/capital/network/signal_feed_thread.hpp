#pragma once

#include "capital/events/event.hpp"
#include "capital/gateway/signal_gateway.hpp"
#include "capital/time/simulation_time_provider.hpp"

#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace capital {

// -----------------------------------------------------------------------------
// SignalFeedThread: owns the SignalGateway and the thread that runs it
// -----------------------------------------------------------------------------
//
// @brief  Deferred construction wrapper: the ZMQ socket is only opened in
//         start(), after the AllocationEngine has opened its accounts and
//         published its mandates.
//
// Thread model: start()/stop() from the owning thread only. stop() joins;
//               the gateway notices within its receive timeout.
// Ownership:    owned by the AllocationEngine via std::unique_ptr.
// -----------------------------------------------------------------------------
class SignalFeedThread {
 public:
  using EventSink = std::function<void(Event)>;

  SignalFeedThread(SimulationTimeProvider* replay_clock, EventSink event_sink,
                   std::string endpoint = "tcp://127.0.0.1:5555");

  // RAII: stops and joins if still running.
  ~SignalFeedThread();

  SignalFeedThread(const SignalFeedThread&) = delete;
  SignalFeedThread& operator=(const SignalFeedThread&) = delete;
  SignalFeedThread(SignalFeedThread&&) = delete;
  SignalFeedThread& operator=(SignalFeedThread&&) = delete;

  // Creates the gateway and spawns the recv thread. Idempotent.
  void start();

  // Signals the gateway and joins. Idempotent; safe if never started.
  void stop();

 private:
  SimulationTimeProvider* replay_clock_;
  EventSink event_sink_;
  std::string endpoint_;

  std::unique_ptr<SignalGateway> gateway_;
  std::thread thread_;
};

}  // namespace capital
