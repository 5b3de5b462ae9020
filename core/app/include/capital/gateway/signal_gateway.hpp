#pragma once

#include "capital/events/event.hpp"
#include "capital/time/simulation_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace capital {

// -----------------------------------------------------------------------------
// SignalGateway: ZeroMQ SUB bridge for collaborator input
// -----------------------------------------------------------------------------
//
// @brief  Receives JSON messages from the signal generator, market data,
//         P&L and execution collaborators, decodes them with the JSON codec
//         and hands the resulting Event to the engine.
//
// @details
// Every collaborator publishes on the same feed; the "type" field says what
// the message is (signal_batch, market, pnl, fill, reject, close,
// heartbeat). See json_codec.hpp for the payloads.
//
// Replay mode:
//   When constructed with a SimulationTimeProvider, a message carrying
//   timestamp_ms first advances that clock and only then is handed on, so
//   reservation TTLs and catalyst ages are measured in replayed time. With
//   nullptr the engine runs on a live clock and timestamps are ignored for
//   timekeeping.
//
// Malformed messages:
//   nlohmann::json::exception (syntax, missing key, wrong type) and
//   std::invalid_argument (ConfigurationError: unknown enum spelling) are
//   caught, logged to stderr with the payload, and the message is dropped.
//   The recv loop keeps running.
//
// Shutdown:
//   ZMQ_RCVTIMEO bounds every recv(), so run() re-checks the stop flag at
//   least every kRecvTimeoutMs.
//
// Thread model:
//   run() blocks; call it from a dedicated thread (SignalFeedThread).
//   stop() may be called from any thread.
//
// Ownership:
//   Owns the ZMQ context and socket. Borrows the optional clock.
// -----------------------------------------------------------------------------
class SignalGateway {
 public:
  using EventSink = std::function<void(Event)>;

  SignalGateway(SimulationTimeProvider* replay_clock, EventSink event_sink,
                const std::string& endpoint = "tcp://127.0.0.1:5555");

  ~SignalGateway() = default;

  SignalGateway(const SignalGateway&) = delete;
  SignalGateway& operator=(const SignalGateway&) = delete;
  SignalGateway(SignalGateway&&) = delete;
  SignalGateway& operator=(SignalGateway&&) = delete;

  void run();
  void stop();

  // Decodes and dispatches one payload. Returns false when the payload was
  // dropped (malformed or unknown type). Used by run() and by tests.
  bool handlePayload(const std::string& payload);

  std::uint64_t droppedCount() const { return dropped_.load(); }

 private:
  static constexpr int kRecvTimeoutMs = 100;

  SimulationTimeProvider* replay_clock_;
  EventSink event_sink_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{true};
  std::atomic<std::uint64_t> dropped_{0};
};

}  // namespace capital
