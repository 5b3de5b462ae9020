#include "capital/gateway/signal_gateway.hpp"
#include "capital/codec/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace capital {

// -----------------------------------------------------------------------------
// Constructor: SUB socket, subscribe-all, bounded recv
// -----------------------------------------------------------------------------
SignalGateway::SignalGateway(SimulationTimeProvider* replay_clock,
                             EventSink event_sink, const std::string& endpoint)
    : replay_clock_(replay_clock), event_sink_(std::move(event_sink)) {
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop
// -----------------------------------------------------------------------------
// running_ starts true and only stop() clears it, so a stop() issued before
// the feed thread reaches this loop is not lost.
void SignalGateway::run() {
  while (running_.load()) {
    zmq::message_t msg;
    auto result = socket_.recv(msg, zmq::recv_flags::none);
    if (!result.has_value()) {
      continue;  // timeout: re-check running_
    }
    handlePayload(msg.to_string());
  }
}

void SignalGateway::stop() { running_.store(false); }

// -----------------------------------------------------------------------------
// handlePayload(): decode, advance replay clock, dispatch
// -----------------------------------------------------------------------------
bool SignalGateway::handlePayload(const std::string& payload) {
  try {
    const auto json = nlohmann::json::parse(payload);
    auto event = decodeInbound(json);
    if (!event) {
      std::cerr << "[SignalGateway] Unknown message type, dropped: "
                << payload << "\n";
      dropped_.fetch_add(1);
      return false;
    }

    if (replay_clock_ != nullptr) {
      if (auto it = json.find("timestamp_ms"); it != json.end()) {
        replay_clock_->advance_time(it->get<std::int64_t>());
      }
    }

    event_sink_(std::move(*event));
    return true;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[SignalGateway] JSON error: " << e.what()
              << " payload: " << payload << "\n";
  } catch (const std::invalid_argument& e) {
    std::cerr << "[SignalGateway] Invalid message: " << e.what()
              << " payload: " << payload << "\n";
  }
  dropped_.fetch_add(1);
  return false;
}

}  // namespace capital
