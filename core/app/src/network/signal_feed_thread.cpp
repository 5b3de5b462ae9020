#include "capital/network/signal_feed_thread.hpp"

#include <iostream>
#include <utility>

namespace capital {

SignalFeedThread::SignalFeedThread(SimulationTimeProvider* replay_clock,
                                   EventSink event_sink, std::string endpoint)
    : replay_clock_(replay_clock),
      event_sink_(std::move(event_sink)),
      endpoint_(std::move(endpoint)) {}

SignalFeedThread::~SignalFeedThread() { stop(); }

// -----------------------------------------------------------------------------
// start(): create gateway and spawn recv thread
// -----------------------------------------------------------------------------
void SignalFeedThread::start() {
  if (thread_.joinable()) {
    return;
  }

  gateway_ =
      std::make_unique<SignalGateway>(replay_clock_, event_sink_, endpoint_);

  thread_ = std::thread([this] {
    std::cout << "[SignalFeedThread] listening on " << endpoint_ << "\n";
    gateway_->run();
    std::cout << "[SignalFeedThread] recv loop exited.\n";
  });
}

// -----------------------------------------------------------------------------
// stop(): signal gateway and join thread
// -----------------------------------------------------------------------------
void SignalFeedThread::stop() {
  if (gateway_) {
    gateway_->stop();
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  gateway_.reset();
}

}  // namespace capital
