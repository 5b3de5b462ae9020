#include "capital/concurrent/event_loop_thread.hpp"

#include <chrono>
#include <exception>
#include <iostream>

namespace capital {

namespace {

// How long the worker sleeps on an empty queue before re-checking running_.
// Bounds both stop() latency and the delay before a late push() is seen.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

// -----------------------------------------------------------------------------
// Destructor
// -----------------------------------------------------------------------------
// The worker reads queue_ and bus_, so it must be joined before they are
// destroyed. A no-op when stop() already ran.
// -----------------------------------------------------------------------------
EventLoopThread::~EventLoopThread() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void EventLoopThread::start() {
  // Started and not yet joined: one worker per loop.
  if (thread_.joinable()) {
    return;
  }

  // Set before spawning so the worker's first check sees true.
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
//
// The event being dispatched runs to completion; a signal batch in flight
// finishes reserving before the join returns. No lock is held across
// join(), since the worker takes stop_mutex_ between events.
// -----------------------------------------------------------------------------
void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }

  running_.store(false);

  // Wake a worker idling in wait_for() instead of letting it time out.
  stop_cv_.notify_all();

  thread_.join();
}

// -----------------------------------------------------------------------------
// run(): worker loop
// -----------------------------------------------------------------------------
//
// Every handler for an inbound collaborator message runs here, one event at
// a time, in arrival order. A handler that throws is logged and the loop
// moves on to the next event: one malformed fill or close must not stop
// allocation for every account.
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    // try_pop() rather than pop(): a blocking pop would not wake on stop_cv_.
    std::optional<Event> event = queue_.try_pop();

    if (event) {
      try {
        bus_.publish(*event);
      } catch (const std::exception& e) {
        std::cerr << "[EventLoopThread] ERROR: handler failed for event "
                  << "alternative " << event->index() << ": " << e.what()
                  << "\n";
        failed_.fetch_add(1);
      }
      continue;
    }

    // Empty queue: sleep until the timeout or until stop() notifies.
    std::unique_lock lock(stop_mutex_);
    stop_cv_.wait_for(lock, kIdleWaitTimeout,
                      [this] { return !running_.load(); });
  }
}

}  // namespace capital
