#pragma once

#include "capital/concurrent/thread_safe_queue.hpp"
#include "capital/eventbus/event_bus.hpp"
#include "capital/events/event.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace capital {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
//
// @brief  One worker thread that drains a ThreadSafeQueue<Event> and
//         publishes each event on its own EventBus.
//
// @details
// The AllocationEngine runs every inbound collaborator event (signal
// batches, market snapshots, P&L updates, fills, closes, tranche
// releases, unblocks, heartbeats) through one of
// these, so all handlers for those events execute serially on the loop
// thread. Producers on other threads only call push().
//
// A handler that throws std::exception is logged and counted in
// failedCount(); the loop carries on with the next event.
//
// Thread model:
//   start()/stop() from the owning thread; push() from any thread.
//   stop() lets the event being dispatched finish, then joins. Events still
//   queued at that point are dropped.
//
// Ownership: owns the queue, the bus and the worker thread.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  EventLoopThread() = default;

  // Joins the worker if still running.
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // Spawns the worker. Idempotent.
  void start();

  // Signals the worker and joins it. Idempotent.
  void stop();

  void push(Event event) { queue_.push(std::move(event)); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  bool running() const { return running_.load(); }

  // Events whose dispatch ended in an exception.
  std::uint64_t failedCount() const { return failed_.load(); }

 private:
  void run();

  ThreadSafeQueue<Event> queue_;
  EventBus bus_;

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> failed_{0};
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  std::thread thread_;
};

}  // namespace capital
