#pragma once

#include "capital/concurrent/thread_safe_queue.hpp"
#include "capital/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace capital {

// -----------------------------------------------------------------------------
// IpcServer: operator commands (REP) and engine telemetry (PUB)
// -----------------------------------------------------------------------------
//
// @brief  One worker thread serving two ZeroMQ sockets.
//
// @details
//   PUB (default tcp://127.0.0.1:5557)
//     Broadcasts every outbound engine event as one JSON message:
//     trade_proposal, block_record, capital_transaction, kill_switch,
//     position_update. The execution, audit and reporting collaborators
//     subscribe here. Events arrive through pushTelemetry() into a
//     ThreadSafeQueue, so JSON encoding and socket I/O never run on the
//     allocating thread.
//
//   REP (default tcp://127.0.0.1:5556)
//     Accepts one command string per request (PING, STATUS, ACCOUNT <id>,
//     HALT <id>, RESET <id>, SIP, TRANSFER, CLOSE_BLOCK <id>,
//     RELEASE_TRANCHE <id> <index>) and replies with the JSON string
//     returned by the command handler, bound to
//     AllocationEngine::executeCommand(). A handler that throws is answered
//     with {"status":"error"} so the REP socket is never left without a
//     reply.
//
// The worker alternates between draining telemetry and polling for a
// command. ZMQ_RCVTIMEO on the REP socket bounds each poll to
// kPollTimeoutMs, which is also the worst-case telemetry latency.
//
// Thread model:
//   start()/stop() from the owning thread; pushTelemetry() from any thread.
//   The command handler runs on the IPC thread and must be thread-safe.
//   stop() lets the loop finish its iteration, drains remaining telemetry,
//   then joins.
//
// Ownership:
//   Owned by the AllocationEngine via std::unique_ptr. Sockets are created
//   in start() and destroyed in stop().
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  void start();
  void stop();

  // Enqueues an event for broadcast. Inbound-only event types are dropped
  // silently by the encoder.
  void pushTelemetry(Event event);

  std::uint64_t publishedCount() const { return published_.load(); }

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> published_{0};
};

}  // namespace capital
