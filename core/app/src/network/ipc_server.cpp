#include "capital/network/ipc_server.hpp"
#include "capital/codec/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <exception>
#include <iostream>
#include <utility>

namespace capital {

// -----------------------------------------------------------------------------
// Constructor: store endpoints; sockets are created in start()
// -----------------------------------------------------------------------------
IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
//
// Both sockets bind before the worker starts, so a bind failure (port in
// use) surfaces as zmq::error_t on the caller's thread and no thread is
// left behind.
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  // Bounded recv: the worker wakes up to drain telemetry and to notice stop.
  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }

  // Sockets before the context: zmq_ctx_term blocks while sockets are open.
  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped. " << published_.load()
            << " telemetry message(s) published.\n";
}

// -----------------------------------------------------------------------------
// pushTelemetry(): thread-safe enqueue from any allocating thread
// -----------------------------------------------------------------------------
void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run(): alternate telemetry drain and command poll until stopped
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }

  // Final drain: proposals and ledger records queued during shutdown still
  // reach the subscribers.
  processTelemetry();
}

// -----------------------------------------------------------------------------
// processTelemetry(): drain queue, encode, publish
// -----------------------------------------------------------------------------
//
// Inbound-only events encode to nullopt and are skipped. PUB never blocks:
// with no subscriber connected the message is dropped by ZeroMQ and not
// counted.
// -----------------------------------------------------------------------------
void IpcServer::processTelemetry() {
  while (auto maybe_event = telemetry_queue_.try_pop()) {
    auto json_str = encodeTelemetry(*maybe_event);
    if (!json_str.has_value()) {
      continue;
    }
    zmq::message_t msg(json_str->data(), json_str->size());
    if (pub_socket_->send(msg, zmq::send_flags::dontwait)) {
      published_.fetch_add(1);
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): poll REP socket and dispatch
// -----------------------------------------------------------------------------
//
// REP is strictly recv → send. Every received command gets exactly one
// reply, including when the handler throws.
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  // Timed out: nothing pending.
  if (!result.has_value()) {
    return;
  }

  std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response;
  try {
    response = command_handler_(cmd);
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] ERROR: command '" << cmd << "' failed: "
              << e.what() << "\n";
    nlohmann::json error;
    error["status"] = "error";
    error["response"] = e.what();
    response = error.dump();
  }

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

}  // namespace capital
