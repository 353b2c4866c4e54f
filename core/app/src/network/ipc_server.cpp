#include "costbasis/network/ipc_server.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <exception>
#include <iostream>
#include <utility>

namespace costbasis {

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind REP socket and spawn worker thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal, join, close
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.exchange(false)) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

bool IpcServer::isRunning() const { return running_.load(); }

const std::string& IpcServer::endpoint() const { return cmd_endpoint_; }

// -----------------------------------------------------------------------------
// run(): poll loop
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    try {
      processCommands();
    } catch (const zmq::error_t& e) {
      std::cerr << "[IpcServer] ERROR: " << e.what() << "\n";
      running_.store(false);
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): one recv/handle/send round
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

  if (!result.has_value()) {
    return;
  }

  std::string payload(static_cast<const char*>(request.data()),
                      request.size());
  std::string response;
  try {
    response = command_handler_(payload);
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] ERROR: handler failed: " << e.what() << "\n";
    response = nlohmann::json{{"status", "error"}, {"error", e.what()}}.dump();
  }

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

}  // namespace costbasis
