#pragma once

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace costbasis {

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ request/reply front end for engine commands
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread that accepts JSON command requests on a
//         REP socket and answers each with the handler's JSON response.
//
// @details
// One request, one reply: a REQ client (CLI, web backend, notebook) sends
// {"command": "...", ...} and blocks until the engine answers. The REP
// socket uses ZMQ_RCVTIMEO so the loop wakes up every kPollTimeoutMs and
// notices stop() without needing a second control socket.
//
// The handler is expected to turn every request into a response, including
// malformed ones. A REP socket that receives without sending back is stuck,
// so processCommands() always replies; a handler that throws is answered
// with {"status":"error"} and the exception message.
//
// Thread model:
//   Constructed and destroyed on the main thread (via PortfolioEngine).
//   start() spawns the worker; stop() clears an atomic flag and joins it.
//   command_handler_ is invoked on the worker thread only.
//
// Ownership:
//   Owned by PortfolioEngine via std::unique_ptr.
//   Owns the ZMQ context, the REP socket and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  command_handler  Called with each request payload; returns the
  //                          reply payload. Typically bound to
  //                          PortfolioEngine::executeCommand().
  // @param  cmd_endpoint     ZMQ endpoint to bind the REP socket to.
  //
  // @details
  // No socket is opened and no thread is spawned until start().
  // -------------------------------------------------------------------------
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556");

  // RAII: stops the worker if it is still running.
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  //
  // @brief  Binds the REP socket and spawns the worker thread.
  //
  // @details
  // Idempotent. A bind failure (endpoint in use, bad address) propagates as
  // zmq::error_t before any thread exists.
  //
  // Thread-safety: Call from the owning thread only.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  //
  // @brief  Signals the worker, joins it, then closes the socket.
  //
  // @details
  // The worker exits within kPollTimeoutMs. Idempotent; safe if never
  // started.
  // -------------------------------------------------------------------------
  void stop();

  bool isRunning() const;

  const std::string& endpoint() const;

 private:
  static constexpr int kPollTimeoutMs = 50;

  // Worker loop: processCommands() until running_ is cleared.
  void run();

  // Receives at most one request (bounded by ZMQ_RCVTIMEO) and replies.
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;

  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace costbasis
