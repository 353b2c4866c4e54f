// -----------------------------------------------------------------------------
// costbasis_server: single executable entry point.
//
// Usage:
//   costbasis_server [config.json]
//
//   1) Load EngineConfig from the given file. Without an argument, or if the
//      file cannot be used, the defaults apply (FIFO, tcp://127.0.0.1:5556,
//      no quotes).
//   2) Create the PortfolioEngine with a wall clock and start it. The engine
//      opens its ZeroMQ REP socket and answers JSON commands on the IPC
//      thread.
//   3) Park the main thread until SIGINT, then stop the engine.
//
// Thread layout:
//   main thread   → waits for shutdown
//   ipc thread    → IpcServer::run() → PortfolioEngine::executeCommand()
// -----------------------------------------------------------------------------

#include "costbasis/config/config_loader.hpp"
#include "costbasis/engine/portfolio_engine.hpp"
#include "costbasis/time/system_clock.hpp"

#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>
#include <utility>

// -----------------------------------------------------------------------------
// Shutdown flag for the SIGINT handler. Lock-free atomic store is the only
// thing the handler does.
// -----------------------------------------------------------------------------
static std::atomic<bool> g_shutdown_requested{false};

static void sigint_handler(int /*signum*/) {
  g_shutdown_requested.store(true);
}

int main(int argc, char** argv) {
  costbasis::EngineConfig config;
  if (argc > 1) {
    if (auto loaded = costbasis::loadEngineConfig(argv[1])) {
      config = std::move(*loaded);
    } else {
      std::cerr << "[main] WARNING: using default configuration.\n";
    }
  }

  costbasis::SystemClock clock;
  costbasis::PortfolioEngine engine(clock, std::move(config));

  try {
    engine.start();
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] ERROR: cannot start IPC server on "
              << engine.config().command_endpoint << ": " << e.what() << "\n";
    return 1;
  }

  std::signal(SIGINT, sigint_handler);

  std::cout << "[main] Listening on " << engine.config().command_endpoint
            << "\n"
            << "[main] Press Ctrl-C to shut down.\n";

  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] SIGINT received. Stopping engine...\n";
  engine.stop();

  return 0;
}
