// =============================================================================
// ipc_server_test.cpp
// =============================================================================
// Unit tests for costbasis::IpcServer.
//
// Validates:
//   - A REQ client gets the handler's reply for each request
//   - A handler that throws is answered with an error and the loop goes on
//   - start() / stop() are idempotent and the destructor joins the worker
//   - PortfolioEngine answers over the socket when an endpoint is configured
//
// Design: Loopback TCP on fixed high ports; each test binds its own port.
// =============================================================================

#include "costbasis/engine/portfolio_engine.hpp"
#include "costbasis/network/ipc_server.hpp"
#include "costbasis/time/fixed_clock.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <stdexcept>
#include <string>

// Helper: one REQ round trip with a receive timeout so a broken server
// fails the test instead of hanging it.
static std::string roundTrip(const std::string& endpoint,
                             const std::string& payload) {
  zmq::context_t ctx(1);
  zmq::socket_t req(ctx, zmq::socket_type::req);
  req.set(zmq::sockopt::rcvtimeo, 2000);
  req.set(zmq::sockopt::linger, 0);
  req.connect(endpoint);

  req.send(zmq::buffer(payload), zmq::send_flags::none);

  zmq::message_t reply;
  auto result = req.recv(reply, zmq::recv_flags::none);
  if (!result.has_value()) {
    return "<timeout>";
  }
  return std::string(static_cast<const char*>(reply.data()), reply.size());
}

TEST(IpcServerTest, RepliesWithHandlerOutput) {
  const std::string endpoint = "tcp://127.0.0.1:55761";
  costbasis::IpcServer server(
      [](const std::string& request) { return "echo:" + request; }, endpoint);

  server.start();
  ASSERT_TRUE(server.isRunning());
  EXPECT_EQ(server.endpoint(), endpoint);

  EXPECT_EQ(roundTrip(endpoint, "hello"), "echo:hello");
  EXPECT_EQ(roundTrip(endpoint, "again"), "echo:again");

  server.stop();
  EXPECT_FALSE(server.isRunning());
}

TEST(IpcServerTest, StartStopIdempotent) {
  costbasis::IpcServer server([](const std::string&) { return std::string{}; },
                              "tcp://127.0.0.1:55762");

  server.stop();  // never started
  server.start();
  server.start();
  EXPECT_TRUE(server.isRunning());
  server.stop();
  server.stop();
  EXPECT_FALSE(server.isRunning());
}

TEST(IpcServerTest, DestructorStopsWorker) {
  {
    costbasis::IpcServer server(
        [](const std::string&) { return std::string("x"); },
        "tcp://127.0.0.1:55763");
    server.start();
  }
  SUCCEED();
}

TEST(IpcServerTest, ThrowingHandlerStillReplies) {
  const std::string endpoint = "tcp://127.0.0.1:55765";
  costbasis::IpcServer server(
      [](const std::string& request) -> std::string {
        if (request == "boom") {
          throw std::runtime_error("handler exploded");
        }
        return "ok:" + request;
      },
      endpoint);
  server.start();

  const auto reply = nlohmann::json::parse(roundTrip(endpoint, "boom"));
  EXPECT_EQ(reply.at("status"), "error");
  EXPECT_EQ(reply.at("error"), "handler exploded");

  EXPECT_TRUE(server.isRunning());
  EXPECT_EQ(roundTrip(endpoint, "next"), "ok:next");

  server.stop();
}

TEST(IpcServerTest, EngineAnswersOverSocket) {
  costbasis::FixedClock clock(costbasis::domain::make_date(2024, 1, 1));
  costbasis::EngineConfig config;
  config.command_endpoint = "tcp://127.0.0.1:55764";

  costbasis::PortfolioEngine engine(clock, config);
  engine.start();

  const auto reply = nlohmann::json::parse(
      roundTrip(config.command_endpoint, R"({"command": "PING"})"));
  EXPECT_EQ(reply.at("status"), "ok");
  EXPECT_EQ(reply.at("response"), "PONG");

  engine.stop();
}
