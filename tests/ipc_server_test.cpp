// =============================================================================
// ipc_server_test.cpp
// =============================================================================
// Tests for matchcore::IpcServer over real ZeroMQ sockets.
//
// Validates:
//   - REQ/REP: commands reach the handler and replies come back verbatim
//   - A throwing handler yields an {"error": ...} reply, server keeps serving
//   - Events pushed with pushTelemetry() arrive on a SUB socket as JSON
//   - start()/stop() are idempotent
//
// Endpoints use the ipc:// transport under the gtest temp dir, one pair per
// test, so tests do not compete for TCP ports.
// =============================================================================

#include "matchcore/network/ipc_server.hpp"
#include "matchcore/time/time_utils.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

using matchcore::domain::Decimal;

class IpcServerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    const std::string base =
        "ipc://" + ::testing::TempDir() + "matchcore_" + info->name();
    cmd_endpoint = base + "_cmd";
    pub_endpoint = base + "_pub";
  }

  // Sends one request and waits up to a second for the reply.
  std::string request(const std::string& text) {
    zmq::socket_t req(client_ctx, zmq::socket_type::req);
    req.set(zmq::sockopt::rcvtimeo, 1000);
    req.set(zmq::sockopt::linger, 0);
    req.connect(cmd_endpoint);

    zmq::message_t out(text.data(), text.size());
    EXPECT_TRUE(req.send(out, zmq::send_flags::none).has_value());

    zmq::message_t in;
    if (!req.recv(in, zmq::recv_flags::none)) {
      ADD_FAILURE() << "no reply to '" << text << "'";
      return {};
    }
    return std::string(static_cast<const char*>(in.data()), in.size());
  }

  std::string cmd_endpoint;
  std::string pub_endpoint;
  zmq::context_t client_ctx{1};
};

// -----------------------------------------------------------------------------
// 1. Commands are answered by the handler.
// -----------------------------------------------------------------------------
TEST_F(IpcServerTest, RepliesThroughHandler) {
  matchcore::IpcServer server(
      [](const std::string& cmd) { return "echo:" + cmd; }, cmd_endpoint,
      pub_endpoint);
  server.start();
  ASSERT_TRUE(server.isRunning());

  EXPECT_EQ(request("PING"), "echo:PING");
  EXPECT_EQ(request("BOOK BTC/USDT"), "echo:BOOK BTC/USDT");

  server.stop();
  EXPECT_FALSE(server.isRunning());
}

// -----------------------------------------------------------------------------
// 2. A throwing handler produces an error reply and the REP socket stays
//    usable.
// Why: REP must answer every request or the client is stuck forever.
// -----------------------------------------------------------------------------
TEST_F(IpcServerTest, HandlerExceptionBecomesErrorReply) {
  matchcore::IpcServer server(
      [](const std::string& cmd) -> std::string {
        if (cmd == "BOOM") {
          throw std::runtime_error("handler failed");
        }
        return "fine";
      },
      cmd_endpoint, pub_endpoint);
  server.start();

  auto reply = nlohmann::json::parse(request("BOOM"));
  EXPECT_EQ(reply["error"], "handler failed");
  EXPECT_EQ(request("AGAIN"), "fine");
}

// -----------------------------------------------------------------------------
// 3. Pushed events are published as the JSON envelope.
// Why: PUB/SUB drops messages sent before the subscription settles, so the
//      test keeps publishing until one arrives.
// -----------------------------------------------------------------------------
TEST_F(IpcServerTest, PublishesTelemetry) {
  matchcore::IpcServer server([](const std::string&) { return ""; },
                              cmd_endpoint, pub_endpoint);
  server.start();

  zmq::socket_t sub(client_ctx, zmq::socket_type::sub);
  sub.set(zmq::sockopt::subscribe, "");
  sub.set(zmq::sockopt::rcvtimeo, 50);
  sub.connect(pub_endpoint);

  matchcore::TradeExecutedEvent event;
  event.trade.id = 42;
  event.trade.symbol = "BTC/USDT";
  event.trade.price = Decimal::parse("50000.5");
  event.trade.amount = Decimal::parse("0.1");
  event.timestamp = matchcore::ms_to_timestamp(1000);
  event.sequence_id = 9;

  std::string payload;
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(3);
  while (payload.empty() && std::chrono::steady_clock::now() < deadline) {
    server.pushTelemetry(event);
    zmq::message_t msg;
    if (sub.recv(msg, zmq::recv_flags::none)) {
      payload.assign(static_cast<const char*>(msg.data()), msg.size());
    }
  }
  ASSERT_FALSE(payload.empty()) << "no telemetry received";

  EXPECT_EQ(payload, matchcore::IpcServer::formatTelemetry(event));
  auto j = nlohmann::json::parse(payload);
  EXPECT_EQ(j["type"], "trade_executed");
  EXPECT_EQ(j["sequence_id"], 9);
  EXPECT_EQ(j["data"]["price"], "50000.5");
}

// -----------------------------------------------------------------------------
// 4. start() and stop() can be repeated; the destructor stops a running
//    server.
// -----------------------------------------------------------------------------
TEST_F(IpcServerTest, StartStopIdempotent) {
  matchcore::IpcServer server([](const std::string&) { return "ok"; },
                              cmd_endpoint, pub_endpoint);
  server.stop();
  server.start();
  server.start();
  EXPECT_EQ(request("X"), "ok");
  server.stop();
  server.stop();

  server.start();
  EXPECT_EQ(request("Y"), "ok");
}
