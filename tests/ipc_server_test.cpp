// =============================================================================
// ipc_server_test.cpp
// =============================================================================
// Tests for agrovest::IpcServer over loopback TCP.
//
// Validates:
//   - A command stuck in the handler does not hold up other clients
//   - Each REQ client gets its own reply back through the ROUTER
//   - A throwing handler still answers with a 500 body
//
// Both sockets bind "tcp://127.0.0.1:*" so parallel test runs never fight
// over a port; boundCommandEndpoint() tells the clients where to connect.
// =============================================================================

#include "agrovest/network/ipc_server.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <chrono>
#include <future>
#include <stdexcept>
#include <string>

using agrovest::IpcServer;

namespace {

constexpr int kClientTimeoutMs = 5000;

zmq::socket_t connectClient(zmq::context_t& context,
                            const std::string& endpoint) {
  zmq::socket_t client(context, zmq::socket_type::req);
  client.set(zmq::sockopt::rcvtimeo, kClientTimeoutMs);
  client.set(zmq::sockopt::linger, 0);
  client.connect(endpoint);
  return client;
}

void sendText(zmq::socket_t& socket, const std::string& text) {
  zmq::message_t message(text.data(), text.size());
  socket.send(message, zmq::send_flags::none);
}

// Empty string when nothing arrived within kClientTimeoutMs.
std::string receiveText(zmq::socket_t& socket) {
  zmq::message_t message;
  if (!socket.recv(message, zmq::recv_flags::none)) {
    return {};
  }
  return message.to_string();
}

}  // namespace

class IpcServerTest : public ::testing::Test {
 protected:
  std::promise<void> slow_started;
  std::promise<void> release_slow;
  std::shared_future<void> released{release_slow.get_future().share()};

  IpcServer server{
      [this](const std::string& body) -> std::string {
        if (body == "slow") {
          slow_started.set_value();
          released.wait_for(std::chrono::milliseconds(kClientTimeoutMs));
          return "slow-done";
        }
        if (body == "throw") {
          throw std::runtime_error("handler blew up");
        }
        return "echo:" + body;
      },
      "tcp://127.0.0.1:*", "tcp://127.0.0.1:*", 2};

  zmq::context_t context{1};

  void SetUp() override {
    server.start();
    ASSERT_FALSE(server.boundCommandEndpoint().empty());
  }

  void TearDown() override { server.stop(); }
};

// --- 1) A slow command occupies one worker only ---
TEST_F(IpcServerTest, SlowCommandDoesNotBlockOtherClients) {
  zmq::socket_t slow = connectClient(context, server.boundCommandEndpoint());
  zmq::socket_t fast = connectClient(context, server.boundCommandEndpoint());

  sendText(slow, "slow");
  ASSERT_EQ(slow_started.get_future().wait_for(
                std::chrono::milliseconds(kClientTimeoutMs)),
            std::future_status::ready);

  // The slow handler is still parked; this one must get through anyway.
  sendText(fast, "ping");
  EXPECT_EQ(receiveText(fast), "echo:ping");

  release_slow.set_value();
  EXPECT_EQ(receiveText(slow), "slow-done");
}

// --- 2) Handler failure ---
TEST_F(IpcServerTest, ThrowingHandlerStillAnswers) {
  release_slow.set_value();
  zmq::socket_t client = connectClient(context, server.boundCommandEndpoint());

  sendText(client, "throw");
  const std::string reply = receiveText(client);
  ASSERT_FALSE(reply.empty());
  EXPECT_EQ(nlohmann::json::parse(reply)["code"], 500);

  // The worker survives and serves the next request.
  sendText(client, "again");
  EXPECT_EQ(receiveText(client), "echo:again");
}
