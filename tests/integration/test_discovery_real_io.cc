/**
 * @file test_discovery_real_io.cc
 * @brief Client and server talking over real UDP sockets on loopback
 *
 * The client "broadcasts" to 127.0.0.1 so the exchange works without a
 * broadcast-capable interface. Intervals are shortened to keep the tests fast.
 */

#include <cerrno>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "lanlink/client/discovery_client.h"
#include "lanlink/event/event_loop.h"
#include "lanlink/server/discovery_server.h"

namespace lanlink {
namespace test {
namespace {

using std::chrono::milliseconds;

struct RecordingClientCallbacks : public client::DiscoveryClientCallbacks {
  void onConnection(
      const network::Address::InstanceConstSharedPtr& server) override {
    servers.push_back(server->asString());
    if (on_connection) {
      on_connection();
    }
  }

  void onClose() override {
    ++closes;
    if (on_close) {
      on_close();
    }
  }

  void onMessage(const network::Address::InstanceConstSharedPtr&,
                 const std::string& raw) override {
    messages.push_back(raw);
    if (on_message) {
      on_message();
    }
  }

  std::vector<std::string> servers;
  int closes{0};
  std::vector<std::string> messages;
  std::function<void()> on_connection;
  std::function<void()> on_close;
  std::function<void()> on_message;
};

struct RecordingServerCallbacks : public server::DiscoveryServerCallbacks {
  void onConnection(const server::ClientRecord& record,
                    const server::ClientRegistry&) override {
    connected.push_back(record);
    if (on_connection) {
      on_connection();
    }
  }

  void onClose(const server::ClientRecord& record,
               const server::ClientRegistry&) override {
    closed.push_back(record);
    if (on_close) {
      on_close();
    }
  }

  void onMessage(const network::Address::InstanceConstSharedPtr&,
                 const std::string& raw) override {
    messages.push_back(raw);
    if (on_message) {
      on_message();
    }
  }

  std::vector<server::ClientRecord> connected;
  std::vector<server::ClientRecord> closed;
  std::vector<std::string> messages;
  std::function<void()> on_connection;
  std::function<void()> on_close;
  std::function<void()> on_message;
};

class DiscoveryRealIoTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dispatcher_ = event::createLibeventDispatcher("integration");

    server_config_.listen_address = "127.0.0.1";
    server_config_.listen_port = 0;
    server_config_.monitor_interval = milliseconds(50);
    server_config_.disconnect_timeout = milliseconds(300);

    server_.reset(new server::DiscoveryServer(*dispatcher_, server_config_));
    server_->addCallbacks(server_events_);
    auto result = server_->start();
    ASSERT_TRUE(result.ok()) << result.error_message();
    ASSERT_NE(server_->localAddress(), nullptr);

    client_config_.broadcast_address = "127.0.0.1";
    client_config_.broadcast_port =
        static_cast<uint16_t>(server_->localAddress()->port());
    client_config_.discover_interval = milliseconds(50);
    client_config_.keepalive_interval = milliseconds(50);
    client_config_.ack_timeout = milliseconds(200);
    client_config_.payload = nlohmann::json{{"hostname", "h"}};

    client_.reset(new client::DiscoveryClient(*dispatcher_, client_config_));
    client_->addCallbacks(client_events_);
  }

  void TearDown() override {
    client_.reset();
    server_.reset();
    dispatcher_.reset();
  }

  // Run until exit() or the guard expires; returns false on timeout
  bool runWithGuard(milliseconds guard = milliseconds(3000)) {
    bool timed_out = false;
    auto guard_timer = dispatcher_->createTimer([&]() {
      timed_out = true;
      dispatcher_->exit();
    });
    guard_timer->enableTimer(guard);
    dispatcher_->run(event::RunType::RunUntilExit);
    return !timed_out;
  }

  // Starts the client and runs until both sides report the connection
  bool connect() {
    auto check = [this]() {
      if (!client_events_.servers.empty() &&
          !server_events_.connected.empty()) {
        dispatcher_->exit();
      }
    };
    client_events_.on_connection = check;
    server_events_.on_connection = check;

    auto result = client_->start();
    EXPECT_TRUE(result.ok()) << result.error_message();
    bool ok = runWithGuard();

    client_events_.on_connection = nullptr;
    server_events_.on_connection = nullptr;
    return ok;
  }

  event::DispatcherPtr dispatcher_;
  config::ServerConfig server_config_;
  config::ClientConfig client_config_;
  RecordingServerCallbacks server_events_;
  RecordingClientCallbacks client_events_;
  std::unique_ptr<server::DiscoveryServer> server_;
  std::unique_ptr<client::DiscoveryClient> client_;
};

/**
 * Test: Discover, connect and register over loopback
 */
TEST_F(DiscoveryRealIoTest, ClientConnects) {
  ASSERT_TRUE(connect());

  EXPECT_EQ(client_->state(), client::State::Connected);
  ASSERT_EQ(client_events_.servers.size(), 1u);
  EXPECT_EQ(client_events_.servers[0], server_->localAddress()->asString());

  ASSERT_EQ(server_events_.connected.size(), 1u);
  const auto& record = server_events_.connected[0];
  EXPECT_EQ(record.payload, nlohmann::json({{"hostname", "h"}}));
  EXPECT_EQ(record.endpoint->port(),
            client_->localAddress()->port());
  EXPECT_EQ(server_->clientCount(), 1u);
}

/**
 * Test: Keepalives hold the registration beyond the disconnect timeout
 */
TEST_F(DiscoveryRealIoTest, KeepalivesHoldRegistration) {
  ASSERT_TRUE(connect());

  auto stop = dispatcher_->createTimer([this]() { dispatcher_->exit(); });
  stop->enableTimer(milliseconds(800));
  ASSERT_TRUE(runWithGuard());

  EXPECT_TRUE(server_events_.closed.empty());
  EXPECT_EQ(client_events_.closes, 0);
  EXPECT_EQ(server_->clientCount(), 1u);
  EXPECT_EQ(client_->state(), client::State::Connected);
}

/**
 * Test: Stopping the client deregisters it on the server right away
 */
TEST_F(DiscoveryRealIoTest, ClientStopDeregisters) {
  ASSERT_TRUE(connect());

  server_events_.on_close = [this]() { dispatcher_->exit(); };
  client_->stop();
  EXPECT_EQ(client_events_.closes, 1);

  // Well under the disconnect timeout, so the close came from the ERROR frame
  ASSERT_TRUE(runWithGuard(milliseconds(250)));
  ASSERT_EQ(server_events_.closed.size(), 1u);
  EXPECT_EQ(server_->clientCount(), 0u);
}

/**
 * Test: A vanished server makes the client drop back to discovery
 */
TEST_F(DiscoveryRealIoTest, ServerLossResetsClient) {
  ASSERT_TRUE(connect());

  client_events_.on_close = [this]() { dispatcher_->exit(); };
  server_->stop();

  ASSERT_TRUE(runWithGuard());
  EXPECT_EQ(client_events_.closes, 1);
  EXPECT_NE(client_->state(), client::State::Connected);
}

/**
 * Test: A restarted server answers the first keepalive with ERROR and the
 * client registers again
 */
TEST_F(DiscoveryRealIoTest, ClientReconnectsAfterServerRestart) {
  ASSERT_TRUE(connect());
  uint16_t port = static_cast<uint16_t>(server_->localAddress()->port());

  server_->removeCallbacks(server_events_);
  server_.reset();

  config::ServerConfig restarted = server_config_;
  restarted.listen_port = port;
  server_.reset(new server::DiscoveryServer(*dispatcher_, restarted));
  server_->addCallbacks(server_events_);
  ASSERT_TRUE(server_->start().ok());

  server_events_.on_connection = [this]() { dispatcher_->exit(); };
  ASSERT_TRUE(runWithGuard());

  EXPECT_EQ(server_->clientCount(), 1u);
  EXPECT_EQ(client_events_.closes, 1);
  EXPECT_EQ(server_events_.connected.size(), 2u);
}

TEST_F(DiscoveryRealIoTest, ServerSendReachesClient) {
  ASSERT_TRUE(connect());

  client_events_.on_message = [this]() { dispatcher_->exit(); };
  auto result = server_->send(
      "hello client",
      static_cast<uint16_t>(client_->localAddress()->port()),
      "127.0.0.1");
  ASSERT_FALSE(isError(result));

  ASSERT_TRUE(runWithGuard());
  ASSERT_EQ(client_events_.messages.size(), 1u);
  EXPECT_EQ(client_events_.messages[0], "hello client");
}

/**
 * Test: The client restarts from inside onMessage, while its socket is
 * still draining, and registers again
 */
TEST_F(DiscoveryRealIoTest, ClientRestartsFromMessageCallback) {
  ASSERT_TRUE(connect());

  client_events_.on_message = [this]() {
    client_events_.on_message = nullptr;
    client_->stop();
    auto result = client_->start();
    EXPECT_TRUE(result.ok()) << result.error_message();
  };
  client_events_.on_connection = [this]() { dispatcher_->exit(); };

  auto result = server_->send(
      "hello client", client_->localAddress()->port(), "127.0.0.1");
  ASSERT_FALSE(isError(result));

  ASSERT_TRUE(runWithGuard());
  EXPECT_EQ(client_events_.closes, 1);
  EXPECT_EQ(client_events_.servers.size(), 2u);
  EXPECT_EQ(client_->state(), client::State::Connected);
  EXPECT_EQ(server_->clientCount(), 1u);
}

/**
 * Test: The server restarts from inside onMessage on the same port and the
 * client registers with the new instance
 */
TEST_F(DiscoveryRealIoTest, ServerRestartsFromMessageCallback) {
  // Pin the port so the restart binds where the client is looking
  config::ServerConfig pinned = server_config_;
  pinned.listen_port = server_->localAddress()->port();
  server_->removeCallbacks(server_events_);
  server_.reset(new server::DiscoveryServer(*dispatcher_, pinned));
  server_->addCallbacks(server_events_);
  ASSERT_TRUE(server_->start().ok());

  ASSERT_TRUE(connect());

  server_events_.on_message = [this]() {
    server_events_.on_message = nullptr;
    server_->stop();
    auto result = server_->start();
    EXPECT_TRUE(result.ok()) << result.error_message();
  };
  server_events_.on_connection = [this]() { dispatcher_->exit(); };

  ASSERT_FALSE(isError(client_->send("status")));

  ASSERT_TRUE(runWithGuard());
  ASSERT_EQ(server_events_.messages.size(), 1u);
  EXPECT_EQ(server_events_.messages[0], "status");
  EXPECT_EQ(server_events_.closed.size(), 1u);
  EXPECT_EQ(server_events_.connected.size(), 2u);
  EXPECT_EQ(server_->clientCount(), 1u);
}

/**
 * Test: A second server on a port already in use fails to start
 */
TEST_F(DiscoveryRealIoTest, BindConflictReported) {
  config::ServerConfig clash = server_config_;
  clash.listen_port = server_->localAddress()->port();

  server::DiscoveryServer other(*dispatcher_, clash);
  auto result = other.start();
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.error_code(), EADDRINUSE);
  EXPECT_FALSE(other.isStarted());
  EXPECT_TRUE(server_->isStarted());
}

TEST_F(DiscoveryRealIoTest, UnroutableListenAddressReported) {
  config::ServerConfig other_config = server_config_;
  other_config.listen_address = "192.0.2.1";

  server::DiscoveryServer other(*dispatcher_, other_config);
  EXPECT_FALSE(other.start().ok());
}

}  // namespace
}  // namespace test
}  // namespace lanlink
