/**
 * 后端连接的重连状态机。socket 由 FakeSocket 替换,重连间隔缩短到几十毫秒。
 */
#include <gtest/gtest.h>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "FakeSocket.h"
#include "mcp/BackendConnection.h"

using namespace std::chrono_literals;

namespace {
bool waitUntil(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 2000ms) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(5ms);
  }
  return pred();
}

class BackendConnectionTest : public ::testing::Test {
protected:
  std::mutex mtx;
  std::vector<std::shared_ptr<FakeSocket>> sockets;
  std::vector<std::string> urls;
  std::vector<std::shared_ptr<ITransport>> attached;
  std::vector<ConnectionEvent> events;

  std::unique_ptr<BackendConnection> make(std::chrono::milliseconds delay = 30ms) {
    BackendOptions options;
    options.url = "ws://backend.test/ws/client";
    options.reconnectDelay = delay;
    auto conn = std::make_unique<BackendConnection>(
      options,
      [this](const std::string& url) {
        auto sock = std::make_shared<FakeSocket>();
        std::lock_guard<std::mutex> lock(mtx);
        urls.push_back(url);
        sockets.push_back(sock);
        return std::shared_ptr<Socket>(sock);
      },
      [this](std::shared_ptr<ITransport> t) {
        std::lock_guard<std::mutex> lock(mtx);
        attached.push_back(std::move(t));
      });
    conn->setListener([this](ConnectionEvent e, const std::string&) {
      std::lock_guard<std::mutex> lock(mtx);
      events.push_back(e);
    });
    return conn;
  }

  std::shared_ptr<FakeSocket> socketAt(size_t i) {
    std::lock_guard<std::mutex> lock(mtx);
    return i < sockets.size() ? sockets[i] : nullptr;
  }

  size_t socketCount() {
    std::lock_guard<std::mutex> lock(mtx);
    return sockets.size();
  }
};
}

TEST_F(BackendConnectionTest, HandshakeCompletesStartFuture) {
  auto conn = make();
  auto started = conn->start();
  EXPECT_EQ(conn->state(), ConnectionState::Connecting);
  ASSERT_EQ(socketCount(), 1u);
  EXPECT_EQ(socketAt(0)->connectCalls.load(), 1);
  EXPECT_EQ(urls[0], "ws://backend.test/ws/client");

  socketAt(0)->simulateOpen();
  ASSERT_EQ(started.wait_for(0ms), std::future_status::ready);
  EXPECT_NO_THROW(started.get());
  EXPECT_TRUE(conn->isConnected());
  EXPECT_EQ(attached.size(), 1u);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0], ConnectionEvent::Connected);
}

TEST_F(BackendConnectionTest, FailedAttemptRejectsStartFuture) {
  auto conn = make(1000ms);
  auto started = conn->start();
  socketAt(0)->simulateError("connection refused");
  ASSERT_EQ(started.wait_for(0ms), std::future_status::ready);
  EXPECT_THROW(started.get(), TransportError);
  EXPECT_EQ(conn->state(), ConnectionState::Disconnected);
}

TEST_F(BackendConnectionTest, SecondStartWhileConnectingIsRejected) {
  auto conn = make();
  auto first = conn->start();
  auto second = conn->start();
  EXPECT_THROW(second.get(), TransportError);
  EXPECT_EQ(socketCount(), 1u);
  EXPECT_EQ(first.wait_for(0ms), std::future_status::timeout);
}

TEST_F(BackendConnectionTest, ReconnectsAfterCloseUntilStopped) {
  auto conn = make();
  conn->start();
  socketAt(0)->simulateOpen();
  socketAt(0)->simulateClose(1006, "gone");

  ASSERT_TRUE(waitUntil([&] { return socketCount() == 2; }));
  EXPECT_EQ(conn->attempts(), 2u);
  socketAt(1)->simulateOpen();
  EXPECT_TRUE(conn->isConnected());
  EXPECT_EQ(attached.size(), 2u);

  conn->stop();
  EXPECT_EQ(conn->state(), ConnectionState::Disconnected);
  EXPECT_EQ(socketAt(1)->closeCalls.load(), 1);
  std::this_thread::sleep_for(150ms);
  EXPECT_EQ(socketCount(), 2u);
}

TEST_F(BackendConnectionTest, ErrorFollowedByCloseSchedulesOneRetry) {
  auto conn = make(20ms);
  auto started = conn->start();
  socketAt(0)->simulateError("refused");
  socketAt(0)->simulateClose(1006, "");

  ASSERT_TRUE(waitUntil([&] { return socketCount() >= 2; }));
  // 新的尝试没有结束,不会再有重试
  std::this_thread::sleep_for(150ms);
  EXPECT_EQ(socketCount(), 2u);
  EXPECT_EQ(conn->attempts(), 2u);
  conn->stop();
}

TEST_F(BackendConnectionTest, EachFailedAttemptRetriesAgain) {
  auto conn = make(10ms);
  conn->start();
  for (size_t i = 0; i < 3; ++i) {
    ASSERT_TRUE(waitUntil([&] { return socketCount() > i; }));
    socketAt(i)->simulateError("refused");
  }
  ASSERT_TRUE(waitUntil([&] { return socketCount() == 4; }));
  EXPECT_EQ(conn->attempts(), 4u);
  conn->stop();
}

TEST_F(BackendConnectionTest, StopCancelsPendingReconnect) {
  auto conn = make(100ms);
  auto started = conn->start();
  socketAt(0)->simulateError("refused");
  conn->stop();
  std::this_thread::sleep_for(250ms);
  EXPECT_EQ(socketCount(), 1u);
  EXPECT_EQ(conn->attempts(), 1u);
}

TEST_F(BackendConnectionTest, StopRejectsPendingStart) {
  auto conn = make();
  auto started = conn->start();
  conn->stop();
  EXPECT_THROW(started.get(), TransportError);
}

TEST_F(BackendConnectionTest, EventsFromReplacedSocketAreIgnored) {
  auto conn = make(10ms);
  conn->start();
  auto first = socketAt(0);
  first->simulateError("refused");
  ASSERT_TRUE(waitUntil([&] { return socketCount() == 2; }));

  first->simulateOpen();
  EXPECT_FALSE(conn->isConnected());
  EXPECT_TRUE(attached.empty());
  conn->stop();
}

TEST_F(BackendConnectionTest, CanStartAgainAfterStop) {
  auto conn = make();
  conn->start();
  conn->stop();
  auto again = conn->start();
  ASSERT_EQ(socketCount(), 2u);
  socketAt(1)->simulateOpen();
  EXPECT_NO_THROW(again.get());
  conn->stop();
}
