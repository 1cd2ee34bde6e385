#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

#include "FakeSocket.h"
#include "mcp/WebSocketTransport.h"

TEST(WebSocketTransport, StartAndSendRequireOpenSocket) {
  auto sock = std::make_shared<FakeSocket>();
  WebSocketTransport transport(sock);
  EXPECT_THROW(transport.start(), TransportError);
  EXPECT_THROW(transport.send(JsonRpc::makeResult(1, nlohmann::json::object())), TransportError);

  sock->open = true;
  EXPECT_NO_THROW(transport.start());
  transport.send(JsonRpc::makeResult(1, {{"ok", true}}));
  auto sent = sock->sentTexts();
  ASSERT_EQ(sent.size(), 1u);
  auto j = nlohmann::json::parse(sent[0]);
  EXPECT_EQ(j["id"], 1);
  EXPECT_EQ(j["result"]["ok"], true);
}

TEST(WebSocketTransport, DeliversParsedMessages) {
  auto sock = std::make_shared<FakeSocket>();
  WebSocketTransport transport(sock);
  std::vector<std::string> methods;
  transport.onMessage([&](const Message& m) {
    if (const auto* req = std::get_if<Request>(&m)) methods.push_back(req->method);
  });

  sock->simulateText(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})");
  ASSERT_EQ(methods.size(), 1u);
  EXPECT_EQ(methods[0], "tools/list");
}

TEST(WebSocketTransport, MalformedFrameGoesToErrorHandlerAndKeepsConnection) {
  auto sock = std::make_shared<FakeSocket>();
  sock->open = true;
  WebSocketTransport transport(sock);
  int messages = 0;
  std::vector<std::string> errors;
  transport.onMessage([&](const Message&) { ++messages; });
  transport.onError([&](const TransportError& e) { errors.push_back(e.what()); });

  sock->simulateText("{not json");
  EXPECT_EQ(messages, 0);
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_TRUE(sock->isOpen());
  EXPECT_EQ(sock->closeCalls.load(), 0);
}

TEST(WebSocketTransport, CloseIsIdempotentAndReported) {
  auto sock = std::make_shared<FakeSocket>();
  sock->open = true;
  WebSocketTransport transport(sock);
  int closed = 0;
  transport.onClose([&]() { ++closed; });

  transport.close();
  transport.close();
  EXPECT_EQ(sock->closeCalls.load(), 1);

  sock->simulateClose(1000, "bye");
  EXPECT_EQ(closed, 1);
}

TEST(WebSocketTransport, StopsListeningAfterDestruction) {
  auto sock = std::make_shared<FakeSocket>();
  int messages = 0;
  {
    WebSocketTransport transport(sock);
    transport.onMessage([&](const Message&) { ++messages; });
  }
  sock->simulateText(R"({"jsonrpc":"2.0","method":"ping"})");
  EXPECT_EQ(messages, 0);
}

// 分发途中 (快照已取) 传输被销毁,余下的回调不能再触及它
TEST(WebSocketTransport, DestroyedDuringDispatchIgnoresPendingEvents) {
  auto sock = std::make_shared<FakeSocket>();
  std::shared_ptr<WebSocketTransport> transport;
  int messages = 0;
  int closes = 0;

  SocketEvents killer;
  killer.onText = [&](const std::string&) { transport.reset(); };
  killer.onClose = [&](int, const std::string&) { transport.reset(); };
  sock->subscribe(std::move(killer));

  transport = std::make_shared<WebSocketTransport>(sock);
  transport->onMessage([&](const Message&) { ++messages; });
  transport->onClose([&]() { ++closes; });

  sock->simulateText(R"({"jsonrpc":"2.0","method":"ping"})");
  EXPECT_EQ(transport.get(), nullptr);
  EXPECT_EQ(messages, 0);

  sock->simulateClose();
  EXPECT_EQ(closes, 0);
}
