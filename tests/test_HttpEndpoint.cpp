/**
 * HTTP 入口的路由与状态码 (直接调用 handle,不占用端口)。
 */
#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <nlohmann/json.hpp>

#include "server/HttpEndpoint.h"

namespace {
class PingTool : public ITool {
public:
  ToolKind getKind() const override { return ToolKind::ShellListDir; }
  std::string getTitle() const override { return "Ping"; }
  std::string getDescription() const override { return "pong"; }
  nlohmann::json getSchema() const override { return {{"type", "object"}, {"properties", nlohmann::json::object()}}; }
  ToolResult execute(const nlohmann::json&) override { return ToolResult::text("pong"); }
};

ToolSetup pingSetup() {
  return [](ToolRegistry& registry) { registry.registerTool(std::make_unique<PingTool>()); };
}
}

TEST(HttpEndpoint, PostRegistersToolsAndAnswers) {
  McpServer server(pingSetup());
  HttpEndpoint endpoint(server, Config::Http{});
  EXPECT_FALSE(server.toolsRegistered());

  nlohmann::json request = {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/call"},
                            {"params", {{"name", toolKindName(ToolKind::ShellListDir)}}}};
  auto reply = endpoint.handle("POST", "/mcp", request.dump());
  EXPECT_EQ(reply.status, 200);
  EXPECT_EQ(reply.contentType, "application/json");
  auto body = nlohmann::json::parse(reply.body);
  EXPECT_EQ(body["id"], 1);
  EXPECT_EQ(body["result"]["content"][0]["text"], "pong");
  EXPECT_TRUE(server.toolsRegistered());
}

TEST(HttpEndpoint, MalformedBodyIsBadRequest) {
  McpServer server(pingSetup());
  HttpEndpoint endpoint(server, Config::Http{});
  auto reply = endpoint.handle("POST", "/mcp", "{not json");
  EXPECT_EQ(reply.status, 400);
  auto body = nlohmann::json::parse(reply.body);
  EXPECT_EQ(body["error"]["code"], JsonRpc::PARSE_ERROR);
  EXPECT_TRUE(body["id"].is_null());
}

TEST(HttpEndpoint, NotificationIsAccepted) {
  McpServer server(pingSetup());
  HttpEndpoint endpoint(server, Config::Http{});
  auto reply = endpoint.handle("POST", "/mcp", R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
  EXPECT_EQ(reply.status, 202);
  EXPECT_TRUE(reply.body.empty());
}

TEST(HttpEndpoint, SetupFailureIsInternalErrorWithRequestId) {
  McpServer server([](ToolRegistry&) { throw std::runtime_error("broken"); });
  HttpEndpoint endpoint(server, Config::Http{});
  auto reply = endpoint.handle("POST", "/mcp", R"({"jsonrpc":"2.0","id":9,"method":"tools/list"})");
  EXPECT_EQ(reply.status, 500);
  auto body = nlohmann::json::parse(reply.body);
  EXPECT_EQ(body["id"], 9);
  EXPECT_EQ(body["error"]["code"], JsonRpc::INTERNAL_ERROR);
  EXPECT_EQ(body["error"]["message"], "Failed to initialize server tools");
}

TEST(HttpEndpoint, GetAndDeleteAreNotAllowed) {
  McpServer server(pingSetup());
  HttpEndpoint endpoint(server, Config::Http{});
  for (const char* method : {"GET", "DELETE"}) {
    auto reply = endpoint.handle(method, "/mcp", "");
    EXPECT_EQ(reply.status, 405);
    auto body = nlohmann::json::parse(reply.body);
    EXPECT_EQ(body["error"]["code"], -32000);
    EXPECT_EQ(body["error"]["message"], "Method not allowed.");
    EXPECT_TRUE(body["id"].is_null());
  }
}

TEST(HttpEndpoint, OptionsReturnsCorsHeaders) {
  McpServer server(pingSetup());
  HttpEndpoint endpoint(server, Config::Http{});
  auto reply = endpoint.handle("OPTIONS", "/mcp", "");
  EXPECT_EQ(reply.status, 204);
  EXPECT_EQ(reply.headers["Access-Control-Allow-Origin"], "*");
  EXPECT_EQ(reply.headers["Access-Control-Allow-Methods"], "GET, POST, OPTIONS");
  EXPECT_EQ(reply.headers["Access-Control-Allow-Headers"], "Content-Type, Accept");
}

TEST(HttpEndpoint, HealthReportsRegistrationState) {
  McpServer server(pingSetup());
  HttpEndpoint endpoint(server, Config::Http{});
  auto body = nlohmann::json::parse(endpoint.handle("GET", "/health", "").body);
  EXPECT_EQ(body["status"], "healthy");
  EXPECT_EQ(body["toolsRegistered"], false);
  std::string ts = body["timestamp"];
  EXPECT_EQ(ts.size(), 24u);
  EXPECT_EQ(ts.back(), 'Z');

  server.setupTools();
  body = nlohmann::json::parse(endpoint.handle("GET", "/health", "").body);
  EXPECT_EQ(body["toolsRegistered"], true);
}

TEST(HttpEndpoint, UnknownPathIsNotFound) {
  McpServer server(pingSetup());
  HttpEndpoint endpoint(server, Config::Http{});
  EXPECT_EQ(endpoint.handle("GET", "/other", "").status, 404);
  EXPECT_FALSE(endpoint.isRunning());
}
