#pragma once
#include <atomic>
#include <future>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include "core/ConfigManager.h"
#include "mcp/McpServer.h"

namespace httplib {
class Server;
}

struct HttpReply {
    int status = 200;
    std::string body;
    std::string contentType = "application/json";
    std::map<std::string, std::string> headers;
};

/**
 * @brief 本地 HTTP 协议入口
 *
 * POST /mcp      JSON-RPC 请求 (首次请求时按需注册工具)
 * GET|DELETE /mcp  405,-32000 "Method not allowed."
 * OPTIONS /mcp   204 + CORS
 * GET /health    {status, toolsRegistered, timestamp}
 */
class HttpEndpoint {
public:
    static constexpr int DEFAULT_STOP_TIMEOUT_MS = 5000;

    HttpEndpoint(McpServer& server, Config::Http options);
    ~HttpEndpoint();

    /** @brief 路由逻辑,不依赖 socket,便于测试 */
    HttpReply handle(const std::string& method, const std::string& path, const std::string& body);

    /** @return false 表示绑定端口失败 */
    bool start();

    /** @brief 关闭监听;超过 forceTimeoutMs 仍未退出则放弃等待 */
    void stop(int forceTimeoutMs = DEFAULT_STOP_TIMEOUT_MS);

    bool isRunning() const { return running->load(); }

private:
    McpServer& server;
    Config::Http opts;
    std::unique_ptr<httplib::Server> http;
    std::thread worker;
    std::future<void> listenDone;
    // 监听线程可能在强制关闭后比本对象活得久
    std::shared_ptr<std::atomic<bool>> running = std::make_shared<std::atomic<bool>>(false);

    HttpReply handlePost(const std::string& body);
    static HttpReply methodNotAllowed();
    static HttpReply jsonReply(int status, const nlohmann::json& body);
};
