#pragma once
#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "mcp/ITransport.h"
#include "mcp/Protocol.h"
#include "tools/ToolRegistry.h"
#include "tools/ToolSetup.h"

/**
 * @brief 协议服务器:工具/资源注册 + 请求分发
 *
 * 处理器抛出的任何异常都在分发边界被捕获,不会让进程退出。
 * 工具注册只发生一次,即使从多个入口并发触发。
 */
class McpServer {
public:
    static constexpr const char* PROTOCOL_VERSION = "2024-11-05";
    static constexpr const char* SERVER_NAME = "tether";
    static constexpr const char* SERVER_VERSION = "1.0.0";

    explicit McpServer(ToolSetup setup);
    ~McpServer();

    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    /**
     * @brief 注册全部工具 (幂等)
     * @throws 原样抛出 setup 的异常,之后可以重试
     */
    void setupTools();

    bool toolsRegistered() const { return registered.load(); }

    /** @brief Notification / Response 返回 nullopt */
    std::optional<Response> handle(const Message& message);

    Response handleRequest(const Request& request);

    /**
     * @brief 处理一段原始 JSON 文本 (HTTP 入口)
     * 解析失败时返回 -32700 / -32600 响应;通知返回 nullopt。
     */
    std::optional<Response> handleText(const std::string& text);

    /**
     * @brief 挂上传输层,之前的传输被替换
     * 每个请求在后台任务中处理,结果通过该传输送回;传输已关闭时结果被丢弃。
     */
    void connect(std::shared_ptr<ITransport> transport);

    /** @brief 关闭当前传输 */
    void close();

    /** @brief 等待所有进行中的请求完成 */
    void waitForIdle();

    ToolRegistry& registry() { return tools; }

private:
    ToolSetup setup;
    ToolRegistry tools;
    std::once_flag setupOnce;
    std::atomic<bool> registered{false};

    std::mutex transportMtx;
    std::shared_ptr<ITransport> transport;

    std::mutex inFlightMtx;
    std::vector<std::future<void>> inFlight;

    nlohmann::json initializeResult() const;
    Response callTool(const Request& request);
    Response readResource(const Request& request);
    void ensureTools();
    void dispatchAsync(std::shared_ptr<ITransport> via, Request request);
};
