#pragma once
#include <memory>
#include <mutex>
#include "mcp/ITransport.h"
#include "mcp/Socket.h"

/**
 * @brief 基于已连接 socket 的 JSON-RPC 传输
 * 不持有协议状态。入站文本解析失败时交给 onError,连接保持。
 */
class WebSocketTransport : public ITransport {
public:
    explicit WebSocketTransport(std::shared_ptr<Socket> socket);
    ~WebSocketTransport() override;

    void start() override;
    void send(const Message& message) override;
    void close() override;

    void onMessage(MessageHandler handler) override;
    void onClose(CloseHandler handler) override;
    void onError(ErrorHandler handler) override;

private:
    struct Handlers {
        std::mutex mtx;
        MessageHandler onMessage;
        CloseHandler onClose;
        ErrorHandler onError;
    };

    std::shared_ptr<Socket> socket;
    // socket 事件可能在本对象析构后仍在别的线程上分发,回调只引用这份共享状态
    std::shared_ptr<Handlers> handlers = std::make_shared<Handlers>();
    size_t subscription = 0;

    static void handleText(const std::shared_ptr<Handlers>& state, const std::string& text);
    static void handleClose(const std::shared_ptr<Handlers>& state);
    static void handleError(const std::shared_ptr<Handlers>& state, const std::string& reason);
};
