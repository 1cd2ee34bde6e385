#pragma once
#include <atomic>
#include <memory>
#include <string>
#include <ixwebsocket/IXWebSocket.h>
#include "mcp/Socket.h"

/**
 * @brief ixwebsocket 客户端连接
 * 关闭库自带的自动重连,重连策略由 BackendConnection 负责。
 */
class IxWebSocketConnection : public Socket {
public:
    explicit IxWebSocketConnection(const std::string& url);
    ~IxWebSocketConnection() override;

    void connect() override;
    bool isOpen() const override;
    void sendText(const std::string& text) override;
    void close() override;

    static SocketFactory factory();

private:
    ix::WebSocket ws;
    std::string url;
    std::atomic<bool> started{false};
};
