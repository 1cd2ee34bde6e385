#include "mcp/IxWebSocketConnection.h"
#include "core/Errors.h"
#include "utils/Logger.h"

IxWebSocketConnection::IxWebSocketConnection(const std::string& url) : url(url) {
    ws.setUrl(url);
    ws.disableAutomaticReconnection();

    ws.setOnMessageCallback([this](const ix::WebSocketMessagePtr& msg) {
        switch (msg->type) {
            case ix::WebSocketMessageType::Open:
                emitOpen();
                break;
            case ix::WebSocketMessageType::Message:
                emitText(msg->str);
                break;
            case ix::WebSocketMessageType::Close:
                emitClose(msg->closeInfo.code, msg->closeInfo.reason);
                break;
            case ix::WebSocketMessageType::Error:
                emitError(msg->errorInfo.reason);
                break;
            default:
                break;
        }
    });
}

IxWebSocketConnection::~IxWebSocketConnection() {
    ws.setOnMessageCallback(nullptr);
    ws.stop();
}

void IxWebSocketConnection::connect() {
    Logger::getInstance().debug("[WebSocket] Connecting to " + url);
    started = true;
    ws.start();
}

bool IxWebSocketConnection::isOpen() const {
    return ws.getReadyState() == ix::ReadyState::Open;
}

void IxWebSocketConnection::sendText(const std::string& text) {
    if (!isOpen()) {
        throw TransportError("WebSocket is not open");
    }
    auto info = ws.send(text);
    if (!info.success) {
        throw TransportError("Failed to send WebSocket message to " + url);
    }
}

void IxWebSocketConnection::close() {
    if (started.exchange(false)) {
        ws.stop();
    }
}

SocketFactory IxWebSocketConnection::factory() {
    return [](const std::string& url) -> std::shared_ptr<Socket> {
        return std::make_shared<IxWebSocketConnection>(url);
    };
}
