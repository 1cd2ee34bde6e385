#include "mcp/WebSocketTransport.h"
#include "utils/Logger.h"
#include <stdexcept>

WebSocketTransport::WebSocketTransport(std::shared_ptr<Socket> socket) : socket(std::move(socket)) {
    if (!this->socket) {
        throw std::invalid_argument("WebSocketTransport requires a socket");
    }

    SocketEvents events;
    events.onText = [state = handlers](const std::string& text) { handleText(state, text); };
    events.onClose = [state = handlers](int, const std::string&) { handleClose(state); };
    events.onError = [state = handlers](const std::string& reason) { handleError(state, reason); };
    subscription = this->socket->subscribe(std::move(events));
}

WebSocketTransport::~WebSocketTransport() {
    socket->unsubscribe(subscription);
    // 已经取到快照的分发不再转给上层
    std::lock_guard<std::mutex> lock(handlers->mtx);
    handlers->onMessage = nullptr;
    handlers->onClose = nullptr;
    handlers->onError = nullptr;
}

void WebSocketTransport::start() {
    if (!socket->isOpen()) {
        throw TransportError("WebSocket is not open");
    }
}

void WebSocketTransport::send(const Message& message) {
    if (!socket->isOpen()) {
        throw TransportError("WebSocket is not open");
    }
    socket->sendText(JsonRpc::serialize(message));
}

void WebSocketTransport::close() {
    if (socket->isOpen()) {
        socket->close();
    }
}

void WebSocketTransport::onMessage(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(handlers->mtx);
    handlers->onMessage = std::move(handler);
}

void WebSocketTransport::onClose(CloseHandler handler) {
    std::lock_guard<std::mutex> lock(handlers->mtx);
    handlers->onClose = std::move(handler);
}

void WebSocketTransport::onError(ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(handlers->mtx);
    handlers->onError = std::move(handler);
}

void WebSocketTransport::handleText(const std::shared_ptr<Handlers>& state, const std::string& text) {
    MessageHandler onMsg;
    ErrorHandler onErr;
    {
        std::lock_guard<std::mutex> lock(state->mtx);
        onMsg = state->onMessage;
        onErr = state->onError;
    }
    if (!onMsg && !onErr) return;

    Message message;
    try {
        message = JsonRpc::parse(text);
    } catch (const ProtocolError& e) {
        Logger::getInstance().warn(std::string("[Transport] Failed to parse WebSocket message: ") + e.what());
        if (onErr) onErr(TransportError(e.what()));
        return;
    }

    if (onMsg) onMsg(message);
}

void WebSocketTransport::handleClose(const std::shared_ptr<Handlers>& state) {
    CloseHandler onClosed;
    {
        std::lock_guard<std::mutex> lock(state->mtx);
        onClosed = state->onClose;
    }
    if (onClosed) onClosed();
}

void WebSocketTransport::handleError(const std::shared_ptr<Handlers>& state, const std::string& reason) {
    ErrorHandler onErr;
    {
        std::lock_guard<std::mutex> lock(state->mtx);
        onErr = state->onError;
    }
    if (onErr) onErr(TransportError(reason));
}
