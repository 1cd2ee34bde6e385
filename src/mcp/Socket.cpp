#include "mcp/Socket.h"

size_t Socket::subscribe(SocketEvents events) {
    std::lock_guard<std::mutex> lock(listenersMtx);
    size_t token = nextToken++;
    listeners[token] = std::move(events);
    return token;
}

void Socket::unsubscribe(size_t token) {
    std::lock_guard<std::mutex> lock(listenersMtx);
    listeners.erase(token);
}

std::map<size_t, SocketEvents> Socket::snapshot() {
    std::lock_guard<std::mutex> lock(listenersMtx);
    return listeners;
}

// 回调在锁外执行,订阅者可以在回调里 unsubscribe

void Socket::emitOpen() {
    for (auto& [token, events] : snapshot()) {
        if (events.onOpen) events.onOpen();
    }
}

void Socket::emitText(const std::string& text) {
    for (auto& [token, events] : snapshot()) {
        if (events.onText) events.onText(text);
    }
}

void Socket::emitClose(int code, const std::string& reason) {
    for (auto& [token, events] : snapshot()) {
        if (events.onClose) events.onClose(code, reason);
    }
}

void Socket::emitError(const std::string& reason) {
    for (auto& [token, events] : snapshot()) {
        if (events.onError) events.onError(reason);
    }
}
