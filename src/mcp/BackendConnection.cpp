#include "mcp/BackendConnection.h"
#include "mcp/WebSocketTransport.h"
#include "utils/Logger.h"
#include <exception>
#include <stdexcept>

const char* connectionStateName(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Connected: return "connected";
    }
    return "disconnected";
}

BackendConnection::BackendConnection(BackendOptions options, SocketFactory socketFactory, AttachTransport attach)
    : opts(std::move(options)), makeSocket(std::move(socketFactory)), attach(std::move(attach)) {
    if (!makeSocket || !this->attach) {
        throw std::invalid_argument("BackendConnection requires a socket factory and a transport sink");
    }
}

BackendConnection::~BackendConnection() {
    stop();
}

std::future<void> BackendConnection::start() {
    std::future<void> result;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (current != ConnectionState::Disconnected) {
            std::promise<void> rejected;
            rejected.set_exception(std::make_exception_ptr(
                TransportError(std::string("Backend connection already ") + connectionStateName(current))));
            return rejected.get_future();
        }
        stopped = false;
        pendingStart.emplace();
        result = pendingStart->get_future();
    }

    reconnectTimer.cancel();
    beginAttempt();
    return result;
}

void BackendConnection::stop() {
    std::shared_ptr<Socket> sock;
    size_t token = 0;
    bool wasConnected = false;
    {
        std::lock_guard<std::mutex> lock(mtx);
        stopped = true;
        ++generation;
        attemptEnded = true;
        wasConnected = current == ConnectionState::Connected;
        current = ConnectionState::Disconnected;
        sock = std::move(socket);
        token = subscription;
        if (pendingStart) {
            pendingStart->set_exception(std::make_exception_ptr(TransportError("Backend connection stopped")));
            pendingStart.reset();
        }
    }

    if (reconnectTimer.cancel()) {
        Logger::getInstance().info("[Backend] Pending reconnect cancelled");
    }

    if (sock) {
        sock->unsubscribe(token);
        sock->close();
    }
    if (wasConnected) {
        Logger::getInstance().info("[Backend] Disconnected from " + opts.url);
        notify(ConnectionEvent::Disconnected, "stopped");
    }
}

ConnectionState BackendConnection::state() const {
    std::lock_guard<std::mutex> lock(mtx);
    return current;
}

void BackendConnection::setListener(Listener l) {
    std::lock_guard<std::mutex> lock(mtx);
    listener = std::move(l);
}

void BackendConnection::beginAttempt() {
    std::shared_ptr<Socket> sock;
    std::shared_ptr<Socket> previous;
    uint64_t gen = 0;
    size_t attempt = 0;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (stopped || current != ConnectionState::Disconnected) return;

        // 旧 socket 在锁外释放,其析构会等待自己的 I/O 线程
        previous = std::move(socket);
        if (previous) {
            previous->unsubscribe(subscription);
        }
        current = ConnectionState::Connecting;
        attemptEnded = false;
        gen = ++generation;
        attempt = ++attemptCount;
        try {
            sock = makeSocket(opts.url);
        } catch (const std::exception& e) {
            Logger::getInstance().error(std::string("[Backend] Failed to create socket: ") + e.what());
        }
        socket = sock;
    }
    previous.reset();

    if (!sock) {
        handleError(gen, "Failed to create socket for " + opts.url);
        return;
    }

    Logger::getInstance().info("[Backend] Connecting to " + opts.url + " (attempt " + std::to_string(attempt) + ")");

    SocketEvents events;
    events.onOpen = [this, gen]() { handleOpen(gen); };
    events.onClose = [this, gen](int code, const std::string& reason) { handleClose(gen, code, reason); };
    events.onError = [this, gen](const std::string& reason) { handleError(gen, reason); };
    size_t token = sock->subscribe(std::move(events));

    {
        std::lock_guard<std::mutex> lock(mtx);
        if (gen != generation) {
            // 订阅期间被 stop()
            sock->unsubscribe(token);
            return;
        }
        subscription = token;
    }

    try {
        sock->connect();
    } catch (const std::exception& e) {
        handleError(gen, e.what());
    }
}

void BackendConnection::handleOpen(uint64_t gen) {
    std::shared_ptr<Socket> sock;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (gen != generation || stopped || attemptEnded) return;
        sock = socket;
    }

    try {
        attach(std::make_shared<WebSocketTransport>(sock));
    } catch (const std::exception& e) {
        Logger::getInstance().error(std::string("[Backend] Failed to establish MCP transport: ") + e.what());
        handleError(gen, e.what());
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mtx);
        if (gen != generation || stopped) return;
        current = ConnectionState::Connected;
        if (pendingStart) {
            pendingStart->set_value();
            pendingStart.reset();
        }
    }

    Logger::getInstance().success("[Backend] Connected to " + opts.url);
    notify(ConnectionEvent::Connected, opts.url);
}

void BackendConnection::handleClose(uint64_t gen, int code, const std::string& reason) {
    Logger::getInstance().warn("[Backend] Connection closed: " + std::to_string(code) +
                               (reason.empty() ? "" : " - " + reason));
    finishAttempt(gen, ConnectionEvent::Disconnected, "closed (" + std::to_string(code) + ") " + reason);
}

void BackendConnection::handleError(uint64_t gen, const std::string& reason) {
    Logger::getInstance().error("[Backend] Connection error: " + reason);
    finishAttempt(gen, ConnectionEvent::Error, reason);
}

void BackendConnection::finishAttempt(uint64_t gen, ConnectionEvent event, const std::string& detail) {
    bool retry = false;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (gen != generation || attemptEnded) return;
        attemptEnded = true;
        current = ConnectionState::Disconnected;
        if (pendingStart) {
            pendingStart->set_exception(std::make_exception_ptr(TransportError(detail)));
            pendingStart.reset();
        }
        retry = !stopped;
    }

    notify(event, detail);
    if (retry) scheduleReconnect();
}

void BackendConnection::scheduleReconnect() {
    Logger::getInstance().info("[Backend] Reconnecting in " + std::to_string(opts.reconnectDelay.count()) + "ms");
    reconnectTimer.schedule(opts.reconnectDelay, [this]() { beginAttempt(); });
}

void BackendConnection::notify(ConnectionEvent event, const std::string& detail) {
    Listener l;
    {
        std::lock_guard<std::mutex> lock(mtx);
        l = listener;
    }
    if (l) l(event, detail);
}
