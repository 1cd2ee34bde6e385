#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "mcp/ITransport.h"
#include "mcp/Socket.h"
#include "utils/DelayedTask.h"

enum class ConnectionState { Disconnected, Connecting, Connected };
enum class ConnectionEvent { Connected, Disconnected, Error };

const char* connectionStateName(ConnectionState state);

struct BackendOptions {
    std::string url;
    std::chrono::milliseconds reconnectDelay{5000};
};

/**
 * @brief 后端连接的重连监督器
 *
 * 状态机:Disconnected -> Connecting -> Connected -> Disconnected。
 * 每次连接尝试结束 (error 或 close,先到者) 后安排且只安排一次重连,
 * 直到 stop()。重连计时器只有一个,新的会替换旧的。
 */
class BackendConnection {
public:
    using AttachTransport = std::function<void(std::shared_ptr<ITransport>)>;
    using Listener = std::function<void(ConnectionEvent, const std::string& detail)>;

    BackendConnection(BackendOptions options, SocketFactory socketFactory, AttachTransport attach);
    ~BackendConnection();

    BackendConnection(const BackendConnection&) = delete;
    BackendConnection& operator=(const BackendConnection&) = delete;

    /**
     * @brief 发起第一次连接
     * 返回的 future 在握手成功时完成,在本次尝试出错时以 TransportError 失败。
     * 已在 Connecting/Connected 状态时直接返回失败的 future,不会并发发起连接。
     */
    std::future<void> start();

    /** @brief 取消待执行的重连并关闭当前连接,之后不再重试 */
    void stop();

    ConnectionState state() const;
    bool isConnected() const { return state() == ConnectionState::Connected; }

    /** @brief 累计连接尝试次数 (首次 + 重试) */
    size_t attempts() const { return attemptCount.load(); }

    void setListener(Listener listener);

    const BackendOptions& options() const { return opts; }

private:
    BackendOptions opts;
    SocketFactory makeSocket;
    AttachTransport attach;

    mutable std::mutex mtx;
    ConnectionState current = ConnectionState::Disconnected;
    bool stopped = false;
    bool attemptEnded = true;
    uint64_t generation = 0;
    std::shared_ptr<Socket> socket;
    size_t subscription = 0;
    std::optional<std::promise<void>> pendingStart;
    Listener listener;
    std::atomic<size_t> attemptCount{0};

    // 最后声明:析构时最先停止计时线程
    DelayedTask reconnectTimer;

    void beginAttempt();
    void handleOpen(uint64_t gen);
    void handleClose(uint64_t gen, int code, const std::string& reason);
    void handleError(uint64_t gen, const std::string& reason);
    void finishAttempt(uint64_t gen, ConnectionEvent event, const std::string& detail);
    void scheduleReconnect();
    void notify(ConnectionEvent event, const std::string& detail);
};
