#pragma once
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

struct SocketEvents {
    std::function<void()> onOpen;
    std::function<void(const std::string&)> onText;
    std::function<void(int code, const std::string& reason)> onClose;
    std::function<void(const std::string& reason)> onError;
};

/**
 * @brief 文本帧 socket 抽象
 *
 * 事件可能在后台线程上触发。多个订阅者各自收到全部事件
 * (重连监督器关心 open/close/error,传输层关心 text)。
 */
class Socket {
public:
    virtual ~Socket() = default;

    /** @brief 发起连接;结果通过 onOpen 或 onError/onClose 通知 */
    virtual void connect() = 0;

    virtual bool isOpen() const = 0;

    /** @throws TransportError 未连接或发送失败 */
    virtual void sendText(const std::string& text) = 0;

    /** @brief 幂等 */
    virtual void close() = 0;

    size_t subscribe(SocketEvents events);
    void unsubscribe(size_t token);

protected:
    void emitOpen();
    void emitText(const std::string& text);
    void emitClose(int code, const std::string& reason);
    void emitError(const std::string& reason);

private:
    std::mutex listenersMtx;
    std::map<size_t, SocketEvents> listeners;
    size_t nextToken = 1;

    std::map<size_t, SocketEvents> snapshot();
};

using SocketFactory = std::function<std::shared_ptr<Socket>(const std::string& url)>;
