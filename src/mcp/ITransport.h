#pragma once
#include <functional>
#include "core/Errors.h"
#include "mcp/Protocol.h"

/**
 * @brief 双向消息通道
 * 回调都是单槽的,后注册的覆盖先注册的。
 */
class ITransport {
public:
    using MessageHandler = std::function<void(const Message&)>;
    using CloseHandler = std::function<void()>;
    using ErrorHandler = std::function<void(const TransportError&)>;

    virtual ~ITransport() = default;

    /** @throws TransportError 底层连接未打开 */
    virtual void start() = 0;

    /** @throws TransportError 底层连接未打开或写入失败 */
    virtual void send(const Message& message) = 0;

    /** @brief 幂等 */
    virtual void close() = 0;

    virtual void onMessage(MessageHandler handler) = 0;
    virtual void onClose(CloseHandler handler) = 0;
    virtual void onError(ErrorHandler handler) = 0;
};
