#pragma once
#include <chrono>
#include <string>
#include "core/Workspace.h"

/**
 * @brief 持久 shell 会话接口 (外部协作者)
 */
class IShellSession {
public:
    virtual ~IShellSession() = default;

    /** @brief 能否读取命令输出;不能时只能 sendText */
    virtual bool supportsOutputCapture() const = 0;

    /**
     * @brief 执行命令并收集 stdout/stderr
     * @throws TimeoutError 超过 timeout 仍未结束
     */
    virtual std::string execute(const std::string& command, std::chrono::milliseconds timeout) = 0;

    /** @brief 只把命令交给会话执行,不等待也不读输出 */
    virtual void sendText(const std::string& command) = 0;
};

/**
 * @brief 基于 /bin/sh -c 的会话
 * 每条命令一个子进程,工作目录为当前工作区根;超时时杀掉整个进程组。
 */
class PosixShellSession : public IShellSession {
public:
    PosixShellSession(const Workspace& workspace, bool captureOutput = true);

    bool supportsOutputCapture() const override { return captureOutput; }
    std::string execute(const std::string& command, std::chrono::milliseconds timeout) override;
    void sendText(const std::string& command) override;

private:
    const Workspace& workspace;
    bool captureOutput;
};
