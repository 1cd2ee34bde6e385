#pragma once
#include <chrono>
#include <memory>
#include <string>
#include "core/ShellSession.h"

struct ShellOutput {
    std::string command;    // 实际执行的命令 (含 cd 前缀)
    std::string output;
    bool captured = true;
};

/**
 * @brief 在会话中执行命令,与超时计时器赛跑
 * 先完成者胜;超时抛 TimeoutError,不返回部分输出。
 */
class ShellExecutor {
public:
    static constexpr long DEFAULT_TIMEOUT_MS = 10000;

    explicit ShellExecutor(std::shared_ptr<IShellSession> session);

    /** @brief cwd 非空且不是 "."/"./" 时加 "cd <cwd> && " 前缀,含空格的路径加引号 */
    static std::string buildCommand(const std::string& command, const std::string& cwd);

    ShellOutput run(const std::string& command, const std::string& cwd = "",
                    long timeoutMs = DEFAULT_TIMEOUT_MS);

    IShellSession& session() { return *shell; }

private:
    std::shared_ptr<IShellSession> shell;
};
