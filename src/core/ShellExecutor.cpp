#include "core/ShellExecutor.h"
#include "core/Errors.h"
#include "utils/Logger.h"
#include <future>
#include <stdexcept>
#include <thread>

ShellExecutor::ShellExecutor(std::shared_ptr<IShellSession> session)
    : shell(std::move(session)) {
    if (!shell) {
        throw std::invalid_argument("ShellExecutor requires a shell session");
    }
}

std::string ShellExecutor::buildCommand(const std::string& command, const std::string& cwd) {
    if (cwd.empty() || cwd == "." || cwd == "./") {
        return command;
    }
    std::string quoted = cwd.find(' ') != std::string::npos ? "\"" + cwd + "\"" : cwd;
    return "cd " + quoted + " && " + command;
}

ShellOutput ShellExecutor::run(const std::string& command, const std::string& cwd, long timeoutMs) {
    if (command.empty()) {
        throw ValidationError("command must not be empty");
    }
    if (timeoutMs <= 0) {
        throw ValidationError("timeout must be positive");
    }

    ShellOutput result;
    result.command = buildCommand(command, cwd);

    if (!shell->supportsOutputCapture()) {
        shell->sendText(result.command);
        result.captured = false;
        result.output = "Sent command to terminal: " + result.command + "\n(terminal output not captured)";
        return result;
    }

    auto timeout = std::chrono::milliseconds(timeoutMs);
    auto promise = std::make_shared<std::promise<std::string>>();
    std::future<std::string> future = promise->get_future();

    // 执行线程脱离调用方:超时后结果直接丢弃
    std::thread([session = shell, promise, fullCommand = result.command, timeout]() {
        try {
            promise->set_value(session->execute(fullCommand, timeout));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    if (future.wait_for(timeout) == std::future_status::timeout) {
        Logger::getInstance().warn("[Shell] Command timed out after " + std::to_string(timeoutMs) + "ms: " + result.command);
        throw TimeoutError("Command timed out after " + std::to_string(timeoutMs) + "ms");
    }

    result.output = future.get();
    return result;
}
