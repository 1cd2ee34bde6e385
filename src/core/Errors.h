#pragma once
#include <stdexcept>
#include <string>

/**
 * @brief 工具层错误分类
 *
 * 工具只负责抛出,由 McpServer 在分发边界统一转换为协议响应。
 */
enum class ErrorKind {
    Validation,     // 参数缺失或非法
    Precondition,   // 未打开工作区、行号越界
    StaleState,     // replace 时 originalCode 与当前内容不一致
    NotFound,       // 目标文件/目录不存在
    Timeout,        // shell 命令超时
    Transport,      // socket 未打开、消息解析失败
    Internal        // 其他未预期错误
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "Validation";
        case ErrorKind::Precondition: return "Precondition";
        case ErrorKind::StaleState: return "StaleState";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::Timeout: return "Timeout";
        case ErrorKind::Transport: return "Transport";
        case ErrorKind::Internal: return "Internal";
    }
    return "Internal";
}

class ToolError : public std::runtime_error {
public:
    ToolError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class ValidationError : public ToolError {
public:
    explicit ValidationError(const std::string& message) : ToolError(ErrorKind::Validation, message) {}
};

class PreconditionError : public ToolError {
public:
    explicit PreconditionError(const std::string& message) : ToolError(ErrorKind::Precondition, message) {}
};

class StaleStateError : public ToolError {
public:
    StaleStateError(const std::string& message, std::string expected, std::string actual)
        : ToolError(ErrorKind::StaleState, message), expected_(std::move(expected)), actual_(std::move(actual)) {}

    const std::string& expected() const { return expected_; }
    const std::string& actual() const { return actual_; }

private:
    std::string expected_;
    std::string actual_;
};

class NotFoundError : public ToolError {
public:
    explicit NotFoundError(const std::string& message) : ToolError(ErrorKind::NotFound, message) {}
};

class TimeoutError : public ToolError {
public:
    explicit TimeoutError(const std::string& message) : ToolError(ErrorKind::Timeout, message) {}
};

class TransportError : public ToolError {
public:
    explicit TransportError(const std::string& message) : ToolError(ErrorKind::Transport, message) {}
};
