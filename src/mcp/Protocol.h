#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

/**
 * @brief JSON-RPC 2.0 消息模型
 */
namespace JsonRpc {
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;
constexpr int METHOD_NOT_ALLOWED = -32000;

constexpr const char* VERSION = "2.0";
} // namespace JsonRpc

struct RpcError {
    int code = JsonRpc::INTERNAL_ERROR;
    std::string message;
    nlohmann::json data;    // null 时不序列化
};

struct Request {
    nlohmann::json id;      // number 或 string
    std::string method;
    nlohmann::json params = nlohmann::json::object();
};

struct Notification {
    std::string method;
    nlohmann::json params = nlohmann::json::object();
};

struct Response {
    nlohmann::json id;      // 无法确定请求 id 时为 null
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    bool isError() const { return error.has_value(); }
};

using Message = std::variant<Request, Response, Notification>;

/**
 * @brief 消息格式错误,携带应回给对端的 JSON-RPC 错误码
 */
class ProtocolError : public std::runtime_error {
public:
    ProtocolError(int code, const std::string& message, nlohmann::json id = nullptr)
        : std::runtime_error(message), code_(code), id_(std::move(id)) {}

    int code() const { return code_; }
    const nlohmann::json& id() const { return id_; }

private:
    int code_;
    nlohmann::json id_;
};

namespace JsonRpc {

/** @throws ProtocolError PARSE_ERROR 不是合法 JSON;INVALID_REQUEST 结构不符 */
Message parse(const std::string& text);

/** @throws ProtocolError INVALID_REQUEST */
Message fromJson(const nlohmann::json& j);

nlohmann::json toJson(const Message& message);
std::string serialize(const Message& message);

Response makeResult(const nlohmann::json& id, nlohmann::json result);
Response makeError(const nlohmann::json& id, int code, const std::string& message,
                   nlohmann::json data = nullptr);

/** @brief 日志用的简短描述,例如 "request tools/call #3" */
std::string describe(const Message& message);

} // namespace JsonRpc
