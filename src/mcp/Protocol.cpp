#include "mcp/Protocol.h"

namespace {
bool isValidId(const nlohmann::json& id) {
    return id.is_string() || id.is_number_integer() || id.is_number_unsigned();
}

nlohmann::json paramsOf(const nlohmann::json& j) {
    if (!j.contains("params") || j["params"].is_null()) {
        return nlohmann::json::object();
    }
    const auto& params = j["params"];
    if (!params.is_object() && !params.is_array()) {
        throw ProtocolError(JsonRpc::INVALID_REQUEST, "params must be an object or array",
                            j.contains("id") ? j["id"] : nlohmann::json());
    }
    return params;
}
} // namespace

namespace JsonRpc {

Message parse(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ProtocolError(PARSE_ERROR, std::string("Parse error: ") + e.what());
    }
    return fromJson(j);
}

Message fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ProtocolError(INVALID_REQUEST, "Invalid Request: message must be a JSON object");
    }

    nlohmann::json id = j.contains("id") ? j["id"] : nlohmann::json();

    if (j.contains("jsonrpc") && j["jsonrpc"] != VERSION) {
        throw ProtocolError(INVALID_REQUEST, "Invalid Request: unsupported jsonrpc version", id);
    }

    if (j.contains("method")) {
        if (!j["method"].is_string()) {
            throw ProtocolError(INVALID_REQUEST, "Invalid Request: method must be a string", id);
        }
        std::string method = j["method"].get<std::string>();

        if (!j.contains("id")) {
            return Notification{method, paramsOf(j)};
        }
        if (!isValidId(id)) {
            throw ProtocolError(INVALID_REQUEST, "Invalid Request: id must be a string or integer");
        }
        return Request{id, method, paramsOf(j)};
    }

    if (j.contains("result") || j.contains("error")) {
        Response response;
        response.id = id;
        if (j.contains("error")) {
            const auto& err = j["error"];
            if (!err.is_object() || !err.contains("code") || !err["code"].is_number_integer()) {
                throw ProtocolError(INVALID_REQUEST, "Invalid Response: malformed error object", id);
            }
            RpcError error;
            error.code = err["code"].get<int>();
            error.message = err.value("message", "");
            error.data = err.contains("data") ? err["data"] : nlohmann::json();
            response.error = error;
        } else {
            response.result = j["result"];
        }
        return response;
    }

    throw ProtocolError(INVALID_REQUEST, "Invalid Request: missing method", id);
}

nlohmann::json toJson(const Message& message) {
    nlohmann::json j;
    j["jsonrpc"] = VERSION;

    if (const auto* req = std::get_if<Request>(&message)) {
        j["id"] = req->id;
        j["method"] = req->method;
        j["params"] = req->params;
    } else if (const auto* note = std::get_if<Notification>(&message)) {
        j["method"] = note->method;
        if (!note->params.empty()) j["params"] = note->params;
    } else {
        const auto& res = std::get<Response>(message);
        j["id"] = res.id;
        if (res.error) {
            nlohmann::json err = {{"code", res.error->code}, {"message", res.error->message}};
            if (!res.error->data.is_null()) err["data"] = res.error->data;
            j["error"] = err;
        } else {
            j["result"] = res.result ? *res.result : nlohmann::json::object();
        }
    }
    return j;
}

std::string serialize(const Message& message) {
    return toJson(message).dump();
}

Response makeResult(const nlohmann::json& id, nlohmann::json result) {
    Response res;
    res.id = id;
    res.result = std::move(result);
    return res;
}

Response makeError(const nlohmann::json& id, int code, const std::string& message, nlohmann::json data) {
    Response res;
    res.id = id;
    res.error = RpcError{code, message, std::move(data)};
    return res;
}

std::string describe(const Message& message) {
    if (const auto* req = std::get_if<Request>(&message)) {
        return "request " + req->method + " #" + req->id.dump();
    }
    if (const auto* note = std::get_if<Notification>(&message)) {
        return "notification " + note->method;
    }
    const auto& res = std::get<Response>(message);
    return std::string(res.error ? "error response #" : "response #") + res.id.dump();
}

} // namespace JsonRpc
