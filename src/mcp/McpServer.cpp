#include "mcp/McpServer.h"
#include "core/Errors.h"
#include "tools/SchemaValidator.h"
#include "utils/Logger.h"
#include "utils/TextCodec.h"
#include <algorithm>
#include <chrono>

McpServer::McpServer(ToolSetup setup) : setup(std::move(setup)) {}

McpServer::~McpServer() {
    waitForIdle();
    std::lock_guard<std::mutex> lock(transportMtx);
    transport.reset();
}

void McpServer::setupTools() {
    if (registered.load()) {
        Logger::getInstance().info("[McpServer] Tools already registered, skipping...");
        return;
    }

    std::call_once(setupOnce, [this]() {
        if (setup) setup(tools);
        registered.store(true);
        Logger::getInstance().success("[McpServer] Tools setup completed: " + std::to_string(tools.getToolCount()) +
                                      " tools, " + std::to_string(tools.getResourceCount()) + " resources");
    });
}

void McpServer::ensureTools() {
    if (!registered.load()) setupTools();
}

nlohmann::json McpServer::initializeResult() const {
    return {
        {"protocolVersion", PROTOCOL_VERSION},
        {"capabilities", {
            {"tools", {{"listChanged", false}}},
            {"resources", nlohmann::json::object()},
            {"logging", nlohmann::json::object()}
        }},
        {"serverInfo", {{"name", SERVER_NAME}, {"version", SERVER_VERSION}}}
    };
}

std::optional<Response> McpServer::handle(const Message& message) {
    if (const auto* request = std::get_if<Request>(&message)) {
        return handleRequest(*request);
    }
    if (const auto* note = std::get_if<Notification>(&message)) {
        if (note->method == "notifications/initialized") {
            Logger::getInstance().info("[McpServer] Client initialized");
        } else {
            Logger::getInstance().debug("[McpServer] Ignoring notification " + note->method);
        }
        return std::nullopt;
    }
    Logger::getInstance().debug("[McpServer] Ignoring " + JsonRpc::describe(message));
    return std::nullopt;
}

std::optional<Response> McpServer::handleText(const std::string& text) {
    Message message;
    try {
        message = JsonRpc::parse(text);
    } catch (const ProtocolError& e) {
        Logger::getInstance().warn(std::string("[McpServer] Rejected message: ") + e.what());
        return JsonRpc::makeError(e.id(), e.code(), e.what());
    }
    return handle(message);
}

Response McpServer::handleRequest(const Request& request) {
    const std::string& method = request.method;
    Logger::getInstance().debug("[McpServer] " + JsonRpc::describe(request));

    try {
        if (method == "initialize") {
            return JsonRpc::makeResult(request.id, initializeResult());
        }
        if (method == "ping") {
            return JsonRpc::makeResult(request.id, nlohmann::json::object());
        }

        if (method.rfind("tools/", 0) == 0 || method.rfind("resources/", 0) == 0) {
            try {
                ensureTools();
            } catch (const std::exception& e) {
                Logger::getInstance().error(std::string("[McpServer] Failed to setup tools: ") + e.what());
                return JsonRpc::makeError(request.id, JsonRpc::INTERNAL_ERROR, "Failed to initialize server tools");
            }
        }

        if (method == "tools/list") {
            return JsonRpc::makeResult(request.id, {{"tools", tools.listTools()}});
        }
        if (method == "tools/call") {
            return callTool(request);
        }
        if (method == "resources/list") {
            return JsonRpc::makeResult(request.id, {{"resources", tools.listResources()}});
        }
        if (method == "resources/templates/list") {
            return JsonRpc::makeResult(request.id, {{"resourceTemplates", tools.listResourceTemplates()}});
        }
        if (method == "resources/read") {
            return readResource(request);
        }

        return JsonRpc::makeError(request.id, JsonRpc::METHOD_NOT_FOUND, "Method not found: " + method);
    } catch (const std::exception& e) {
        Logger::getInstance().error("[McpServer] Error handling " + method + ": " + e.what());
        return JsonRpc::makeError(request.id, JsonRpc::INTERNAL_ERROR, std::string("Internal error: ") + e.what());
    } catch (...) {
        Logger::getInstance().error("[McpServer] Unknown error handling " + method);
        return JsonRpc::makeError(request.id, JsonRpc::INTERNAL_ERROR, "Internal error");
    }
}

Response McpServer::callTool(const Request& request) {
    const auto& params = request.params;
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return JsonRpc::makeError(request.id, JsonRpc::INVALID_PARAMS, "Invalid params: tool name is required");
    }
    std::string name = params["name"].get<std::string>();

    ITool* tool = tools.getTool(name);
    if (!tool) {
        return JsonRpc::makeError(request.id, JsonRpc::METHOD_NOT_FOUND, "Tool not found: " + name);
    }

    nlohmann::json args = params.contains("arguments") ? params["arguments"] : nlohmann::json::object();
    auto validation = SchemaValidator::validate(tool->getSchema(), args);
    if (!validation.valid) {
        return JsonRpc::makeError(request.id, JsonRpc::INVALID_PARAMS,
                                  "Invalid arguments for tool " + name + ": " + validation.error,
                                  {{"field", validation.field}});
    }

    auto started = std::chrono::steady_clock::now();
    ToolResult result;
    try {
        result = tool->execute(validation.args);
    } catch (const StaleStateError& e) {
        Logger::getInstance().warn("[McpServer] " + name + " rejected stale input");
        result = ToolResult::error(std::string("StaleState error: ") + e.what());
        // 文件内容可能不是合法 UTF-8,dump 前先清理
        result.content.push_back({{"type", "text"}, {"text", nlohmann::json{
            {"expected", TextCodec::sanitizeUtf8(e.expected())},
            {"actual", TextCodec::sanitizeUtf8(e.actual())}}.dump(2)}});
    } catch (const ToolError& e) {
        Logger::getInstance().warn("[McpServer] " + name + " failed: " + e.what());
        result = ToolResult::error(std::string(errorKindName(e.kind())) + " error: " + e.what());
    } catch (const std::exception& e) {
        Logger::getInstance().error("[McpServer] " + name + " threw: " + e.what());
        result = ToolResult::error(std::string("Internal error: ") + e.what());
    }

    // 响应要序列化为 JSON,文本必须是合法 UTF-8
    for (auto& block : result.content) {
        if (block.contains("text") && block["text"].is_string()) {
            block["text"] = TextCodec::sanitizeUtf8(block["text"].get<std::string>());
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    Logger::getInstance().debug("[McpServer] " + name + " finished in " + std::to_string(elapsed.count()) + "ms" +
                                (result.isError ? " (error)" : ""));
    return JsonRpc::makeResult(request.id, result.toJson());
}

Response McpServer::readResource(const Request& request) {
    const auto& params = request.params;
    if (!params.is_object() || !params.contains("uri") || !params["uri"].is_string()) {
        return JsonRpc::makeError(request.id, JsonRpc::INVALID_PARAMS, "Invalid params: uri is required");
    }
    std::string uri = params["uri"].get<std::string>();

    ResourceDefinition::Variables vars;
    const ResourceDefinition* resource = tools.findResource(uri, vars);
    if (!resource) {
        return JsonRpc::makeError(request.id, JsonRpc::INVALID_PARAMS, "Resource " + uri + " not found");
    }

    try {
        ResourceContents contents = resource->handler(uri, vars);
        nlohmann::json item = {{"uri", contents.uri}, {"mimeType", contents.mimeType}, {"text", contents.text}};
        return JsonRpc::makeResult(request.id, {{"contents", nlohmann::json::array({item})}});
    } catch (const std::exception& e) {
        Logger::getInstance().warn("[McpServer] Failed to read resource " + uri + ": " + e.what());
        return JsonRpc::makeError(request.id, JsonRpc::INTERNAL_ERROR, e.what());
    }
}

void McpServer::connect(std::shared_ptr<ITransport> next) {
    if (!next) {
        throw std::invalid_argument("McpServer::connect requires a transport");
    }

    std::weak_ptr<ITransport> weak = next;
    next->onMessage([this, weak](const Message& message) {
        auto via = weak.lock();
        if (!via) return;
        if (const auto* request = std::get_if<Request>(&message)) {
            dispatchAsync(via, *request);
        } else {
            handle(message);
        }
    });
    next->onClose([]() {
        Logger::getInstance().info("[McpServer] Transport closed");
    });
    next->onError([](const TransportError& e) {
        Logger::getInstance().warn(std::string("[McpServer] Transport error: ") + e.what());
    });
    next->start();

    std::shared_ptr<ITransport> previous;
    {
        std::lock_guard<std::mutex> lock(transportMtx);
        previous = std::move(transport);
        transport = std::move(next);
    }
    Logger::getInstance().info("[McpServer] Transport connected");
}

void McpServer::close() {
    std::shared_ptr<ITransport> current;
    {
        std::lock_guard<std::mutex> lock(transportMtx);
        current = transport;
    }
    if (current) current->close();
}

void McpServer::dispatchAsync(std::shared_ptr<ITransport> via, Request request) {
    std::lock_guard<std::mutex> lock(inFlightMtx);

    inFlight.erase(std::remove_if(inFlight.begin(), inFlight.end(), [](std::future<void>& f) {
        return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }), inFlight.end());

    inFlight.push_back(std::async(std::launch::async, [this, via, request = std::move(request)]() {
        Response response = handleRequest(request);
        try {
            via->send(response);
        } catch (const TransportError& e) {
            Logger::getInstance().warn("[McpServer] Discarding response #" + request.id.dump() + ": " + e.what());
        } catch (const std::exception& e) {
            Logger::getInstance().error("[McpServer] Failed to send response #" + request.id.dump() + ": " + e.what());
        }
    }));
}

void McpServer::waitForIdle() {
    std::vector<std::future<void>> pending;
    {
        std::lock_guard<std::mutex> lock(inFlightMtx);
        pending.swap(inFlight);
    }
    for (auto& f : pending) {
        if (f.valid()) f.wait();
    }
}
