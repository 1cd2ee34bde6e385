#include "server/HttpEndpoint.h"
#include "httplib.h"
#include "utils/Logger.h"
#include <chrono>
#include <cstdio>
#include <ctime>

namespace {
std::string isoTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms));
    return out;
}

long long elapsedMs(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - since).count();
}

nlohmann::json requestIdOf(const std::string& body) {
    nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_object() && j.contains("id")) return j["id"];
    return nullptr;
}
} // namespace

HttpEndpoint::HttpEndpoint(McpServer& server, Config::Http options)
    : server(server), opts(std::move(options)) {}

HttpEndpoint::~HttpEndpoint() {
    stop();
}

HttpReply HttpEndpoint::jsonReply(int status, const nlohmann::json& body) {
    HttpReply reply;
    reply.status = status;
    reply.body = body.dump();
    return reply;
}

HttpReply HttpEndpoint::methodNotAllowed() {
    return jsonReply(405, JsonRpc::toJson(JsonRpc::makeError(nullptr, JsonRpc::METHOD_NOT_ALLOWED, "Method not allowed.")));
}

HttpReply HttpEndpoint::handle(const std::string& method, const std::string& path, const std::string& body) {
    if (path == "/mcp") {
        if (method == "POST") return handlePost(body);
        if (method == "GET" || method == "DELETE") {
            Logger::getInstance().info("[Http] Received " + method + " MCP request");
            return methodNotAllowed();
        }
        if (method == "OPTIONS") {
            HttpReply reply;
            reply.status = 204;
            reply.contentType.clear();
            reply.headers = {
                {"Access-Control-Allow-Origin", "*"},
                {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
                {"Access-Control-Allow-Headers", "Content-Type, Accept"}
            };
            return reply;
        }
        return methodNotAllowed();
    }

    if (path == "/health" && method == "GET") {
        return jsonReply(200, {
            {"status", "healthy"},
            {"toolsRegistered", server.toolsRegistered()},
            {"timestamp", isoTimestamp()}
        });
    }

    return jsonReply(404, {{"error", "Not found"}});
}

HttpReply HttpEndpoint::handlePost(const std::string& body) {
    Logger::getInstance().info("[Http] Request received: POST /mcp " + body);

    if (!server.toolsRegistered()) {
        try {
            server.setupTools();
        } catch (const std::exception& e) {
            Logger::getInstance().error(std::string("[Http] Failed to setup tools during request handling: ") + e.what());
            return jsonReply(500, JsonRpc::toJson(JsonRpc::makeError(requestIdOf(body), JsonRpc::INTERNAL_ERROR,
                                                                     "Failed to initialize server tools")));
        }
    }

    auto response = server.handleText(body);
    if (!response) {
        HttpReply accepted;
        accepted.status = 202;
        accepted.contentType.clear();
        return accepted;
    }

    int status = 200;
    if (response->error && (response->error->code == JsonRpc::PARSE_ERROR ||
                            response->error->code == JsonRpc::INVALID_REQUEST)) {
        status = 400;
    }

    try {
        return jsonReply(status, JsonRpc::toJson(*response));
    } catch (const nlohmann::json::exception& e) {
        Logger::getInstance().error(std::string("[Http] Error encoding MCP response: ") + e.what());
        return jsonReply(500, JsonRpc::toJson(JsonRpc::makeError(response->id, JsonRpc::INTERNAL_ERROR,
                                                                 "Internal server error")));
    }
}

bool HttpEndpoint::start() {
    if (running->load()) return true;

    auto started = std::chrono::steady_clock::now();
    Logger::getInstance().info("[Http] Starting HTTP server");
    http = std::make_unique<httplib::Server>();

    auto route = [this](const httplib::Request& req, httplib::Response& res) {
        HttpReply reply = handle(req.method, req.path, req.body);
        res.status = reply.status;
        for (const auto& [name, value] : reply.headers) {
            res.set_header(name, value);
        }
        if (!reply.contentType.empty()) {
            res.set_content(reply.body, reply.contentType);
        }
    };
    http->Post("/mcp", route);
    http->Get("/mcp", route);
    http->Delete("/mcp", route);
    http->Options("/mcp", route);
    http->Get("/health", route);

    if (!http->bind_to_port(opts.host, opts.port)) {
        Logger::getInstance().error("[Http] Failed to bind " + opts.host + ":" + std::to_string(opts.port));
        http.reset();
        return false;
    }

    std::promise<void> done;
    listenDone = done.get_future();
    running->store(true);
    worker = std::thread([srv = http.get(), flag = running, done = std::move(done)]() mutable {
        if (!srv->listen_after_bind()) {
            Logger::getInstance().error("[Http] HTTP server stopped with an error");
        }
        flag->store(false);
        done.set_value();
    });

    Logger::getInstance().success("[Http] MCP server listening on " + opts.host + ":" + std::to_string(opts.port) +
                                  " (took " + std::to_string(elapsedMs(started)) + "ms)");
    return true;
}

void HttpEndpoint::stop(int forceTimeoutMs) {
    if (!http) return;

    auto started = std::chrono::steady_clock::now();
    Logger::getInstance().info("[Http] Closing HTTP server");
    http->stop();

    if (listenDone.valid() &&
        listenDone.wait_for(std::chrono::milliseconds(forceTimeoutMs)) == std::future_status::timeout) {
        Logger::getInstance().warn("[Http] HTTP server close timed out after " + std::to_string(forceTimeoutMs) +
                                   "ms - forcing close");
        if (worker.joinable()) worker.detach();
        // 分离的监听线程仍引用 http,不能释放
        http.release();
        running->store(false);
        return;
    }

    if (worker.joinable()) worker.join();
    http.reset();
    running->store(false);
    Logger::getInstance().info("[Http] HTTP server closed (took " + std::to_string(elapsedMs(started)) + "ms)");
}
