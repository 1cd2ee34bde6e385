#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include "core/ConfigManager.h"
#include "core/EditorHost.h"
#include "core/ShellSession.h"
#include "core/Workspace.h"
#include "mcp/BackendConnection.h"
#include "mcp/IxWebSocketConnection.h"
#include "mcp/McpServer.h"
#include "server/HttpEndpoint.h"
#include "tools/ToolContext.h"
#include "tools/ToolSetup.h"
#include "utils/Logger.h"

namespace {
volatile std::sig_atomic_t shutdownRequested = 0;

void onSignal(int) {
    shutdownRequested = 1;
}

void printUsage() {
    std::cerr << "Usage: tether [workspace_path] [config_path]" << std::endl;
}
} // namespace

int main(int argc, char* argv[]) {
    std::string workspacePath;
    std::string configPath = "tether.json";

    if (argc >= 2) {
        std::string first = argv[1];
        if (first == "-h" || first == "--help") {
            printUsage();
            return 0;
        }
        workspacePath = first;
    }
    if (argc >= 3) {
        configPath = argv[2];
    }

    Config cfg;
    if (argc >= 3 || fs::exists(fs::u8path(configPath))) {
        try {
            cfg = Config::load(configPath);
        } catch (const std::exception& e) {
            std::cerr << "Failed to load config: " << e.what() << std::endl;
            return 1;
        }
    }

    auto& log = Logger::getInstance();
    log.setLogFile(cfg.log.file);
    log.setDebugEnabled(cfg.log.debug);
    log.info("[Main] Starting " + std::string(McpServer::SERVER_NAME) + " " + McpServer::SERVER_VERSION);

    auto workspace = std::make_shared<Workspace>();
    std::string root = workspacePath.empty() ? cfg.workspace.root : workspacePath;
    if (!root.empty()) {
        std::error_code ec;
        fs::path rootPath = fs::u8path(root);
        if (!fs::is_directory(rootPath, ec)) {
            std::cerr << "Workspace is not a directory: " << root << std::endl;
            return 1;
        }
        workspace->open(fs::canonical(rootPath));
        log.info("[Main] Workspace: " + workspace->root().u8string());
    } else {
        log.warn("[Main] No workspace folder open");
    }

    auto editorHost = std::make_shared<HeadlessEditorHost>();
    auto shellSession = std::make_shared<PosixShellSession>(*workspace, cfg.shell.captureOutput);
    auto ctx = ToolContext::create(cfg, workspace, editorHost, shellSession);

    McpServer server(makeToolSetup(ctx, cfg.tools));
    try {
        server.setupTools();
    } catch (const std::exception& e) {
        // HTTP 请求和 tools/* 请求到来时会再次尝试
        log.error(std::string("[Main] Tool setup failed: ") + e.what());
    }

    std::unique_ptr<HttpEndpoint> http;
    if (cfg.http.enabled) {
        http = std::make_unique<HttpEndpoint>(server, cfg.http);
        if (!http->start()) {
            log.error("[Main] HTTP endpoint unavailable");
            http.reset();
        }
    }

    std::unique_ptr<BackendConnection> backend;
    if (cfg.backend.enabled) {
        BackendOptions options;
        options.url = cfg.backend.url();
        options.reconnectDelay = std::chrono::milliseconds(cfg.backend.reconnectDelayMs);

        backend = std::make_unique<BackendConnection>(
            options, IxWebSocketConnection::factory(),
            [&server](std::shared_ptr<ITransport> transport) { server.connect(std::move(transport)); });
        backend->setListener([&log](ConnectionEvent event, const std::string& detail) {
            switch (event) {
                case ConnectionEvent::Connected: log.success("[Main] Backend connected"); break;
                case ConnectionEvent::Disconnected: log.warn("[Main] Backend disconnected: " + detail); break;
                case ConnectionEvent::Error: log.error("[Main] Backend error: " + detail); break;
            }
        });

        log.info("[Main] Connecting to backend " + options.url);
        auto first = backend->start();
        std::thread([first = std::move(first), &log]() mutable {
            try {
                first.get();
            } catch (const std::exception& e) {
                log.warn(std::string("[Main] Initial backend connection failed, retrying: ") + e.what());
            }
        }).detach();
    }

    if (!http && !backend) {
        log.error("[Main] Neither HTTP nor backend is enabled, nothing to serve");
        return 1;
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    while (!shutdownRequested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    log.info("[Main] Shutting down");
    if (backend) backend->stop();
    if (http) http->stop();
    server.close();
    server.waitForIdle();
    log.info("[Main] Bye");
    return 0;
}
