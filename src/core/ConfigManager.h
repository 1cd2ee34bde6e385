#pragma once
#include <string>
#include <vector>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <nlohmann/json.hpp>

struct Config {
    struct Workspace {
        std::string root;
    } workspace;

    struct Backend {
        bool enabled = true;
        std::string baseUrl = "ws://localhost:8000";
        std::string clientId = "default";
        int reconnectDelayMs = 5000;

        // 后端地址: <base_url>/ws/<client_id>
        std::string url() const {
            std::string base = baseUrl;
            while (!base.empty() && base.back() == '/') base.pop_back();
            return base + "/ws/" + clientId;
        }
    } backend;

    struct Http {
        bool enabled = true;
        std::string host = "127.0.0.1";
        int port = 3000;
    } http;

    struct Tools {
        bool file = true;
        bool edit = true;
        bool shell = true;
    } tools;

    struct Shell {
        int defaultTimeoutMs = 10000;
        bool captureOutput = true;
    } shell;

    struct Edit {
        int defaultSpeedMsPerChar = 50;
    } edit;

    struct Files {
        int defaultMaxCharacters = 100000;
        /** 额外忽略规则：正则列表（ECMAScript），条目名匹配任一则跳过；内置忽略集合始终生效 */
        std::vector<std::string> ignorePatterns;
    } files;

    struct Log {
        std::string file = "tether.log";
        bool debug = false;
    } log;

    static Config defaults() { return Config{}; }

    static Config fromJson(const nlohmann::json& j) {
        Config cfg;
        if (j.contains("workspace")) {
            const auto& w = j["workspace"];
            cfg.workspace.root = w.value("root", cfg.workspace.root);
        }
        if (j.contains("backend")) {
            const auto& b = j["backend"];
            cfg.backend.enabled = b.value("enabled", cfg.backend.enabled);
            cfg.backend.baseUrl = b.value("base_url", cfg.backend.baseUrl);
            cfg.backend.clientId = b.value("client_id", cfg.backend.clientId);
            cfg.backend.reconnectDelayMs = b.value("reconnect_delay_ms", cfg.backend.reconnectDelayMs);
        }
        if (j.contains("http")) {
            const auto& h = j["http"];
            cfg.http.enabled = h.value("enabled", cfg.http.enabled);
            cfg.http.host = h.value("host", cfg.http.host);
            cfg.http.port = h.value("port", cfg.http.port);
        }
        if (j.contains("tools")) {
            const auto& t = j["tools"];
            cfg.tools.file = t.value("file", cfg.tools.file);
            cfg.tools.edit = t.value("edit", cfg.tools.edit);
            cfg.tools.shell = t.value("shell", cfg.tools.shell);
        }
        if (j.contains("shell")) {
            const auto& s = j["shell"];
            cfg.shell.defaultTimeoutMs = s.value("default_timeout_ms", cfg.shell.defaultTimeoutMs);
            cfg.shell.captureOutput = s.value("capture_output", cfg.shell.captureOutput);
        }
        if (j.contains("edit")) {
            cfg.edit.defaultSpeedMsPerChar = j["edit"].value("default_speed_ms_per_char", cfg.edit.defaultSpeedMsPerChar);
        }
        if (j.contains("files")) {
            const auto& f = j["files"];
            cfg.files.defaultMaxCharacters = f.value("default_max_characters", cfg.files.defaultMaxCharacters);
            if (f.contains("ignore_patterns")) {
                cfg.files.ignorePatterns = f["ignore_patterns"].get<std::vector<std::string>>();
            }
        }
        if (j.contains("log")) {
            const auto& l = j["log"];
            cfg.log.file = l.value("file", cfg.log.file);
            cfg.log.debug = l.value("debug", cfg.log.debug);
        }

        if (cfg.backend.reconnectDelayMs < 0) {
            throw std::runtime_error("backend.reconnect_delay_ms must not be negative");
        }
        if (cfg.http.port <= 0 || cfg.http.port > 65535) {
            throw std::runtime_error("http.port out of range: " + std::to_string(cfg.http.port));
        }
        return cfg;
    }

    static Config load(const std::string& pathStr) {
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open config file: " + pathStr);
        }

        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON Parse Error in " + path.string() + ": " + e.what());
        }

        try {
            return fromJson(j);
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Invalid config value in " + path.string() + ": " + e.what());
        }
    }
};
