#include "tools/ShellTools.h"
#include "core/Errors.h"
#include "tools/ToolRegistry.h"
#include "utils/Logger.h"

// ============================================================================
// ExecuteShellCommandTool
// ============================================================================

std::string ExecuteShellCommandTool::getDescription() const {
    return "Executes shell commands in the workspace shell session and captures the output when the session supports it.";
}

nlohmann::json ExecuteShellCommandTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"command", {{"type", "string"}, {"description", "The shell command to execute"}}},
            {"cwd", {{"type", "string"}, {"default", "."}, {"description", "Optional working directory for the command"}}},
            {"timeout", {{"type", "integer"}, {"default", ctx->defaultShellTimeoutMs},
                         {"description", "Command timeout in milliseconds"}}}
        }},
        {"required", {"command"}}
    };
}

ToolResult ExecuteShellCommandTool::execute(const nlohmann::json& args) {
    std::string command = args["command"].get<std::string>();
    std::string cwd = args["cwd"].get<std::string>();
    long timeout = args["timeout"].get<long>();

    Logger::getInstance().info("[ShellTools] Executing: " + command);
    ShellOutput out = ctx->shell->run(command, cwd, timeout);
    ctx->editorHost->focus();

    if (!out.captured) {
        return ToolResult::text("Command: " + out.command + "\n\n" + out.output);
    }
    return ToolResult::text("Command: " + command + "\n\nOutput:\n" + out.output);
}

// ============================================================================
// ShellListDirTool
// ============================================================================

std::string ShellListDirTool::getDescription() const {
    return "Lists files in a directory relative to the workspace root (best-effort).";
}

nlohmann::json ShellListDirTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"dir", {{"type", "string"}, {"default", "."}, {"description", "Directory to list (relative to workspace root)"}}}
        }}
    };
}

ToolResult ShellListDirTool::execute(const nlohmann::json& args) {
    std::string dir = args["dir"].get<std::string>();

    try {
        fs::path target = ctx->workspace->resolve(dir);
        std::error_code ec;
        fs::directory_iterator it(target, ec);
        if (ec) {
            throw NotFoundError(ec.message());
        }

        nlohmann::json files = nlohmann::json::array();
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) throw NotFoundError(ec.message());
            std::error_code typeEc;
            files.push_back({
                {"name", it->path().filename().u8string()},
                {"isDirectory", it->is_directory(typeEc)}
            });
        }
        ctx->editorHost->focus();
        return ToolResult::text(files.dump(2));
    } catch (const ToolError& e) {
        Logger::getInstance().warn("[ShellTools] Failed to list directory " + dir + ": " + e.what());
        return ToolResult::error("Failed to list directory " + dir + ": " + e.what());
    }
}

void registerShellTools(ToolRegistry& registry, std::shared_ptr<ToolContext> ctx) {
    registry.registerTool(std::make_unique<ExecuteShellCommandTool>(ctx));
    registry.registerTool(std::make_unique<ShellListDirTool>(ctx));
}
