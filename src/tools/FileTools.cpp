#include "tools/FileTools.h"
#include "core/Errors.h"
#include "tools/ToolRegistry.h"
#include "utils/Logger.h"

fs::path workspaceFolderFor(const fs::path& target) {
    std::error_code ec;
    fs::path folder;

    if (fs::exists(target, ec)) {
        folder = fs::is_regular_file(target, ec) ? target.parent_path() : target;
    } else if (target.has_extension()) {
        folder = target.parent_path();
    } else {
        folder = target;
    }

    if (folder.empty() || !fs::is_directory(folder, ec)) {
        fs::path cwd = fs::current_path(ec);
        Logger::getInstance().warn("[FileTools] Folder " + folder.u8string() + " doesn't exist. Using current working directory.");
        folder = cwd;
    }
    return folder;
}

fs::path openWorkspaceFor(ToolContext& ctx, const fs::path& target) {
    fs::path folder = workspaceFolderFor(target);
    Logger::getInstance().info("[FileTools] Opening workspace at: " + folder.u8string());

    ctx.workspace->open(folder);
    fs::path root = ctx.workspace->root();
    ctx.editorHost->openFolder(root);
    ctx.editorHost->focus();
    return root;
}

// ============================================================================
// ListFilesTool
// ============================================================================

std::string ListFilesTool::getDescription() const {
    return "Lists files in workspace. Returns a JSON array of {path, type} entries; "
           "version-control, build and dependency directories are skipped.";
}

nlohmann::json ListFilesTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"path", {{"type", "string"}, {"description", "Directory path relative to the workspace root"}}},
            {"recursive", {{"type", "boolean"}, {"default", false}, {"description", "Whether to descend into subdirectories"}}}
        }},
        {"required", {"path"}}
    };
}

ToolResult ListFilesTool::execute(const nlohmann::json& args) {
    std::string path = args["path"].get<std::string>();
    bool recursive = args["recursive"].get<bool>();

    auto entries = ctx->files->listFiles(path, recursive);
    ctx->editorHost->focus();
    return ToolResult::text(FileQueryEngine::toJson(entries).dump(2));
}

// ============================================================================
// ReadFileTool
// ============================================================================

std::string ReadFileTool::getDescription() const {
    return "Reads file content. Fails if the decoded content exceeds maxCharacters. "
           "encoding 'base64' returns the raw bytes base64-encoded.";
}

nlohmann::json ReadFileTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"path", {{"type", "string"}, {"description", "File path relative to the workspace root"}}},
            {"encoding", {{"type", "string"}, {"default", "utf-8"}}},
            {"maxCharacters", {{"type", "integer"}, {"default", ctx->defaultMaxCharacters}}},
            {"startLine", {{"type", "integer"}, {"default", -1}, {"description", "0-based first line (inclusive)"}}},
            {"endLine", {{"type", "integer"}, {"default", -1}, {"description", "0-based last line (inclusive)"}}}
        }},
        {"required", {"path"}}
    };
}

ToolResult ReadFileTool::execute(const nlohmann::json& args) {
    std::string path = args["path"].get<std::string>();
    long maxCharacters = args["maxCharacters"].get<long>();
    if (maxCharacters < 0) {
        throw ValidationError("maxCharacters must not be negative");
    }

    std::string content = ctx->files->readFile(path, args["encoding"].get<std::string>(),
                                               static_cast<size_t>(maxCharacters),
                                               args["startLine"].get<long>(), args["endLine"].get<long>());
    ctx->editorHost->focus();
    return ToolResult::text(content);
}

// ============================================================================
// FindFileTool
// ============================================================================

std::string FindFileTool::getDescription() const {
    return "Search for files recursively and open workspace. Searches the workspace first, "
           "then common locations (current directory, its parents, home, Desktop, Documents) up to 3 levels deep.";
}

nlohmann::json FindFileTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"startPath", {{"type", "string"}, {"default", "."}}},
            {"targetName", {{"type", "string"}, {"description", "The filename to search for (e.g., '1543.cpp')"}}},
            {"openWorkspace", {{"type", "boolean"}, {"default", true}, {"description", "Whether to automatically open workspace"}}}
        }},
        {"required", {"targetName"}}
    };
}

ToolResult FindFileTool::execute(const nlohmann::json& args) {
    std::string startPath = args["startPath"].get<std::string>();
    std::string targetName = args["targetName"].get<std::string>();
    bool openWorkspace = args["openWorkspace"].get<bool>();

    Logger::getInstance().info("[FileTools] Searching for file: " + targetName);
    auto matches = ctx->locator->findFiles(startPath, targetName);

    nlohmann::json result;
    if (matches.empty()) {
        std::error_code ec;
        fs::path cwd = fs::current_path(ec);
        Logger::getInstance().info("[FileTools] File " + targetName + " not found. Opening default workspace.");
        if (openWorkspace) {
            openWorkspaceFor(*ctx, cwd);
        }
        result = {
            {"matches", nlohmann::json::array()},
            {"message", "File '" + targetName + "' not found. Opened default workspace at: " + cwd.u8string()},
            {"workspaceOpened", cwd.u8string()}
        };
    } else if (matches.size() == 1) {
        // 工作区阶段的结果是相对路径
        fs::path match = fs::u8path(matches[0]);
        if (match.is_relative()) {
            match = ctx->workspace->root() / match;
        }
        Logger::getInstance().info("[FileTools] File found: " + match.u8string());
        if (openWorkspace) {
            openWorkspaceFor(*ctx, match);
        }
        result = {
            {"matches", matches},
            {"selectedFile", match.u8string()},
            {"message", "Found single file: " + match.u8string() + ". Workspace opened."},
            {"workspaceOpened", match.parent_path().u8string()}
        };
    } else {
        Logger::getInstance().info("[FileTools] Multiple matches found for " + targetName + ": " +
                                   std::to_string(matches.size()));
        ctx->editorHost->focus();
        result = {
            {"matches", matches},
            {"message", "Multiple files found with name '" + targetName + "'. Please select one:"},
            {"instruction", "Use 'open_workspace_for_file' tool with the specific path you want to work with."}
        };
    }
    return ToolResult::text(result.dump(2));
}

// ============================================================================
// OpenWorkspaceTool
// ============================================================================

std::string OpenWorkspaceTool::getDescription() const {
    return "Opens the workspace for a specific file path. A file opens its parent directory.";
}

nlohmann::json OpenWorkspaceTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"filePath", {{"type", "string"}, {"description", "Full path to the file or directory to open workspace for"}}}
        }},
        {"required", {"filePath"}}
    };
}

ToolResult OpenWorkspaceTool::execute(const nlohmann::json& args) {
    std::string filePath = args["filePath"].get<std::string>();
    if (filePath.empty()) {
        throw ValidationError("filePath must not be empty");
    }

    Logger::getInstance().info("[FileTools] Opening workspace for file: " + filePath);
    fs::path root = openWorkspaceFor(*ctx, fs::u8path(filePath));

    nlohmann::json result = {
        {"success", true},
        {"message", "Workspace opened successfully"},
        {"workspacePath", root.u8string()},
        {"targetFile", filePath}
    };
    return ToolResult::text(result.dump(2));
}

void registerFileTools(ToolRegistry& registry, std::shared_ptr<ToolContext> ctx) {
    registry.registerTool(std::make_unique<ListFilesTool>(ctx));
    registry.registerTool(std::make_unique<ReadFileTool>(ctx));
    registry.registerTool(std::make_unique<FindFileTool>(ctx));
    registry.registerTool(std::make_unique<OpenWorkspaceTool>(ctx));
}
