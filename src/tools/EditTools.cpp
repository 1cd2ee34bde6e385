#include "tools/EditTools.h"
#include "core/Errors.h"
#include "tools/ToolRegistry.h"
#include "utils/Logger.h"

// ============================================================================
// CreateFileTool
// ============================================================================

std::string CreateFileTool::getDescription() const {
    return "Creates new files or completely rewrites existing files. Opens the file in editor when done.";
}

nlohmann::json CreateFileTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"path", {{"type", "string"}, {"description", "The path to the file to create"}}},
            {"content", {{"type", "string"}, {"description", "The content to write to the file"}}},
            {"overwrite", {{"type", "boolean"}, {"default", false}, {"description", "Whether to overwrite if the file exists"}}},
            {"ignoreIfExists", {{"type", "boolean"}, {"default", false}, {"description", "Whether to ignore if the file exists"}}}
        }},
        {"required", {"path", "content"}}
    };
}

ToolResult CreateFileTool::execute(const nlohmann::json& args) {
    std::string path = args["path"].get<std::string>();
    auto result = ctx->editor->createFile(path, args["content"].get<std::string>(),
                                          args["overwrite"].get<bool>(), args["ignoreIfExists"].get<bool>());

    if (!result.written) {
        return ToolResult::text("File " + path + " already exists, left unchanged and opened in editor");
    }
    Logger::getInstance().info("[EditTools] Created " + path);
    return ToolResult::text("File " + path + " created and opened in editor");
}

// ============================================================================
// ReplaceLinesTool
// ============================================================================

std::string ReplaceLinesTool::getDescription() const {
    return "Replaces specific lines in existing files with exact content validation. "
           "Use 1-based startLine/endLine values. Opens file before editing.";
}

nlohmann::json ReplaceLinesTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"path", {{"type", "string"}, {"description", "The path to the file to modify"}}},
            {"startLine", {{"type", "integer"}, {"description", "The start line number (1-based, inclusive)"}}},
            {"endLine", {{"type", "integer"}, {"description", "The end line number (1-based, inclusive)"}}},
            {"content", {{"type", "string"}, {"description", "The new content to replace the lines with"}}},
            {"originalCode", {{"type", "string"}, {"description", "The original code for validation - must match exactly"}}}
        }},
        {"required", {"path", "startLine", "endLine", "content", "originalCode"}}
    };
}

ToolResult ReplaceLinesTool::execute(const nlohmann::json& args) {
    std::string path = args["path"].get<std::string>();
    long startLine = args["startLine"].get<long>();
    long endLine = args["endLine"].get<long>();

    // 1 起始转 0 起始;非正数统一映射到 -1,由 replaceLines 报越界
    auto toZeroBased = [](long line) { return line > 0 ? line - 1 : -1L; };
    ctx->editor->replaceLines(path, toZeroBased(startLine), toZeroBased(endLine),
                              args["content"].get<std::string>(), args["originalCode"].get<std::string>());

    return ToolResult::text("Lines " + std::to_string(startLine) + "-" + std::to_string(endLine) +
                            " in file " + path + " replaced and file opened in editor");
}

// ============================================================================
// TypeIntoFileTool
// ============================================================================

std::string TypeIntoFileTool::getDescription() const {
    return "Types text into the given file character-by-character at specified speed (ms per character). "
           "The file will be opened and saved when finished.";
}

nlohmann::json TypeIntoFileTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"path", {{"type", "string"}, {"description", "The path to the file to type into"}}},
            {"content", {{"type", "string"}, {"description", "The text to type into the file"}}},
            {"speedMsPerChar", {{"type", "integer"}, {"default", ctx->defaultSpeedMsPerChar},
                                {"description", "Milliseconds delay between each character"}}},
            {"insertAtLine", {{"type", "integer"}, {"default", -1},
                              {"description", "1-based line number to insert at (default = end of file)"}}},
            {"insertAtColumn", {{"type", "integer"}, {"default", -1},
                                {"description", "0-based column to insert at (default = end of line)"}}}
        }},
        {"required", {"path", "content"}}
    };
}

ToolResult TypeIntoFileTool::execute(const nlohmann::json& args) {
    std::string path = args["path"].get<std::string>();
    long speed = args["speedMsPerChar"].get<long>();
    long insertAtLine = args["insertAtLine"].get<long>();
    long insertAtColumn = args["insertAtColumn"].get<long>();

    if (speed < 0) {
        throw ValidationError("speedMsPerChar must not be negative");
    }

    std::optional<size_t> line;
    std::optional<size_t> column;
    if (insertAtLine > 0) line = static_cast<size_t>(insertAtLine - 1);
    if (insertAtColumn >= 0) column = static_cast<size_t>(insertAtColumn);

    ctx->editor->typeIntoFile(path, args["content"].get<std::string>(), speed, line, column);

    return ToolResult::text("Typed into " + path + " at " + std::to_string(speed) + "ms/char and saved.");
}

void registerEditTools(ToolRegistry& registry, std::shared_ptr<ToolContext> ctx) {
    registry.registerTool(std::make_unique<CreateFileTool>(ctx));
    registry.registerTool(std::make_unique<ReplaceLinesTool>(ctx));
    registry.registerTool(std::make_unique<TypeIntoFileTool>(ctx));
}
