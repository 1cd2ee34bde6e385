#include "tools/WorkspaceResources.h"
#include "core/Errors.h"
#include "tools/ToolRegistry.h"
#include <algorithm>
#include <cctype>
#include <limits>
#include <unordered_map>

std::string mimeTypeFor(const fs::path& path) {
    static const std::unordered_map<std::string, std::string> mimeTypes = {
        {".js", "text/javascript"},
        {".ts", "text/typescript"},
        {".json", "application/json"},
        {".html", "text/html"},
        {".css", "text/css"},
        {".py", "text/x-python"},
        {".java", "text/x-java"},
        {".cpp", "text/x-c++src"},
        {".c", "text/x-csrc"},
        {".md", "text/markdown"},
        {".txt", "text/plain"}
    };

    std::string ext = path.extension().u8string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = mimeTypes.find(ext);
    return it == mimeTypes.end() ? "text/plain" : it->second;
}

void registerWorkspaceResources(ToolRegistry& registry, std::shared_ptr<ToolContext> ctx) {
    ResourceDefinition file;
    file.name = "workspace-file";
    file.uri = "file://{filePath}";
    file.title = "Workspace File";
    file.description = "Access files in the current workspace";
    file.mimeType = "text/plain";
    file.handler = [ctx](const std::string& uri, const ResourceDefinition::Variables& vars) {
        auto it = vars.find("filePath");
        if (it == vars.end() || it->second.empty()) {
            throw ValidationError("filePath is required");
        }
        try {
            std::string text = ctx->files->readFile(it->second, "utf-8", std::numeric_limits<size_t>::max());
            return ResourceContents{uri, mimeTypeFor(fs::u8path(it->second)), text};
        } catch (const ToolError& e) {
            throw ToolError(e.kind(), std::string("Failed to read file: ") + e.what());
        }
    };
    registry.registerResource(std::move(file));

    ResourceDefinition structure;
    structure.name = "workspace-structure";
    structure.uri = "workspace://structure";
    structure.title = "Workspace Structure";
    structure.description = "Get the structure of the current workspace";
    structure.mimeType = "application/json";
    structure.handler = [ctx](const std::string& uri, const ResourceDefinition::Variables&) {
        return ResourceContents{uri, "application/json", ctx->files->workspaceStructure().dump(2)};
    };
    registry.registerResource(std::move(structure));
}
