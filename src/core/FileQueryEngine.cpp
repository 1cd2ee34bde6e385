#include "core/FileQueryEngine.h"
#include "core/Errors.h"
#include "utils/Logger.h"
#include "utils/TextCodec.h"
#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>

FileQueryEngine::FileQueryEngine(Workspace& workspace, std::shared_ptr<ScanIgnoreRules> ignoreRules)
    : workspace(workspace), ignore(std::move(ignoreRules)) {
    if (!ignore) ignore = std::make_shared<ScanIgnoreRules>();
}

std::vector<FileEntry> FileQueryEngine::listFiles(const std::string& relativePath, bool recursive) const {
    fs::path target = workspace.resolve(relativePath.empty() ? "." : relativePath);

    std::error_code ec;
    if (!fs::exists(target, ec)) {
        throw NotFoundError("Path not found: " + relativePath);
    }
    if (!fs::is_directory(target, ec)) {
        throw NotFoundError("Not a directory: " + relativePath);
    }

    std::vector<FileEntry> result;
    listDirectory(target, "", recursive, result);
    return result;
}

void FileQueryEngine::listDirectory(const fs::path& dir, const std::string& prefix, bool recursive,
                                    std::vector<FileEntry>& out) const {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        Logger::getInstance().warn("[FileQuery] Failed to read directory " + dir.u8string() + ": " + ec.message());
        return;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            Logger::getInstance().warn("[FileQuery] Failed to read directory " + dir.u8string() + ": " + ec.message());
            return;
        }
        const auto& entry = *it;
        std::string name = entry.path().filename().u8string();
        if (ignore->shouldIgnore(name)) continue;

        std::error_code typeEc;
        bool isDir = entry.is_directory(typeEc);
        std::string entryPath = prefix.empty() ? name : prefix + "/" + name;
        out.push_back({entryPath, isDir});

        // 符号链接目录不再深入,避免环
        if (recursive && isDir && !entry.is_symlink(typeEc)) {
            listDirectory(entry.path(), entryPath, recursive, out);
        }
    }
}

std::string FileQueryEngine::readFile(const std::string& relativePath, const std::string& encoding,
                                      size_t maxCharacters, long startLine, long endLine) const {
    fs::path fullPath = workspace.resolve(relativePath);

    std::error_code ec;
    if (!fs::exists(fullPath, ec)) {
        throw NotFoundError("File not found: " + relativePath);
    }
    if (!fs::is_regular_file(fullPath, ec)) {
        throw NotFoundError("Not a regular file: " + relativePath);
    }

    std::ifstream file(fullPath, std::ios::binary);
    if (!file.is_open()) {
        throw ToolError(ErrorKind::Internal, "Failed to open file: " + relativePath);
    }
    std::string raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    std::string text = TextCodec::decode(raw, encoding);

    size_t length = TextCodec::characterCount(text);
    if (length > maxCharacters) {
        throw ValidationError("File content exceeds " + std::to_string(maxCharacters) +
                              " characters (actual: " + std::to_string(length) + ")");
    }

    if (startLine < 0 && endLine < 0) {
        return text;
    }

    std::vector<std::string> lines;
    std::string::size_type pos = 0;
    while (true) {
        auto nl = text.find('\n', pos);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(pos));
            break;
        }
        lines.push_back(text.substr(pos, nl - pos));
        pos = nl + 1;
    }

    long last = static_cast<long>(lines.size()) - 1;
    long s = startLine >= 0 ? startLine : 0;
    long e = endLine >= 0 ? std::min(endLine, last) : last;

    std::string out;
    for (long i = s; i <= e; ++i) {
        if (i > s) out += "\n";
        out += lines[static_cast<size_t>(i)];
    }
    return out;
}

namespace {
void buildStructure(const fs::path& dir, nlohmann::json& node) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        Logger::getInstance().warn("[FileQuery] Failed to read directory " + dir.u8string() + ": " + ec.message());
        return;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        const auto& entry = *it;
        std::string name = entry.path().filename().u8string();
        if (!name.empty() && name[0] == '.') continue;

        std::error_code typeEc;
        if (entry.is_directory(typeEc)) {
            nlohmann::json children = nlohmann::json::object();
            if (!entry.is_symlink(typeEc)) {
                buildStructure(entry.path(), children);
            }
            node[name] = {{"type", "directory"}, {"children", children}};
        } else {
            auto size = entry.file_size(typeEc);
            node[name] = {
                {"type", "file"},
                {"size", typeEc ? 0 : size},
                {"extension", entry.path().extension().u8string()}
            };
        }
    }
}
} // namespace

nlohmann::json FileQueryEngine::workspaceStructure() const {
    nlohmann::json structure = nlohmann::json::object();
    buildStructure(workspace.root(), structure);
    return structure;
}

nlohmann::json FileQueryEngine::toJson(const std::vector<FileEntry>& entries) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& e : entries) {
        arr.push_back({{"path", e.path}, {"type", e.typeName()}});
    }
    return arr;
}
