#include "core/WorkspaceEditor.h"
#include "core/Errors.h"
#include "core/TextDocument.h"
#include "utils/Logger.h"
#include "utils/TextCodec.h"
#include <chrono>
#include <fstream>
#include <thread>

WorkspaceEditor::WorkspaceEditor(Workspace& workspace, std::shared_ptr<IEditorHost> host)
    : workspace(workspace), editorHost(std::move(host)) {
    if (!editorHost) editorHost = std::make_shared<HeadlessEditorHost>();
}

WorkspaceEditor::CreateResult WorkspaceEditor::createFile(const std::string& relativePath, const std::string& content,
                                                          bool overwrite, bool ignoreIfExists) {
    fs::path fullPath = workspace.resolve(relativePath);
    std::lock_guard<std::mutex> lock(workspace.mutexFor(fullPath));

    CreateResult result{fullPath, false};
    std::error_code ec;
    bool exists = fs::exists(fullPath, ec);

    if (exists && !overwrite) {
        if (!ignoreIfExists) {
            throw PreconditionError("File already exists: " + relativePath);
        }
        Logger::getInstance().info("[EditTools] " + relativePath + " exists, left unchanged");
    } else {
        if (exists && fs::is_directory(fullPath, ec)) {
            throw PreconditionError("Path is a directory: " + relativePath);
        }
        if (fullPath.has_parent_path()) {
            fs::create_directories(fullPath.parent_path(), ec);
            if (ec) {
                throw ToolError(ErrorKind::Internal, "Failed to create file: " + fullPath.u8string() + " (" + ec.message() + ")");
            }
        }
        std::ofstream out(fullPath, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw ToolError(ErrorKind::Internal, "Failed to create file: " + fullPath.u8string());
        }
        out << content;
        out.flush();
        if (!out) {
            throw ToolError(ErrorKind::Internal, "Failed to write file: " + fullPath.u8string());
        }
        result.written = true;
    }

    editorHost->showDocument(fullPath);
    return result;
}

void WorkspaceEditor::replaceLines(const std::string& relativePath, long startLine, long endLine,
                                   const std::string& content, const std::string& originalCode) {
    fs::path fullPath = workspace.resolve(relativePath);
    std::lock_guard<std::mutex> lock(workspace.mutexFor(fullPath));

    TextDocument doc = TextDocument::open(fullPath);
    long count = static_cast<long>(doc.lineCount());

    if (startLine < 0 || startLine >= count) {
        throw PreconditionError("Start line " + std::to_string(startLine + 1) + " is out of range (1-" +
                                std::to_string(count) + ")");
    }
    if (endLine < startLine || endLine >= count) {
        throw PreconditionError("End line " + std::to_string(endLine + 1) + " is out of range (" +
                                std::to_string(startLine + 1) + "-" + std::to_string(count) + ")");
    }

    std::string current;
    size_t first = static_cast<size_t>(startLine);
    size_t last = static_cast<size_t>(endLine);
    for (size_t i = first; i <= last; ++i) {
        if (i > first) current += "\n";
        current += doc.lineAt(i);
    }
    if (current != originalCode) {
        throw StaleStateError("Original code validation failed. The current content does not match the provided original code.\n"
                              "Current content of lines " + std::to_string(startLine + 1) + "-" + std::to_string(endLine + 1) +
                              ":\n" + current,
                              originalCode, current);
    }

    editorHost->showDocument(fullPath);
    doc.replace({first, 0}, {last, doc.lineAt(last).size()}, content);
    doc.save();
}

void WorkspaceEditor::typeIntoFile(const std::string& relativePath, const std::string& content, long speedMsPerChar,
                                   std::optional<size_t> line, std::optional<size_t> column) {
    fs::path fullPath = workspace.resolve(relativePath);
    std::lock_guard<std::mutex> lock(workspace.mutexFor(fullPath));

    TextDocument doc = TextDocument::open(fullPath);
    editorHost->showDocument(fullPath);
    editorHost->focus();

    TextDocument::Position pos = line ? doc.clamp(*line, column.value_or(std::string::npos)) : doc.endPosition();
    auto delay = std::chrono::milliseconds(speedMsPerChar > 0 ? speedMsPerChar : 0);

    size_t typed = 0;
    try {
        size_t i = 0;
        while (i < content.size()) {
            // 多字节字符整体输入,中断时不会留下半个字符
            std::string ch = content.substr(i, TextCodec::utf8SequenceLength(content, i));
            i += ch.size();

            editorHost->revealTypedCharacter(fullPath, pos.line, pos.character, ch);
            doc.insert(pos, ch);
            ++typed;

            if (ch == "\n") {
                pos = {pos.line + 1, 0};
            } else {
                pos = {pos.line, pos.character + ch.size()};
            }

            if (delay.count() > 0) std::this_thread::sleep_for(delay);
        }
    } catch (const std::exception& e) {
        // 不回滚:已输入的字符照样落盘
        Logger::getInstance().warn("[EditTools] Typing into " + relativePath + " interrupted after " +
                                   std::to_string(typed) + " characters: " + e.what());
        doc.save();
        throw;
    }

    doc.save();
}
