#include "core/TextDocument.h"
#include "core/Errors.h"
#include <algorithm>
#include <fstream>
#include <iterator>

TextDocument TextDocument::open(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        throw NotFoundError("File not found: " + path.u8string());
    }
    if (!fs::is_regular_file(path, ec)) {
        throw NotFoundError("Not a regular file: " + path.u8string());
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw ToolError(ErrorKind::Internal, "Failed to open file: " + path.u8string());
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return TextDocument(path, std::move(text));
}

TextDocument::TextDocument(fs::path path, std::string text)
    : filePath(std::move(path)), content(std::move(text)) {
    indexLines();
}

void TextDocument::indexLines() {
    lineStarts.clear();
    lineStarts.push_back(0);
    for (size_t i = 0; i < content.size(); ++i) {
        if (content[i] == '\n') lineStarts.push_back(i + 1);
    }
}

size_t TextDocument::lineLength(size_t line) const {
    size_t start = lineStarts[line];
    size_t end = (line + 1 < lineStarts.size()) ? lineStarts[line + 1] - 1 : content.size();
    if (end > start && content[end - 1] == '\r' && line + 1 < lineStarts.size()) {
        --end;
    }
    return end - start;
}

std::string TextDocument::lineAt(size_t line) const {
    if (line >= lineStarts.size()) {
        throw PreconditionError("Line " + std::to_string(line) + " is out of range (0-" +
                                std::to_string(lineStarts.size() - 1) + ")");
    }
    return content.substr(lineStarts[line], lineLength(line));
}

TextDocument::Position TextDocument::endPosition() const {
    size_t last = lineStarts.size() - 1;
    return {last, lineLength(last)};
}

TextDocument::Position TextDocument::clamp(size_t line, size_t character) const {
    size_t l = std::min(line, lineStarts.size() - 1);
    size_t c = std::min(character, lineLength(l));
    return {l, c};
}

size_t TextDocument::offsetAt(const Position& pos) const {
    Position p = clamp(pos.line, pos.character);
    return lineStarts[p.line] + p.character;
}

void TextDocument::replace(const Position& start, const Position& end, const std::string& text) {
    size_t from = offsetAt(start);
    size_t to = offsetAt(end);
    if (to < from) std::swap(from, to);
    content.replace(from, to - from, text);
    indexLines();
}

void TextDocument::insert(const Position& at, const std::string& text) {
    content.insert(offsetAt(at), text);
    indexLines();
}

void TextDocument::save() const {
    std::ofstream out(filePath, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw ToolError(ErrorKind::Internal, "Failed to open file for writing: " + filePath.u8string());
    }
    out << content;
    out.flush();
    if (!out) {
        throw ToolError(ErrorKind::Internal, "Failed to write file: " + filePath.u8string());
    }
}
