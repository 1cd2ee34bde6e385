#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief 磁盘文件的内存文本缓冲
 *
 * 行号、列号均从 0 开始。行文本不包含行尾 ("\n" 或 "\r\n"),
 * 空文件也有 1 行。编辑只改缓冲,save() 才写回磁盘。
 */
class TextDocument {
public:
    struct Position {
        size_t line = 0;
        size_t character = 0;
    };

    /** @throws NotFoundError 文件不存在或不是普通文件 */
    static TextDocument open(const fs::path& path);

    TextDocument(fs::path path, std::string text);

    const fs::path& path() const { return filePath; }
    const std::string& text() const { return content; }

    size_t lineCount() const { return lineStarts.size(); }
    std::string lineAt(size_t line) const;

    /** @brief 全文末尾的位置 (最后一行行尾) */
    Position endPosition() const;

    /** @brief 把位置夹到合法范围内 */
    Position clamp(size_t line, size_t character) const;

    void replace(const Position& start, const Position& end, const std::string& text);
    void insert(const Position& at, const std::string& text);

    /** @throws ToolError 写入失败 */
    void save() const;

private:
    fs::path filePath;
    std::string content;
    std::vector<size_t> lineStarts;

    void indexLines();
    size_t offsetAt(const Position& pos) const;
    size_t lineLength(size_t line) const;
};
