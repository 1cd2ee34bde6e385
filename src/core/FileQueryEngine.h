#pragma once
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/Workspace.h"
#include "utils/ScanIgnore.h"

struct FileEntry {
    std::string path;   // 相对于被列出目录的通用路径
    bool isDirectory = false;

    const char* typeName() const { return isDirectory ? "directory" : "file"; }
};

/**
 * @brief 工作区内的目录列表与文件读取
 *
 * 所有路径都相对 WorkspaceRoot 解析;未打开工作区时抛 PreconditionError。
 */
class FileQueryEngine {
public:
    static constexpr size_t DEFAULT_MAX_CHARACTERS = 100000;

    FileQueryEngine(Workspace& workspace, std::shared_ptr<ScanIgnoreRules> ignoreRules);

    /**
     * @brief 列出目录条目
     * 父目录总在其子条目之前,同级按目录读取顺序。子目录读取失败记日志并视为空。
     * @throws NotFoundError 目标不存在或不是目录
     */
    std::vector<FileEntry> listFiles(const std::string& relativePath, bool recursive) const;

    /**
     * @brief 读取文件文本
     * encoding == "base64" 时返回原始字节的 base64 编码。
     * 解码后长度超过 maxCharacters 直接失败 (在截取行之前检查)。
     * startLine/endLine 任一非负时按 0 起始的闭区间截取行。
     */
    std::string readFile(const std::string& relativePath,
                         const std::string& encoding = "utf-8",
                         size_t maxCharacters = DEFAULT_MAX_CHARACTERS,
                         long startLine = -1,
                         long endLine = -1) const;

    /** @brief workspace://structure 资源的 JSON 树 (跳过 . 开头的条目) */
    nlohmann::json workspaceStructure() const;

    static nlohmann::json toJson(const std::vector<FileEntry>& entries);

    const ScanIgnoreRules& ignoreRules() const { return *ignore; }

private:
    Workspace& workspace;
    std::shared_ptr<ScanIgnoreRules> ignore;

    void listDirectory(const fs::path& dir, const std::string& prefix, bool recursive,
                       std::vector<FileEntry>& out) const;
};
