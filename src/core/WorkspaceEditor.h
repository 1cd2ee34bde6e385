#pragma once
#include <memory>
#include <optional>
#include <string>
#include "core/EditorHost.h"
#include "core/Workspace.h"

/**
 * @brief 文件变更操作:创建、校验后替换行、逐字输入
 *
 * 行号列号都从 0 开始 (工具层负责 1 起始的换算)。
 * 同一绝对路径上的变更通过 Workspace::mutexFor 串行化。
 */
class WorkspaceEditor {
public:
    WorkspaceEditor(Workspace& workspace, std::shared_ptr<IEditorHost> host);

    struct CreateResult {
        fs::path path;
        bool written = false;   // false: ignoreIfExists 命中,文件未改动
    };

    /**
     * @brief 写入新文件,必要时创建父目录
     * overwrite 优先于 ignoreIfExists;二者都未设置而文件已存在时抛 PreconditionError。
     */
    CreateResult createFile(const std::string& relativePath, const std::string& content,
                            bool overwrite = false, bool ignoreIfExists = false);

    /**
     * @brief 仅当 [startLine, endLine] 的当前文本与 originalCode 逐字节相同时替换
     * @throws PreconditionError 行号越界 (消息中带 1 起始的合法范围)
     * @throws StaleStateError   originalCode 与当前内容不一致,文件不变
     */
    void replaceLines(const std::string& relativePath, long startLine, long endLine,
                      const std::string& content, const std::string& originalCode);

    /**
     * @brief 逐字符插入 content,每个字符之间等待 speedMsPerChar 毫秒
     * 未给 line 时插到文件末尾;只给 line 时插到该行行尾;位置夹到合法范围。
     * 中途失败时保存已插入的部分后重新抛出。
     */
    void typeIntoFile(const std::string& relativePath, const std::string& content, long speedMsPerChar,
                      std::optional<size_t> line = std::nullopt, std::optional<size_t> column = std::nullopt);

    IEditorHost& host() { return *editorHost; }

private:
    Workspace& workspace;
    std::shared_ptr<IEditorHost> editorHost;
};
