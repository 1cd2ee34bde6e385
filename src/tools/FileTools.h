#pragma once
#include <memory>
#include "tools/ITool.h"
#include "tools/ToolContext.h"

class ToolRegistry;

/**
 * @brief 为路径选出要作为工作区打开的目录
 * 已存在的文件取父目录;不存在但带扩展名的取父目录;其余取自身;
 * 目录不存在时退回进程当前目录。
 */
fs::path workspaceFolderFor(const fs::path& target);

/**
 * @brief 把 target 所在目录设为工作区根并通知编辑器
 * @return 新的工作区根
 */
fs::path openWorkspaceFor(ToolContext& ctx, const fs::path& target);

/**
 * @brief 列目录工具
 */
class ListFilesTool : public ITool {
public:
    explicit ListFilesTool(std::shared_ptr<ToolContext> ctx) : ctx(std::move(ctx)) {}

    ToolKind getKind() const override { return ToolKind::ListFiles; }
    std::string getTitle() const override { return "List Files"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    ToolResult execute(const nlohmann::json& args) override;

private:
    std::shared_ptr<ToolContext> ctx;
};

/**
 * @brief 读文件工具
 * 可选 startLine/endLine (0 起始,闭区间) 截取行。
 */
class ReadFileTool : public ITool {
public:
    explicit ReadFileTool(std::shared_ptr<ToolContext> ctx) : ctx(std::move(ctx)) {}

    ToolKind getKind() const override { return ToolKind::ReadFile; }
    std::string getTitle() const override { return "Read File"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    ToolResult execute(const nlohmann::json& args) override;

private:
    std::shared_ptr<ToolContext> ctx;
};

/**
 * @brief 按文件名查找并打开工作区
 *
 * 0 个匹配:打开进程当前目录;1 个:打开其所在目录;多个:返回候选列表由调用方选择。
 */
class FindFileTool : public ITool {
public:
    explicit FindFileTool(std::shared_ptr<ToolContext> ctx) : ctx(std::move(ctx)) {}

    ToolKind getKind() const override { return ToolKind::FindFile; }
    std::string getTitle() const override { return "Find File"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    ToolResult execute(const nlohmann::json& args) override;

private:
    std::shared_ptr<ToolContext> ctx;
};

class OpenWorkspaceTool : public ITool {
public:
    explicit OpenWorkspaceTool(std::shared_ptr<ToolContext> ctx) : ctx(std::move(ctx)) {}

    ToolKind getKind() const override { return ToolKind::OpenWorkspaceForFile; }
    std::string getTitle() const override { return "Open Workspace For File"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    ToolResult execute(const nlohmann::json& args) override;

private:
    std::shared_ptr<ToolContext> ctx;
};

void registerFileTools(ToolRegistry& registry, std::shared_ptr<ToolContext> ctx);
