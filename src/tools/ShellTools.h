#pragma once
#include <memory>
#include "tools/ITool.h"
#include "tools/ToolContext.h"

class ToolRegistry;

class ExecuteShellCommandTool : public ITool {
public:
    explicit ExecuteShellCommandTool(std::shared_ptr<ToolContext> ctx) : ctx(std::move(ctx)) {}

    ToolKind getKind() const override { return ToolKind::ExecuteShellCommand; }
    std::string getTitle() const override { return "Execute Shell Command"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    ToolResult execute(const nlohmann::json& args) override;

private:
    std::shared_ptr<ToolContext> ctx;
};

/**
 * @brief 列出工作区目录,返回 [{name, isDirectory}]
 * 失败时返回 isError 结果而不是抛出。
 */
class ShellListDirTool : public ITool {
public:
    explicit ShellListDirTool(std::shared_ptr<ToolContext> ctx) : ctx(std::move(ctx)) {}

    ToolKind getKind() const override { return ToolKind::ShellListDir; }
    std::string getTitle() const override { return "List Directory"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    ToolResult execute(const nlohmann::json& args) override;

private:
    std::shared_ptr<ToolContext> ctx;
};

void registerShellTools(ToolRegistry& registry, std::shared_ptr<ToolContext> ctx);
