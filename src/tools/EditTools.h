#pragma once
#include <memory>
#include "tools/ITool.h"
#include "tools/ToolContext.h"

class ToolRegistry;

class CreateFileTool : public ITool {
public:
    explicit CreateFileTool(std::shared_ptr<ToolContext> ctx) : ctx(std::move(ctx)) {}

    ToolKind getKind() const override { return ToolKind::CreateFile; }
    std::string getTitle() const override { return "Create File"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    ToolResult execute(const nlohmann::json& args) override;

private:
    std::shared_ptr<ToolContext> ctx;
};

/**
 * @brief 校验后替换行
 * 对外行号从 1 开始 (闭区间),内部转换为 0 起始。
 */
class ReplaceLinesTool : public ITool {
public:
    explicit ReplaceLinesTool(std::shared_ptr<ToolContext> ctx) : ctx(std::move(ctx)) {}

    ToolKind getKind() const override { return ToolKind::ReplaceLines; }
    std::string getTitle() const override { return "Replace Lines"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    ToolResult execute(const nlohmann::json& args) override;

private:
    std::shared_ptr<ToolContext> ctx;
};

/**
 * @brief 逐字输入
 * insertAtLine 从 1 开始,insertAtColumn 从 0 开始;-1 表示缺省。
 */
class TypeIntoFileTool : public ITool {
public:
    explicit TypeIntoFileTool(std::shared_ptr<ToolContext> ctx) : ctx(std::move(ctx)) {}

    ToolKind getKind() const override { return ToolKind::TypeIntoFile; }
    std::string getTitle() const override { return "Type Into File"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    ToolResult execute(const nlohmann::json& args) override;

private:
    std::shared_ptr<ToolContext> ctx;
};

void registerEditTools(ToolRegistry& registry, std::shared_ptr<ToolContext> ctx);
