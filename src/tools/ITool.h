#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "tools/ToolKind.h"

/**
 * @brief 工具执行结果
 *
 * 处理器层面的失败用 isError 表示,调用方仍然收到正常的 Response。
 */
struct ToolResult {
    nlohmann::json content = nlohmann::json::array();
    bool isError = false;

    static ToolResult text(const std::string& text) {
        ToolResult r;
        r.content.push_back({{"type", "text"}, {"text", text}});
        return r;
    }

    static ToolResult error(const std::string& text) {
        ToolResult r = ToolResult::text(text);
        r.isError = true;
        return r;
    }

    nlohmann::json toJson() const {
        nlohmann::json j = {{"content", content}};
        if (isError) j["isError"] = true;
        return j;
    }
};

/**
 * @brief 工具接口定义
 *
 * 每个工具对应一个 ToolKind,名字由 ToolKind 决定。
 * execute 收到的参数已经按 getSchema() 校验并补齐默认值;
 * 失败时抛出 ToolError,由分发层转换为 isError 结果。
 */
class ITool {
public:
    virtual ~ITool() = default;

    virtual ToolKind getKind() const = 0;

    std::string getName() const { return toolKindName(getKind()); }

    virtual std::string getTitle() const = 0;

    virtual std::string getDescription() const = 0;

    /**
     * @brief 参数的 JSON Schema
     * 只使用 type / properties / required / default / description。
     */
    virtual nlohmann::json getSchema() const = 0;

    virtual ToolResult execute(const nlohmann::json& args) = 0;
};
