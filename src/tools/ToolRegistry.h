#pragma once
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "tools/ITool.h"

struct ResourceContents {
    std::string uri;
    std::string mimeType;
    std::string text;
};

/**
 * @brief 资源定义
 * uri 为固定 URI ("workspace://structure") 或模板 ("file://{filePath}")。
 */
struct ResourceDefinition {
    using Variables = std::map<std::string, std::string>;
    using Handler = std::function<ResourceContents(const std::string& uri, const Variables& vars)>;

    std::string name;
    std::string uri;
    std::string title;
    std::string description;
    std::string mimeType;
    Handler handler;

    bool isTemplate() const { return uri.find('{') != std::string::npos; }

    /** @brief uri 与模板匹配时返回变量表 */
    std::optional<Variables> match(const std::string& candidate) const;
};

/**
 * @brief 工具/资源注册中心
 *
 * 工具按 ToolKind 建表,名字唯一;重复注册被跳过 (记日志,不报错)。
 * 注册完成后只读。
 */
class ToolRegistry {
public:
    ToolRegistry() = default;
    ~ToolRegistry() = default;

    /** @return false 表示同名工具已存在,本次注册被跳过 */
    bool registerTool(std::unique_ptr<ITool> tool);

    /** @return false 表示同名或同 URI 的资源已存在 */
    bool registerResource(ResourceDefinition resource);

    ITool* getTool(const std::string& name) const;
    ITool* getTool(ToolKind kind) const;

    bool hasTool(const std::string& name) const { return getTool(name) != nullptr; }

    /** @brief tools/list 的 tools 数组,按 ToolKind 顺序 */
    nlohmann::json listTools() const;

    /** @brief resources/list:只含固定 URI 的资源 */
    nlohmann::json listResources() const;

    /** @brief resources/templates/list */
    nlohmann::json listResourceTemplates() const;

    /** @brief 固定 URI 优先,其次按注册顺序匹配模板 */
    const ResourceDefinition* findResource(const std::string& uri, ResourceDefinition::Variables& vars) const;

    size_t getToolCount() const;
    size_t getResourceCount() const;

private:
    mutable std::mutex mtx;
    std::map<ToolKind, std::unique_ptr<ITool>> tools;
    std::vector<ResourceDefinition> resources;
};
