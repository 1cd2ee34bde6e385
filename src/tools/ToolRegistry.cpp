#include "tools/ToolRegistry.h"
#include "utils/Logger.h"

std::optional<ResourceDefinition::Variables> ResourceDefinition::match(const std::string& candidate) const {
    Variables vars;
    size_t t = 0;   // 模板位置
    size_t c = 0;   // 候选位置

    while (t < uri.size()) {
        size_t open = uri.find('{', t);
        std::string literal = uri.substr(t, open == std::string::npos ? std::string::npos : open - t);
        if (candidate.compare(c, literal.size(), literal) != 0) return std::nullopt;
        c += literal.size();
        if (open == std::string::npos) {
            t = uri.size();
            break;
        }

        size_t close = uri.find('}', open);
        if (close == std::string::npos) return std::nullopt;
        std::string varName = uri.substr(open + 1, close - open - 1);
        t = close + 1;

        // 变量一直吃到下一段字面量 (最后一个变量吃到结尾)
        size_t nextOpen = uri.find('{', t);
        std::string nextLiteral = uri.substr(t, nextOpen == std::string::npos ? std::string::npos : nextOpen - t);
        size_t end;
        if (nextLiteral.empty()) {
            end = (nextOpen == std::string::npos) ? candidate.size() : std::string::npos;
            if (end == std::string::npos) return std::nullopt;
        } else {
            end = candidate.find(nextLiteral, c);
            if (end == std::string::npos) return std::nullopt;
        }
        if (end == c) return std::nullopt;
        vars[varName] = candidate.substr(c, end - c);
        c = end;
    }

    if (c != candidate.size()) return std::nullopt;
    return vars;
}

bool ToolRegistry::registerTool(std::unique_ptr<ITool> tool) {
    if (!tool) return false;

    std::lock_guard<std::mutex> lock(mtx);
    ToolKind kind = tool->getKind();
    if (tools.count(kind)) {
        Logger::getInstance().warn("[Registry] Tool already registered, skipping: " + tool->getName());
        return false;
    }
    tools[kind] = std::move(tool);
    return true;
}

bool ToolRegistry::registerResource(ResourceDefinition resource) {
    std::lock_guard<std::mutex> lock(mtx);
    for (const auto& existing : resources) {
        if (existing.name == resource.name || existing.uri == resource.uri) {
            Logger::getInstance().warn("[Registry] Resource already registered, skipping: " + resource.name);
            return false;
        }
    }
    resources.push_back(std::move(resource));
    return true;
}

ITool* ToolRegistry::getTool(const std::string& name) const {
    auto kind = toolKindFromName(name);
    if (!kind) return nullptr;
    return getTool(*kind);
}

ITool* ToolRegistry::getTool(ToolKind kind) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = tools.find(kind);
    return it == tools.end() ? nullptr : it->second.get();
}

nlohmann::json ToolRegistry::listTools() const {
    std::lock_guard<std::mutex> lock(mtx);
    nlohmann::json list = nlohmann::json::array();
    for (const auto& [kind, tool] : tools) {
        list.push_back({
            {"name", tool->getName()},
            {"title", tool->getTitle()},
            {"description", tool->getDescription()},
            {"inputSchema", tool->getSchema()}
        });
    }
    return list;
}

nlohmann::json ToolRegistry::listResources() const {
    std::lock_guard<std::mutex> lock(mtx);
    nlohmann::json list = nlohmann::json::array();
    for (const auto& r : resources) {
        if (r.isTemplate()) continue;
        list.push_back({
            {"uri", r.uri},
            {"name", r.name},
            {"title", r.title},
            {"description", r.description},
            {"mimeType", r.mimeType}
        });
    }
    return list;
}

nlohmann::json ToolRegistry::listResourceTemplates() const {
    std::lock_guard<std::mutex> lock(mtx);
    nlohmann::json list = nlohmann::json::array();
    for (const auto& r : resources) {
        if (!r.isTemplate()) continue;
        list.push_back({
            {"uriTemplate", r.uri},
            {"name", r.name},
            {"title", r.title},
            {"description", r.description},
            {"mimeType", r.mimeType}
        });
    }
    return list;
}

const ResourceDefinition* ToolRegistry::findResource(const std::string& uri, ResourceDefinition::Variables& vars) const {
    std::lock_guard<std::mutex> lock(mtx);
    for (const auto& r : resources) {
        if (!r.isTemplate() && r.uri == uri) {
            vars.clear();
            return &r;
        }
    }
    for (const auto& r : resources) {
        if (!r.isTemplate()) continue;
        if (auto matched = r.match(uri)) {
            vars = std::move(*matched);
            return &r;
        }
    }
    return nullptr;
}

size_t ToolRegistry::getToolCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return tools.size();
}

size_t ToolRegistry::getResourceCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return resources.size();
}
