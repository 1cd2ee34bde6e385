#pragma once
#include <memory>
#include <string>
#include "tools/ToolContext.h"

class ToolRegistry;

/** @brief 按扩展名猜 MIME 类型,未知时为 text/plain */
std::string mimeTypeFor(const fs::path& path);

/**
 * @brief 注册 file://{filePath} 与 workspace://structure
 */
void registerWorkspaceResources(ToolRegistry& registry, std::shared_ptr<ToolContext> ctx);
