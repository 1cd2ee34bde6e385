#pragma once
#include <functional>
#include <memory>
#include "core/ConfigManager.h"
#include "tools/ToolContext.h"

class ToolRegistry;

using ToolSetup = std::function<void(ToolRegistry&)>;

/**
 * @brief 按 tools.file / tools.edit / tools.shell 注册工具组,资源总是注册
 */
ToolSetup makeToolSetup(std::shared_ptr<ToolContext> ctx, Config::Tools groups);
