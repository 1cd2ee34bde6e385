#pragma once
#include <memory>
#include <vector>
#include "core/ConfigManager.h"
#include "core/EditorHost.h"
#include "core/FileLocator.h"
#include "core/FileQueryEngine.h"
#include "core/ShellExecutor.h"
#include "core/Workspace.h"
#include "core/WorkspaceEditor.h"
#include "utils/ScanIgnore.h"

/**
 * @brief 工具共享的协作者与默认值
 */
struct ToolContext {
    std::shared_ptr<Workspace> workspace;
    std::shared_ptr<ScanIgnoreRules> ignoreRules;
    std::shared_ptr<IEditorHost> editorHost;
    std::shared_ptr<FileQueryEngine> files;
    std::shared_ptr<FileLocator> locator;
    std::shared_ptr<WorkspaceEditor> editor;
    std::shared_ptr<ShellExecutor> shell;

    size_t defaultMaxCharacters = FileQueryEngine::DEFAULT_MAX_CHARACTERS;
    long defaultSpeedMsPerChar = 50;
    long defaultShellTimeoutMs = ShellExecutor::DEFAULT_TIMEOUT_MS;

    /**
     * @brief 按配置装配全部协作者
     * sweepRoots 为空时使用 FilesystemSweep::defaultRoots()。
     */
    static std::shared_ptr<ToolContext> create(const Config& config,
                                               std::shared_ptr<Workspace> workspace,
                                               std::shared_ptr<IEditorHost> editorHost,
                                               std::shared_ptr<IShellSession> shellSession,
                                               std::vector<fs::path> sweepRoots = {});
};
