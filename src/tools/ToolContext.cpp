#include "tools/ToolContext.h"

std::shared_ptr<ToolContext> ToolContext::create(const Config& config,
                                                 std::shared_ptr<Workspace> workspace,
                                                 std::shared_ptr<IEditorHost> editorHost,
                                                 std::shared_ptr<IShellSession> shellSession,
                                                 std::vector<fs::path> sweepRoots) {
    auto ctx = std::make_shared<ToolContext>();
    ctx->workspace = workspace ? std::move(workspace) : std::make_shared<Workspace>();
    ctx->ignoreRules = std::make_shared<ScanIgnoreRules>(config.files.ignorePatterns);
    ctx->editorHost = editorHost ? std::move(editorHost) : std::make_shared<HeadlessEditorHost>();
    if (!shellSession) {
        shellSession = std::make_shared<PosixShellSession>(*ctx->workspace, config.shell.captureOutput);
    }
    if (sweepRoots.empty()) {
        sweepRoots = FilesystemSweep::defaultRoots();
    }

    ctx->files = std::make_shared<FileQueryEngine>(*ctx->workspace, ctx->ignoreRules);
    ctx->locator = std::make_shared<FileLocator>(*ctx->workspace, ctx->ignoreRules, std::move(sweepRoots));
    ctx->editor = std::make_shared<WorkspaceEditor>(*ctx->workspace, ctx->editorHost);
    ctx->shell = std::make_shared<ShellExecutor>(std::move(shellSession));

    ctx->defaultMaxCharacters = static_cast<size_t>(config.files.defaultMaxCharacters);
    ctx->defaultSpeedMsPerChar = config.edit.defaultSpeedMsPerChar;
    ctx->defaultShellTimeoutMs = config.shell.defaultTimeoutMs;
    return ctx;
}
