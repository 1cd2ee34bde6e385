#include "tools/ToolSetup.h"
#include "tools/EditTools.h"
#include "tools/FileTools.h"
#include "tools/ShellTools.h"
#include "tools/ToolRegistry.h"
#include "tools/WorkspaceResources.h"
#include "utils/Logger.h"

ToolSetup makeToolSetup(std::shared_ptr<ToolContext> ctx, Config::Tools groups) {
    return [ctx, groups](ToolRegistry& registry) {
        auto& log = Logger::getInstance();
        log.info(std::string("[Setup] Setting up tools with configuration: file=") + (groups.file ? "on" : "off") +
                 " edit=" + (groups.edit ? "on" : "off") + " shell=" + (groups.shell ? "on" : "off"));

        registerWorkspaceResources(registry, ctx);

        if (groups.file) {
            registerFileTools(registry, ctx);
            log.info("[Setup] File tools registered");
        } else {
            log.info("[Setup] File tools disabled by configuration");
        }

        if (groups.edit) {
            registerEditTools(registry, ctx);
            log.info("[Setup] Edit tools registered");
        } else {
            log.info("[Setup] Edit tools disabled by configuration");
        }

        if (groups.shell) {
            registerShellTools(registry, ctx);
            log.info("[Setup] Shell tools registered");
        } else {
            log.info("[Setup] Shell tools disabled by configuration");
        }
    };
}
