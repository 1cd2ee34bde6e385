#include "core/EditorHost.h"
#include "utils/Logger.h"

void HeadlessEditorHost::showDocument(const fs::path& path) {
    Logger::getInstance().info("[Editor] Opened document: " + path.u8string());
}

void HeadlessEditorHost::openFolder(const fs::path& folder) {
    Logger::getInstance().info("[Editor] Opened workspace folder: " + folder.u8string());
}

void HeadlessEditorHost::focus() {
    Logger::getInstance().debug("[Editor] Focus requested");
}

void HeadlessEditorHost::revealTypedCharacter(const fs::path& /*path*/, size_t /*line*/, size_t /*column*/,
                                              const std::string& /*ch*/) {}
