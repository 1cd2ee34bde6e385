#include "core/Workspace.h"
#include "core/Errors.h"

namespace {
bool isWithin(const fs::path& root, const fs::path& candidate) {
    auto rootIt = root.begin();
    auto candIt = candidate.begin();
    for (; rootIt != root.end(); ++rootIt, ++candIt) {
        // 根目录末尾的空段 ("/ws/") 不参与比较
        if (rootIt->empty()) continue;
        if (candIt == candidate.end() || *rootIt != *candIt) return false;
    }
    return true;
}
} // namespace

Workspace::Workspace(const fs::path& root) {
    open(root);
}

bool Workspace::isOpen() const {
    std::lock_guard<std::mutex> lock(mtx);
    return rootPath.has_value();
}

fs::path Workspace::root() const {
    std::lock_guard<std::mutex> lock(mtx);
    if (!rootPath) {
        throw PreconditionError("No workspace folder is open");
    }
    return *rootPath;
}

std::optional<fs::path> Workspace::tryRoot() const {
    std::lock_guard<std::mutex> lock(mtx);
    return rootPath;
}

void Workspace::open(const fs::path& folder) {
    std::error_code ec;
    fs::path absolute = fs::absolute(folder, ec);
    if (ec) absolute = folder;
    absolute = absolute.lexically_normal();
    if (!absolute.has_filename() && absolute != absolute.root_path()) {
        absolute = absolute.parent_path();
    }

    std::lock_guard<std::mutex> lock(mtx);
    rootPath = absolute;
}

void Workspace::close() {
    std::lock_guard<std::mutex> lock(mtx);
    rootPath.reset();
}

fs::path Workspace::resolve(const std::string& relativePath) const {
    fs::path base = root();
    fs::path input = fs::u8path(relativePath);
    fs::path full = input.is_absolute() ? input : base / input;
    full = full.lexically_normal();

    if (!isWithin(base, full)) {
        throw PreconditionError("Path '" + relativePath + "' resolves outside the workspace root " + base.u8string());
    }
    return full;
}

std::string Workspace::relativize(const fs::path& absolutePath) const {
    fs::path rel = absolutePath.lexically_relative(root());
    return rel.generic_u8string();
}

std::mutex& Workspace::mutexFor(const fs::path& absolutePath) {
    std::lock_guard<std::mutex> lock(pathLocksMtx);
    auto& slot = pathLocks[absolutePath.lexically_normal().u8string()];
    if (!slot) slot = std::make_unique<std::mutex>();
    return *slot;
}
