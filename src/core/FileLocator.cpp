#include "core/FileLocator.h"
#include "core/Errors.h"
#include "utils/Logger.h"
#include <algorithm>
#include <cstdlib>
#include <future>
#include <set>

namespace {
std::vector<std::string> sortedUnique(std::vector<std::string> paths) {
    std::set<std::string> unique(paths.begin(), paths.end());
    return std::vector<std::string>(unique.begin(), unique.end());
}
} // namespace

// ============================================================================
// WorkspaceSearch
// ============================================================================

WorkspaceSearch::WorkspaceSearch(const Workspace& workspace, std::shared_ptr<ScanIgnoreRules> ignoreRules)
    : workspace(workspace), ignore(std::move(ignoreRules)) {}

SearchOutcome WorkspaceSearch::run(const std::string& startPath, const std::string& targetName) const {
    SearchOutcome outcome;
    try {
        std::string start = startPath.empty() ? "." : startPath;
        fs::path startDir = workspace.resolve(start);

        std::error_code ec;
        if (!fs::is_directory(startDir, ec)) {
            outcome.status = SearchOutcome::Status::Unavailable;
            outcome.reason = "Start path is not a directory: " + start;
            return outcome;
        }

        std::string prefix = (start == "." || start == "./") ? "" : fs::u8path(start).lexically_normal().generic_u8string();
        while (!prefix.empty() && prefix.back() == '/') prefix.pop_back();
        walk(startDir, prefix, targetName, outcome.matches);
    } catch (const ToolError& e) {
        outcome.status = SearchOutcome::Status::Unavailable;
        outcome.reason = e.what();
    }
    return outcome;
}

void WorkspaceSearch::walk(const fs::path& dir, const std::string& relPrefix, const std::string& targetName,
                           std::vector<std::string>& found) const {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) return;

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) return;
        const auto& entry = *it;
        std::string name = entry.path().filename().u8string();
        if (ignore && ignore->shouldIgnore(name)) continue;

        std::string entryRel = relPrefix.empty() ? name : relPrefix + "/" + name;
        std::error_code typeEc;
        if (entry.is_directory(typeEc)) {
            if (!entry.is_symlink(typeEc)) {
                walk(entry.path(), entryRel, targetName, found);
            }
        } else if (name == targetName || entryRel.find(targetName) != std::string::npos) {
            found.push_back(entryRel);
        }
    }
}

// ============================================================================
// FilesystemSweep
// ============================================================================

FilesystemSweep::FilesystemSweep(std::vector<fs::path> roots, std::shared_ptr<ScanIgnoreRules> ignoreRules, int maxDepth)
    : searchRoots(std::move(roots)), ignore(std::move(ignoreRules)), maxDepth(maxDepth) {}

std::vector<fs::path> FilesystemSweep::defaultRoots() {
    std::vector<fs::path> roots;
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (!ec) {
        roots.push_back(cwd);
        roots.push_back((cwd / "..").lexically_normal());
        roots.push_back((cwd / ".." / "..").lexically_normal());
    }

    for (const char* var : {"HOME", "USERPROFILE"}) {
        const char* value = std::getenv(var);
        if (value && *value) {
            fs::path home = fs::u8path(value);
            roots.push_back(home);
            roots.push_back(home / "Desktop");
            roots.push_back(home / "Documents");
        }
    }
    return roots;
}

std::vector<std::string> FilesystemSweep::run(const std::string& targetName) const {
    std::vector<std::future<std::vector<std::string>>> futures;
    for (const auto& root : searchRoots) {
        futures.push_back(std::async(std::launch::async, [this, root, &targetName]() {
            std::vector<std::string> found;
            std::error_code ec;
            if (fs::exists(root, ec)) {
                walk(root, 0, targetName, found);
            }
            return found;
        }));
    }

    std::vector<std::string> all;
    for (auto& f : futures) {
        auto part = f.get();
        all.insert(all.end(), part.begin(), part.end());
    }
    return sortedUnique(std::move(all));
}

void FilesystemSweep::walk(const fs::path& dir, int depth, const std::string& targetName,
                           std::vector<std::string>& found) const {
    if (depth > maxDepth) return;

    // 权限错误等直接跳过该目录
    std::error_code ec;
    fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) return;

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) return;
        const auto& entry = *it;
        std::string name = entry.path().filename().u8string();

        std::error_code typeEc;
        if (entry.is_regular_file(typeEc)) {
            if (name == targetName || name.find(targetName) != std::string::npos) {
                found.push_back(entry.path().lexically_normal().u8string());
            }
        } else if (entry.is_directory(typeEc) && !entry.is_symlink(typeEc)) {
            if (ignore && ignore->shouldIgnore(name)) continue;
            walk(entry.path(), depth + 1, targetName, found);
        }
    }
}

// ============================================================================
// FileLocator
// ============================================================================

FileLocator::FileLocator(const Workspace& workspace, std::shared_ptr<ScanIgnoreRules> ignoreRules,
                         std::vector<fs::path> sweepRoots)
    : scoped(workspace, ignoreRules), sweep(std::move(sweepRoots), ignoreRules) {}

std::vector<std::string> FileLocator::findFiles(const std::string& startPath, const std::string& targetName) const {
    if (targetName.empty()) {
        throw ValidationError("targetName must not be empty");
    }

    SearchOutcome outcome = scoped.run(startPath, targetName);
    if (!outcome.shouldFallBack()) {
        return sortedUnique(std::move(outcome.matches));
    }

    if (outcome.status == SearchOutcome::Status::Unavailable) {
        Logger::getInstance().info("[FileLocator] Workspace search failed: " + outcome.reason +
                                   ". Falling back to filesystem search.");
    } else {
        Logger::getInstance().info("[FileLocator] No files found in workspace, searching filesystem for: " + targetName);
    }
    return sweep.run(targetName);
}
