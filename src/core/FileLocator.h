#pragma once
#include <memory>
#include <string>
#include <vector>
#include "core/Workspace.h"
#include "utils/ScanIgnore.h"

/**
 * @brief 工作区搜索阶段的结果
 * Unavailable 表示搜索本身无法进行 (例如未打开工作区),与"没有匹配"区分开。
 */
struct SearchOutcome {
    enum class Status { Matches, Unavailable };

    Status status = Status::Matches;
    std::vector<std::string> matches;
    std::string reason;

    bool shouldFallBack() const { return status == Status::Unavailable || matches.empty(); }
};

/**
 * @brief 第一阶段:从 startPath 开始深度优先遍历工作区
 * 文件名等于 targetName,或相对路径包含 targetName 即匹配;不提前停止。
 */
class WorkspaceSearch {
public:
    WorkspaceSearch(const Workspace& workspace, std::shared_ptr<ScanIgnoreRules> ignoreRules);

    SearchOutcome run(const std::string& startPath, const std::string& targetName) const;

private:
    const Workspace& workspace;
    std::shared_ptr<ScanIgnoreRules> ignore;

    void walk(const fs::path& dir, const std::string& relPrefix, const std::string& targetName,
              std::vector<std::string>& found) const;
};

/**
 * @brief 第二阶段:在常见根目录上并发扫描文件系统
 * 每个根一个任务,深度上限 maxDepth;无权限的目录直接跳过。
 */
class FilesystemSweep {
public:
    static constexpr int DEFAULT_MAX_DEPTH = 3;

    FilesystemSweep(std::vector<fs::path> roots, std::shared_ptr<ScanIgnoreRules> ignoreRules,
                    int maxDepth = DEFAULT_MAX_DEPTH);

    /** @brief 当前目录、上一级、上两级、HOME/USERPROFILE 及其 Desktop、Documents */
    static std::vector<fs::path> defaultRoots();

    /** @return 去重并按字典序排序的绝对路径 */
    std::vector<std::string> run(const std::string& targetName) const;

    const std::vector<fs::path>& roots() const { return searchRoots; }

private:
    std::vector<fs::path> searchRoots;
    std::shared_ptr<ScanIgnoreRules> ignore;
    int maxDepth;

    void walk(const fs::path& dir, int depth, const std::string& targetName,
              std::vector<std::string>& found) const;
};

/**
 * @brief 按文件名查找:先工作区,无结果或不可用时再全局扫描
 */
class FileLocator {
public:
    FileLocator(const Workspace& workspace, std::shared_ptr<ScanIgnoreRules> ignoreRules,
                std::vector<fs::path> sweepRoots = FilesystemSweep::defaultRoots());

    /** @return 去重并按字典序排序的匹配路径 */
    std::vector<std::string> findFiles(const std::string& startPath, const std::string& targetName) const;

    const WorkspaceSearch& workspacePhase() const { return scoped; }
    const FilesystemSweep& globalPhase() const { return sweep; }

private:
    WorkspaceSearch scoped;
    FilesystemSweep sweep;
};
