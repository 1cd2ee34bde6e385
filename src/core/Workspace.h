#pragma once
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief 工作区根目录
 *
 * 所有工作区范围的文件操作只信任这里的根目录作为边界。
 * 根目录可以在运行期被 open_workspace_for_file 替换,因此读写都加锁。
 */
class Workspace {
public:
    Workspace() = default;
    explicit Workspace(const fs::path& root);

    bool isOpen() const;

    /** @throws PreconditionError 未打开工作区 */
    fs::path root() const;

    std::optional<fs::path> tryRoot() const;

    void open(const fs::path& folder);
    void close();

    /**
     * @brief 把工作区相对路径解析为绝对路径
     * @throws PreconditionError 未打开工作区或路径越出根目录
     */
    fs::path resolve(const std::string& relativePath) const;

    /** @brief 相对根目录的通用路径 ("a/b.txt") */
    std::string relativize(const fs::path& absolutePath) const;

    /**
     * @brief 同一路径的变更操作共用一把锁
     * 返回的引用在 Workspace 生命周期内有效。
     */
    std::mutex& mutexFor(const fs::path& absolutePath);

private:
    mutable std::mutex mtx;
    std::optional<fs::path> rootPath;

    std::mutex pathLocksMtx;
    std::map<std::string, std::unique_ptr<std::mutex>> pathLocks;
};
