#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace fs = std::filesystem;

/**
 * 扫描忽略规则：list_files_code、find_file_code、文件系统兜底搜索共用的「是否跳过条目」逻辑。
 * - 内置：静态名称集合（版本控制、构建产物、依赖缓存、IDE 目录等），按条目名精确匹配。
 * - 配置：files.ignore_patterns 为正则，条目名与之匹配则忽略。
 * 使用同一 ScanIgnoreRules 实例保证列表与搜索行为一致。
 */
class ScanIgnoreRules {
public:
    /** patterns 为额外的正则表达式（ECMAScript），如 "^tmp_"；空列表表示只用内置集合 */
    explicit ScanIgnoreRules(std::vector<std::string> patterns = {});
    ~ScanIgnoreRules();

    /** @param name 单个路径段（文件或目录名） */
    bool shouldIgnore(const std::string& name) const;

    static const std::unordered_set<std::string>& defaultNames();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
