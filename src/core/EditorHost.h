#pragma once
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief 宿主编辑器接口 (外部协作者)
 *
 * 工具完成文件操作后通过它把结果呈现给用户。核心逻辑不依赖任何具体编辑器,
 * 测试中用假实现替换。
 */
class IEditorHost {
public:
    virtual ~IEditorHost() = default;

    /** @brief 在编辑区打开文档 (非预览) */
    virtual void showDocument(const fs::path& path) = 0;

    /** @brief 以 folder 作为新的工作区打开 */
    virtual void openFolder(const fs::path& folder) = 0;

    /** @brief 把编辑器窗口/当前编辑组切到前台 (尽力而为) */
    virtual void focus() = 0;

    /**
     * @brief 逐字输入时每个字符插入前回调一次
     * ch 是一个完整的 UTF-8 字符 (1-4 字节),column 为行内字节偏移。
     * 抛出异常会中断输入:该字符不再插入,之前已插入的字符保留。
     */
    virtual void revealTypedCharacter(const fs::path& path, size_t line, size_t column, const std::string& ch) = 0;
};

/**
 * @brief 无界面宿主:只记录日志
 */
class HeadlessEditorHost : public IEditorHost {
public:
    void showDocument(const fs::path& path) override;
    void openFolder(const fs::path& folder) override;
    void focus() override;
    void revealTypedCharacter(const fs::path& path, size_t line, size_t column, const std::string& ch) override;
};
