#pragma once
#include <string>

/**
 * 文本编解码辅助函数：read_file_code 与资源读取共用。
 */
namespace TextCodec {
    /**
     * @brief 验证并清理 UTF-8 字符串，不完整或无效的序列替换为 '?'
     */
    std::string sanitizeUtf8(const std::string& input);

    /**
     * @brief pos 处 UTF-8 字符占用的字节数
     * 无效或截断的序列按 1 字节计。
     */
    size_t utf8SequenceLength(const std::string& text, size_t pos);

    /**
     * @brief 统计解码后文本的字符数 (按 UTF-16 码元计，与编辑器的 length 一致)
     * 输入应为已清理的 UTF-8。
     */
    size_t characterCount(const std::string& utf8);

    std::string latin1ToUtf8(const std::string& bytes);

    std::string base64Encode(const std::string& bytes);

    /**
     * @brief 按 encoding 把原始字节转成文本
     * 支持: utf-8/utf8 (默认), ascii, latin1/binary, base64。
     * @throws ValidationError 不支持的编码
     */
    std::string decode(const std::string& bytes, const std::string& encoding);
}
