#include "utils/TextCodec.h"
#include "core/Errors.h"
#include <algorithm>
#include <cctype>

namespace TextCodec {

std::string sanitizeUtf8(const std::string& input) {
    std::string output;
    output.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        unsigned char c = static_cast<unsigned char>(input[i]);

        // 单字节 ASCII (0x00-0x7F)
        if (c <= 0x7F) {
            output.push_back(static_cast<char>(c));
            i++;
            continue;
        }

        size_t len = 0;
        if (c >= 0xC2 && c <= 0xDF) len = 2;
        else if (c >= 0xE0 && c <= 0xEF) len = 3;
        else if (c >= 0xF0 && c <= 0xF4) len = 4;

        if (len == 0) {
            // 孤立的续字节 (0x80-0xBF) 或其他无效字节
            output.push_back('?');
            i++;
            continue;
        }

        bool valid = i + len <= input.size();
        for (size_t k = 1; valid && k < len; ++k) {
            valid = (static_cast<unsigned char>(input[i + k]) & 0xC0) == 0x80;
        }
        if (valid && len >= 3) {
            unsigned char c1 = static_cast<unsigned char>(input[i + 1]);
            // 避免过长编码和超出 Unicode 范围
            if ((c == 0xE0 && c1 < 0xA0) || (c == 0xF0 && c1 < 0x90) || (c == 0xF4 && c1 > 0x8F)) {
                output.push_back('?');
                i += len;
                continue;
            }
        }

        if (!valid) {
            output.push_back('?');
            i++;
            continue;
        }
        output.append(input, i, len);
        i += len;
    }

    return output;
}

size_t utf8SequenceLength(const std::string& text, size_t pos) {
    unsigned char c = static_cast<unsigned char>(text[pos]);
    size_t len = 1;
    if (c >= 0xC2 && c <= 0xDF) len = 2;
    else if (c >= 0xE0 && c <= 0xEF) len = 3;
    else if (c >= 0xF0 && c <= 0xF4) len = 4;

    if (pos + len > text.size()) return 1;
    for (size_t k = 1; k < len; ++k) {
        if ((static_cast<unsigned char>(text[pos + k]) & 0xC0) != 0x80) return 1;
    }
    return len;
}

size_t characterCount(const std::string& utf8) {
    size_t count = 0;
    for (size_t i = 0; i < utf8.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(utf8[i]);
        if ((c & 0xC0) == 0x80) continue;
        // 4 字节序列在 UTF-16 中占两个码元
        count += (c >= 0xF0) ? 2 : 1;
    }
    return count;
}

std::string latin1ToUtf8(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size());
    for (unsigned char c : bytes) {
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back(static_cast<char>(0xC0 | (c >> 6)));
            out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        }
    }
    return out;
}

std::string base64Encode(const std::string& bytes) {
    static const char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve(((bytes.size() + 2) / 3) * 4);

    size_t i = 0;
    while (i + 2 < bytes.size()) {
        unsigned int n = (static_cast<unsigned char>(bytes[i]) << 16) |
                         (static_cast<unsigned char>(bytes[i + 1]) << 8) |
                         static_cast<unsigned char>(bytes[i + 2]);
        out.push_back(alphabet[(n >> 18) & 0x3F]);
        out.push_back(alphabet[(n >> 12) & 0x3F]);
        out.push_back(alphabet[(n >> 6) & 0x3F]);
        out.push_back(alphabet[n & 0x3F]);
        i += 3;
    }

    size_t rest = bytes.size() - i;
    if (rest == 1) {
        unsigned int n = static_cast<unsigned char>(bytes[i]) << 16;
        out.push_back(alphabet[(n >> 18) & 0x3F]);
        out.push_back(alphabet[(n >> 12) & 0x3F]);
        out += "==";
    } else if (rest == 2) {
        unsigned int n = (static_cast<unsigned char>(bytes[i]) << 16) |
                         (static_cast<unsigned char>(bytes[i + 1]) << 8);
        out.push_back(alphabet[(n >> 18) & 0x3F]);
        out.push_back(alphabet[(n >> 12) & 0x3F]);
        out.push_back(alphabet[(n >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

std::string decode(const std::string& bytes, const std::string& encoding) {
    std::string enc = encoding;
    std::transform(enc.begin(), enc.end(), enc.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (enc.empty() || enc == "utf-8" || enc == "utf8") {
        return sanitizeUtf8(bytes);
    }
    if (enc == "base64") {
        return base64Encode(bytes);
    }
    if (enc == "latin1" || enc == "binary" || enc == "iso-8859-1") {
        return latin1ToUtf8(bytes);
    }
    if (enc == "ascii" || enc == "us-ascii") {
        std::string out = bytes;
        for (auto& ch : out) ch = static_cast<char>(ch & 0x7F);
        return out;
    }
    throw ValidationError("Unsupported encoding: " + encoding);
}

} // namespace TextCodec
