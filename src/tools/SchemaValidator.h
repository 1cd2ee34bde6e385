#pragma once
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief 工具参数校验
 *
 * 支持 JSON Schema 的一个子集:object 顶层、properties 的 type
 * (string / boolean / number / integer / object / array)、required 与 default。
 * 未声明的参数原样保留。
 */
class SchemaValidator {
public:
    struct ValidationResult {
        bool valid;
        std::string error;
        std::string field;      // 出错的参数名
        nlohmann::json args;    // 补齐默认值后的参数 (valid 时有效)
    };

    static ValidationResult validate(const nlohmann::json& schema, const nlohmann::json& args);

private:
    static bool matchesType(const nlohmann::json& value, const std::string& type);
};
