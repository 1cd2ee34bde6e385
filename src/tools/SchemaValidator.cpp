#include "tools/SchemaValidator.h"
#include <cmath>
#include <limits>

bool SchemaValidator::matchesType(const nlohmann::json& value, const std::string& type) {
    if (type == "string") return value.is_string();
    if (type == "boolean") return value.is_boolean();
    if (type == "number") return value.is_number();
    if (type == "integer") {
        // 工具按 long 取值,超出范围的一律拒绝
        if (value.is_number_unsigned()) {
            return value.get<unsigned long long>() <=
                   static_cast<unsigned long long>(std::numeric_limits<long>::max());
        }
        if (value.is_number_integer()) return true;
        if (value.is_number_float()) {
            double d = value.get<double>();
            const double lowest = static_cast<double>(std::numeric_limits<long>::min());
            return std::isfinite(d) && std::floor(d) == d && d >= lowest && d < -lowest;
        }
        return false;
    }
    if (type == "object") return value.is_object();
    if (type == "array") return value.is_array();
    if (type == "null") return value.is_null();
    return true;
}

SchemaValidator::ValidationResult SchemaValidator::validate(const nlohmann::json& schema, const nlohmann::json& args) {
    nlohmann::json input = args.is_null() ? nlohmann::json::object() : args;
    if (!input.is_object()) {
        return {false, "Arguments must be an object", "", nullptr};
    }

    const nlohmann::json properties = schema.value("properties", nlohmann::json::object());

    if (schema.contains("required")) {
        for (const auto& req : schema["required"]) {
            std::string name = req.get<std::string>();
            if (!input.contains(name) || input[name].is_null()) {
                return {false, "Missing required parameter: " + name, name, nullptr};
            }
        }
    }

    for (auto it = properties.begin(); it != properties.end(); ++it) {
        const std::string& name = it.key();
        const auto& prop = it.value();

        if (!input.contains(name) || input[name].is_null()) {
            if (prop.contains("default")) {
                input[name] = prop["default"];
            } else {
                input.erase(name);
            }
            continue;
        }

        if (prop.contains("type")) {
            std::string type = prop["type"].get<std::string>();
            if (!matchesType(input[name], type)) {
                return {false, "Invalid type for parameter '" + name + "': expected " + type +
                               ", got " + input[name].type_name(), name, nullptr};
            }
            if (type == "integer" && input[name].is_number_float()) {
                input[name] = static_cast<long>(input[name].get<double>());
            }
        }
        if (prop.contains("enum")) {
            bool found = false;
            for (const auto& allowed : prop["enum"]) {
                if (allowed == input[name]) { found = true; break; }
            }
            if (!found) {
                return {false, "Invalid value for parameter '" + name + "': " + input[name].dump(), name, nullptr};
            }
        }
    }

    return {true, "", "", input};
}
