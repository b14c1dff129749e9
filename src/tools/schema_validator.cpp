/**
 * @file schema_validator.cpp
 * @brief JSON Schema subset validation
 *
 * @date 2025
 */

#include "sandexec/tools/schema_validator.hpp"

#include <cmath>
#include <cstdint>
#include <stdexcept>

namespace sandexec {
namespace tools {

using json = nlohmann::json;

namespace {

bool IsIntegral(const json& value) {
    if (value.is_number_integer()) {
        return true;
    }
    if (value.is_number_float()) {
        double d = value.get<double>();
        return std::isfinite(d) && std::floor(d) == d;
    }
    return false;
}

bool MatchesType(const json& value, const std::string& type) {
    if (type == "object")  return value.is_object();
    if (type == "array")   return value.is_array();
    if (type == "string")  return value.is_string();
    if (type == "boolean") return value.is_boolean();
    if (type == "null")    return value.is_null();
    if (type == "number")  return value.is_number();
    if (type == "integer") return IsIntegral(value);
    return false;
}

// Length in code points, as JSON Schema counts it
std::size_t Utf8Length(const std::string& str) {
    std::size_t count = 0;
    for (unsigned char c : str) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

std::string Describe(const std::string& path) {
    return path.empty() ? "/" : path;
}

std::string FormatNumber(const json& value) {
    return value.dump();
}

} // anonymous namespace

std::string JsonTypeName(const json& value) {
    if (value.is_object())  return "object";
    if (value.is_array())   return "array";
    if (value.is_string())  return "string";
    if (value.is_boolean()) return "boolean";
    if (value.is_null())    return "null";
    if (IsIntegral(value))  return "integer";
    if (value.is_number())  return "number";
    return "unknown";
}

SchemaValidator::SchemaValidator(json schema)
    : schema_(std::move(schema)) {
    if (!schema_.is_object()) {
        throw std::invalid_argument("Schema must be a JSON object");
    }
}

std::vector<std::string> SchemaValidator::Validate(const json& instance) const {
    std::vector<std::string> errors;
    ValidateNode(schema_, instance, "", errors);
    return errors;
}

void SchemaValidator::ValidateNode(const json& schema,
                                   const json& instance,
                                   const std::string& path,
                                   std::vector<std::string>& errors) const {
    if (schema.is_boolean()) {
        if (!schema.get<bool>()) {
            errors.push_back(Describe(path) + ": not allowed");
        }
        return;
    }
    if (!schema.is_object()) {
        return;
    }

    // type
    if (schema.contains("type")) {
        const auto& type = schema["type"];
        bool matched = false;
        if (type.is_string()) {
            matched = MatchesType(instance, type.get<std::string>());
        } else if (type.is_array()) {
            for (const auto& candidate : type) {
                if (candidate.is_string() && MatchesType(instance, candidate.get<std::string>())) {
                    matched = true;
                    break;
                }
            }
        }
        if (!matched) {
            errors.push_back(Describe(path) + ": expected " + type.dump() +
                             ", got " + JsonTypeName(instance));
            return;
        }
    }

    // enum
    if (schema.contains("enum") && schema["enum"].is_array()) {
        bool found = false;
        for (const auto& allowed : schema["enum"]) {
            if (allowed == instance) {
                found = true;
                break;
            }
        }
        if (!found) {
            errors.push_back(Describe(path) + ": value " + instance.dump() +
                             " is not one of " + schema["enum"].dump());
        }
    }

    // string constraints
    if (instance.is_string()) {
        std::size_t length = Utf8Length(instance.get<std::string>());
        if (schema.contains("minLength") && schema["minLength"].is_number_integer() &&
            static_cast<std::int64_t>(length) < schema["minLength"].get<std::int64_t>()) {
            errors.push_back(Describe(path) + ": shorter than " +
                             FormatNumber(schema["minLength"]) + " characters");
        }
        if (schema.contains("maxLength") && schema["maxLength"].is_number_integer() &&
            static_cast<std::int64_t>(length) > schema["maxLength"].get<std::int64_t>()) {
            errors.push_back(Describe(path) + ": longer than " +
                             FormatNumber(schema["maxLength"]) + " characters");
        }
    }

    // numeric constraints
    if (instance.is_number()) {
        double value = instance.get<double>();
        if (schema.contains("minimum") && schema["minimum"].is_number() &&
            value < schema["minimum"].get<double>()) {
            errors.push_back(Describe(path) + ": " + instance.dump() +
                             " is less than minimum " + FormatNumber(schema["minimum"]));
        }
        if (schema.contains("maximum") && schema["maximum"].is_number() &&
            value > schema["maximum"].get<double>()) {
            errors.push_back(Describe(path) + ": " + instance.dump() +
                             " is greater than maximum " + FormatNumber(schema["maximum"]));
        }
    }

    // object constraints
    if (instance.is_object()) {
        if (schema.contains("required") && schema["required"].is_array()) {
            for (const auto& name : schema["required"]) {
                if (name.is_string() && !instance.contains(name.get<std::string>())) {
                    errors.push_back(Describe(path) + ": missing required property '" +
                                     name.get<std::string>() + "'");
                }
            }
        }

        const json* properties = nullptr;
        if (schema.contains("properties") && schema["properties"].is_object()) {
            properties = &schema["properties"];
        }

        for (const auto& [name, value] : instance.items()) {
            std::string child_path = path + "/" + name;
            if (properties != nullptr && properties->contains(name)) {
                ValidateNode((*properties)[name], value, child_path, errors);
                continue;
            }
            if (schema.contains("additionalProperties")) {
                const auto& additional = schema["additionalProperties"];
                if (additional.is_boolean() && !additional.get<bool>()) {
                    errors.push_back(Describe(path) + ": unexpected property '" + name + "'");
                } else if (additional.is_object()) {
                    ValidateNode(additional, value, child_path, errors);
                }
            }
        }
    }
}

} // namespace tools
} // namespace sandexec
