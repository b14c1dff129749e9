/**
 * @file schema_validator.hpp
 * @brief Validation of tool arguments against a JSON Schema subset
 *
 * Supported keywords: type, properties, required, additionalProperties
 * (boolean or schema), enum, minLength, maxLength, minimum, maximum.
 * Unknown keywords (description, title, $schema, ...) are ignored.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace sandexec {
namespace tools {

/**
 * @class SchemaValidator
 * @brief Checks JSON documents against a fixed schema
 *
 * **Usage Example**:
 * @code
 * SchemaValidator validator(tool.Definition());
 * auto errors = validator.Validate(args);
 * if (!errors.empty()) {
 *     spdlog::warn("Invalid arguments: {}", errors.front());
 * }
 * @endcode
 */
class SchemaValidator {
public:
    explicit SchemaValidator(nlohmann::json schema);

    /**
     * @brief Validate a document
     * @param instance Document to check
     * @return Violations as "<path>: <problem>" (empty when valid)
     */
    std::vector<std::string> Validate(const nlohmann::json& instance) const;

    bool IsValid(const nlohmann::json& instance) const { return Validate(instance).empty(); }

    const nlohmann::json& Schema() const { return schema_; }

private:
    void ValidateNode(const nlohmann::json& schema,
                      const nlohmann::json& instance,
                      const std::string& path,
                      std::vector<std::string>& errors) const;

    nlohmann::json schema_;
};

/// Name of the JSON type of a value ("object", "integer", "string", ...)
std::string JsonTypeName(const nlohmann::json& value);

} // namespace tools
} // namespace sandexec
