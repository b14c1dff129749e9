/**
 * @file sandbox_tool.cpp
 * @brief Sandbox tool schema, argument parsing and result mapping
 *
 * @date 2025
 */

#include "sandexec/tools/sandbox_tool.hpp"
#include "sandexec/core/errors.hpp"
#include "sandexec/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace sandexec {
namespace tools {

using json = nlohmann::json;
using core::InputError;
using core::InputErrorCode;

namespace {

json BuildDefinition(const core::LanguageCatalog& catalog, int max_timeout_seconds) {
    return json{
        {"$schema", "https://json-schema.org/draft/2020-12/schema"},
        {"type", "object"},
        {"properties", {
            {"language", {
                {"type", "string"},
                {"enum", catalog.SupportedLanguages()},
                {"description", "Programming language of the code"},
            }},
            {"code", {
                {"type", "string"},
                {"minLength", 1},
                {"description", "Source code to execute"},
            }},
            {"timeout", {
                {"type", "integer"},
                {"maximum", max_timeout_seconds},
                {"description", "Execution timeout in seconds (0 or less selects the default)"},
            }},
        }},
        {"required", {"language", "code"}},
        {"additionalProperties", false},
    };
}

} // anonymous namespace

SandboxTool::SandboxTool(std::shared_ptr<core::SandboxExecutor> executor,
                         int max_timeout_seconds)
    : executor_(std::move(executor))
    , max_timeout_seconds_(max_timeout_seconds)
    , validator_(BuildDefinition(executor_ ? executor_->Catalog() : core::LanguageCatalog::Default(),
                                 max_timeout_seconds)) {
    if (!executor_) {
        throw std::invalid_argument("SandboxTool requires an executor");
    }
    if (max_timeout_seconds_ < 1) {
        throw std::invalid_argument("Maximum timeout must be at least one second");
    }
}

std::string SandboxTool::Description() const {
    return "Executes code in a secure, isolated Docker sandbox container with no network access";
}

json SandboxTool::Definition() const {
    return validator_.Schema();
}

core::ExecutionRequest SandboxTool::ParseRequest(const json& args) const {
    if (!args.is_object()) {
        throw InputError(InputErrorCode::MALFORMED_PAYLOAD,
                         "input must be a JSON object, got " + JsonTypeName(args));
    }

    for (const char* field : {"language", "code"}) {
        if (!args.contains(field)) {
            throw InputError(InputErrorCode::MISSING_FIELD,
                             std::string("missing required field '") + field + "'");
        }
    }

    if (args["code"].is_string() && args["code"].get<std::string>().empty()) {
        throw InputError(InputErrorCode::EMPTY_CODE, "code must not be empty");
    }

    auto errors = validator_.Validate(args);
    if (!errors.empty()) {
        throw InputError(InputErrorCode::SCHEMA_VIOLATION,
                         "input validation failed: " + utils::StringUtils::Join(errors, "; "));
    }

    core::ExecutionRequest request;
    request.language = args["language"].get<std::string>();
    request.code = args["code"].get<std::string>();
    if (args.contains("timeout")) {
        // Upper bound is enforced by the schema; anything non-positive selects the default
        double timeout = args["timeout"].get<double>();
        request.timeout_seconds = timeout > 0 ? static_cast<int>(timeout) : 0;
    }
    return request;
}

ToolResult SandboxTool::ToToolResult(const core::ExecutionResult& result) {
    ToolResult out;
    out.data = result.output;
    out.metadata["language"] = result.language;
    out.metadata["image"] = result.image;
    out.metadata["exit_code"] = std::to_string(result.exit_code);
    out.warnings = result.warnings;
    return out;
}

ToolResult SandboxTool::Call(const json& args, const core::CancellationToken& token) {
    auto request = ParseRequest(args);
    auto result = executor_->Execute(request, token);

    if (result.exit_code != 0) {
        spdlog::info("Guest program exited with status {}", result.exit_code);
    }
    return ToToolResult(result);
}

} // namespace tools
} // namespace sandexec
