/**
 * @file tool.hpp
 * @brief Tool interface and JSON result envelopes
 *
 * A tool is named, self-describing (its input is a JSON Schema) and callable
 * with JSON arguments. Successful calls return ToolResult; failures are
 * thrown as core::SandboxError subclasses and rendered with ErrorEnvelope()
 * at the outer boundary.
 *
 * @date 2025
 */

#pragma once

#include <exception>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "sandexec/core/cancellation.hpp"

namespace sandexec {
namespace tools {

/**
 * @struct ToolResult
 * @brief Uniform successful tool output
 */
struct ToolResult {
    std::string data;                             ///< Main textual payload
    std::map<std::string, std::string> metadata;  ///< String-valued annotations
    std::vector<std::string> warnings;            ///< Non-fatal problems

    /// {"data": ..., "metadata": {...}, "warnings": [...]} (warnings only if present)
    nlohmann::json ToJson() const;
};

/**
 * @class Tool
 * @brief Callable capability exposed to callers
 */
class Tool {
public:
    virtual ~Tool() = default;

    virtual std::string Name() const = 0;
    virtual std::string Description() const = 0;

    /// JSON Schema of the accepted arguments
    virtual nlohmann::json Definition() const = 0;

    /**
     * @brief Execute the tool
     * @param args Arguments (validated against Definition() by the tool)
     * @param token Caller cancellation
     *
     * @throws core::SandboxError on failure
     */
    virtual ToolResult Call(const nlohmann::json& args,
                            const core::CancellationToken& token) = 0;
};

/**
 * @brief Render a failure as {"error": {"kind", "stage", "message", "partial_output"}}
 *
 * core::SandboxError subclasses contribute their kind, stage and partial
 * output; any other exception is reported as an infrastructure error.
 */
nlohmann::json ErrorEnvelope(const std::exception& error);

} // namespace tools
} // namespace sandexec
