/**
 * @file sandbox_tool.hpp
 * @brief "docker_sandbox" tool: JSON front end of the sandbox executor
 *
 * Input:
 * ```json
 * {"language": "python", "code": "print(42)", "timeout": 5}
 * ```
 *
 * Output:
 * ```json
 * {"data": "42\n", "metadata": {"language": "python",
 *                              "image": "python:3.12-slim",
 *                              "exit_code": "0"}}
 * ```
 *
 * @date 2025
 */

#pragma once

#include <memory>
#include <string>

#include "schema_validator.hpp"
#include "tool.hpp"
#include "sandexec/core/sandbox_executor.hpp"

namespace sandexec {
namespace tools {

/**
 * @class SandboxTool
 * @brief Validates tool arguments and runs them through SandboxExecutor
 *
 * Arguments are checked against Definition() first; the language enum in
 * the schema and the executor's catalog lookup reject unknown languages
 * independently of each other.
 */
class SandboxTool : public Tool {
public:
    static constexpr char kName[] = "docker_sandbox";

    /**
     * @param executor Executor used for every call
     * @param max_timeout_seconds Upper bound advertised and enforced for "timeout"
     */
    explicit SandboxTool(std::shared_ptr<core::SandboxExecutor> executor,
                         int max_timeout_seconds = 30);

    std::string Name() const override { return kName; }
    std::string Description() const override;
    nlohmann::json Definition() const override;

    ToolResult Call(const nlohmann::json& args,
                    const core::CancellationToken& token) override;

    /**
     * @brief Validate arguments and convert them into a request
     * @throws core::InputError describing the first class of problem found
     */
    core::ExecutionRequest ParseRequest(const nlohmann::json& args) const;

    /// Render an execution result in the tool output shape
    static ToolResult ToToolResult(const core::ExecutionResult& result);

private:
    std::shared_ptr<core::SandboxExecutor> executor_;
    int max_timeout_seconds_;
    SchemaValidator validator_;
};

} // namespace tools
} // namespace sandexec
