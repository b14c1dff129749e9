/**
 * @file tool_registry.hpp
 * @brief Name-indexed collection of tools
 *
 * @date 2025
 */

#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "tool.hpp"

namespace sandexec {
namespace tools {

/**
 * @class ToolRegistry
 * @brief Registers tools and dispatches raw JSON calls to them
 *
 * **Usage Example**:
 * @code
 * ToolRegistry registry;
 * registry.Register(std::make_shared<SandboxTool>(executor));
 *
 * auto reply = registry.Dispatch("docker_sandbox",
 *                                R"({"language":"bash","code":"echo hi"})",
 *                                token);
 * @endcode
 */
class ToolRegistry {
public:
    /// @throws std::invalid_argument on null tools or duplicate names
    void Register(std::shared_ptr<Tool> tool);

    /// @throws std::out_of_range if no tool has this name
    std::shared_ptr<Tool> Get(const std::string& name) const;

    bool Contains(const std::string& name) const;

    /// Tools ordered by name
    std::vector<std::shared_ptr<Tool>> List() const;

    /// [{"name", "description", "input_schema"}, ...] ordered by name
    nlohmann::json Definitions() const;

    /**
     * @brief Parse a raw payload and call a tool
     * @param name Tool name
     * @param payload JSON arguments as text
     * @param token Caller cancellation
     * @return Tool result envelope, or an error envelope on any failure
     */
    nlohmann::json Dispatch(const std::string& name,
                            const std::string& payload,
                            const core::CancellationToken& token) const;

    std::size_t Size() const { return tools_.size(); }

private:
    std::map<std::string, std::shared_ptr<Tool>> tools_;
};

} // namespace tools
} // namespace sandexec
