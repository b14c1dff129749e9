/**
 * @file tool_registry.cpp
 * @brief Tool registration and dispatch
 *
 * @date 2025
 */

#include "sandexec/tools/tool_registry.hpp"
#include "sandexec/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace sandexec {
namespace tools {

using json = nlohmann::json;

void ToolRegistry::Register(std::shared_ptr<Tool> tool) {
    if (!tool) {
        throw std::invalid_argument("tool must not be null");
    }
    std::string name = tool->Name();
    if (tools_.count(name) != 0) {
        throw std::invalid_argument("tool '" + name + "' is already registered");
    }
    tools_.emplace(name, std::move(tool));
    spdlog::debug("Registered tool: {}", name);
}

std::shared_ptr<Tool> ToolRegistry::Get(const std::string& name) const {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        throw std::out_of_range("unknown tool: '" + name + "'");
    }
    return it->second;
}

bool ToolRegistry::Contains(const std::string& name) const {
    return tools_.count(name) != 0;
}

std::vector<std::shared_ptr<Tool>> ToolRegistry::List() const {
    std::vector<std::shared_ptr<Tool>> out;
    out.reserve(tools_.size());
    for (const auto& [name, tool] : tools_) {
        out.push_back(tool);
    }
    return out;
}

json ToolRegistry::Definitions() const {
    json out = json::array();
    for (const auto& [name, tool] : tools_) {
        out.push_back({
            {"name", name},
            {"description", tool->Description()},
            {"input_schema", tool->Definition()},
        });
    }
    return out;
}

json ToolRegistry::Dispatch(const std::string& name,
                            const std::string& payload,
                            const core::CancellationToken& token) const {
    try {
        auto it = tools_.find(name);
        if (it == tools_.end()) {
            throw core::InputError(core::InputErrorCode::MALFORMED_PAYLOAD,
                                   "unknown tool: '" + name + "'");
        }

        json args;
        try {
            args = json::parse(payload);
        } catch (const json::parse_error& e) {
            throw core::InputError(core::InputErrorCode::MALFORMED_PAYLOAD,
                                   std::string("failed to parse input: ") + e.what());
        }

        return it->second->Call(args, token).ToJson();

    } catch (const core::InputError& e) {
        spdlog::warn("Rejected {} call: {}", name, e.what());
        return ErrorEnvelope(e);
    } catch (const std::exception& e) {
        spdlog::error("{} call failed: {}", name, e.what());
        return ErrorEnvelope(e);
    }
}

} // namespace tools
} // namespace sandexec
