/**
 * @file tool.cpp
 * @brief Result and error envelope serialization
 *
 * @date 2025
 */

#include "sandexec/tools/tool.hpp"
#include "sandexec/core/errors.hpp"

namespace sandexec {
namespace tools {

using json = nlohmann::json;

json ToolResult::ToJson() const {
    json out = {
        {"data", data},
        {"metadata", metadata},
    };
    if (!warnings.empty()) {
        out["warnings"] = warnings;
    }
    return out;
}

json ErrorEnvelope(const std::exception& error) {
    json body = {
        {"message", error.what()},
    };

    if (const auto* input = dynamic_cast<const core::InputError*>(&error)) {
        body["kind"] = core::ToString(input->kind());
        body["stage"] = core::ToString(core::ExecutionStage::RESOLVE);
        body["code"] = core::ToString(input->code());
    } else if (const auto* infra = dynamic_cast<const core::InfrastructureError*>(&error)) {
        body["kind"] = core::ToString(infra->kind());
        body["stage"] = core::ToString(infra->stage());
        body["cancelled"] = infra->cancelled();
        body["partial_output"] = infra->partial_output();
    } else if (const auto* cleanup = dynamic_cast<const core::CleanupError*>(&error)) {
        body["kind"] = core::ToString(cleanup->kind());
        body["stage"] = core::ToString(core::ExecutionStage::REMOVE_CONTAINER);
        body["container_id"] = cleanup->container_id();
    } else {
        body["kind"] = core::ToString(core::ErrorKind::INFRASTRUCTURE);
    }

    if (!body.contains("partial_output")) {
        body["partial_output"] = "";
    }

    return json{{"error", body}};
}

} // namespace tools
} // namespace sandexec
