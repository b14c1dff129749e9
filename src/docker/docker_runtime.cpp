/**
 * @file docker_runtime.cpp
 * @brief Docker-backed ContainerRuntime
 *
 * @date 2025
 */

#include "sandexec/docker/docker_runtime.hpp"
#include "sandexec/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace sandexec {
namespace docker {

namespace {

constexpr char kStderrLabel[] = "[stderr]\n";

} // anonymous namespace

DockerContainerRuntime::DockerContainerRuntime(std::shared_ptr<DockerEngineClient> client)
    : client_(std::move(client)) {
    if (!client_) {
        throw std::invalid_argument("DockerContainerRuntime requires an engine client");
    }
}

void DockerContainerRuntime::EnsureImage(const std::string& image,
                                         const core::CancellationToken& token) {
    if (client_->ImageExists(image, token)) {
        spdlog::debug("Image present: {}", image);
        return;
    }
    client_->PullImage(image, token);
}

core::ContainerHandle DockerContainerRuntime::CreateContainer(const core::SandboxSpec& spec,
                                                              const core::CancellationToken& token) {
    auto issues = core::CheckSecurityIssues(spec);
    if (!issues.empty()) {
        spdlog::error("Refusing container spec with security issues:");
        for (const auto& issue : issues) {
            spdlog::error("  - {}", issue);
        }
        throw core::ContainerRuntimeError("refusing non-hardened container spec: " +
                                          utils::StringUtils::Join(issues, "; "));
    }

    return core::ContainerHandle(client_->CreateContainer(spec, token));
}

void DockerContainerRuntime::StartContainer(const core::ContainerHandle& handle,
                                            const core::CancellationToken& token) {
    client_->StartContainer(handle.Id(), token);
}

std::optional<int> DockerContainerRuntime::WaitContainer(const core::ContainerHandle& handle,
                                                         const core::CancellationToken& token) {
    return client_->WaitContainer(handle.Id(), token);
}

std::string DockerContainerRuntime::GetLogs(const core::ContainerHandle& handle,
                                            const core::CancellationToken& token) {
    return MergeOutput(client_->GetLogs(handle.Id(), token));
}

void DockerContainerRuntime::RemoveContainer(const core::ContainerHandle& handle,
                                             const core::CancellationToken& token) {
    client_->RemoveContainer(handle.Id(), token);
}

std::string DockerContainerRuntime::MergeOutput(const ContainerLogs& logs) {
    std::string output = logs.stdout_output;
    if (logs.stderr_output.empty()) {
        return output;
    }
    if (!output.empty() && output.back() != '\n') {
        output += '\n';
    }
    output += kStderrLabel;
    output += logs.stderr_output;
    return output;
}

} // namespace docker
} // namespace sandexec
