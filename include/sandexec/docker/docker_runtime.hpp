/**
 * @file docker_runtime.hpp
 * @brief ContainerRuntime implementation on the Docker Engine API
 *
 * @date 2025
 */

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "engine_client.hpp"
#include "sandexec/core/container_runtime.hpp"

namespace sandexec {
namespace docker {

/**
 * @class DockerContainerRuntime
 * @brief Production container runtime
 *
 * Adds two policies on top of DockerEngineClient:
 * - specs that fail core::CheckSecurityIssues() are refused before they
 *   reach the engine;
 * - logs are merged as stdout followed by stderr under a "[stderr]" label.
 *
 * **Thread Safety**: Thread-safe; every call is an independent request.
 */
class DockerContainerRuntime : public core::ContainerRuntime {
public:
    explicit DockerContainerRuntime(std::shared_ptr<DockerEngineClient> client);

    void EnsureImage(const std::string& image, const core::CancellationToken& token) override;

    core::ContainerHandle CreateContainer(const core::SandboxSpec& spec,
                                          const core::CancellationToken& token) override;

    void StartContainer(const core::ContainerHandle& handle,
                        const core::CancellationToken& token) override;

    std::optional<int> WaitContainer(const core::ContainerHandle& handle,
                                     const core::CancellationToken& token) override;

    std::string GetLogs(const core::ContainerHandle& handle,
                        const core::CancellationToken& token) override;

    void RemoveContainer(const core::ContainerHandle& handle,
                         const core::CancellationToken& token) override;

    /**
     * @brief Combine demultiplexed output into one text
     * @return stdout, then (if stderr is non-empty) "[stderr]\n" + stderr
     */
    static std::string MergeOutput(const ContainerLogs& logs);

private:
    std::shared_ptr<DockerEngineClient> client_;
};

} // namespace docker
} // namespace sandexec
