/**
 * @file container_runtime.hpp
 * @brief Narrow contract between the executor and a container engine
 *
 * The executor depends only on this capability set. Production code binds
 * it to the Docker Engine API (docker::DockerContainerRuntime); tests bind
 * it to in-memory doubles.
 *
 * Every operation receives a CancellationToken. Implementations must return
 * promptly with OperationCancelledError once the token fires, and report any
 * other failure with ContainerRuntimeError.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>

#include "cancellation.hpp"
#include "errors.hpp"
#include "sandbox_spec.hpp"

namespace sandexec {
namespace core {

/**
 * @class ContainerHandle
 * @brief Opaque identifier of a created container
 */
class ContainerHandle {
public:
    ContainerHandle() = default;
    explicit ContainerHandle(std::string id) : id_(std::move(id)) {}

    const std::string& Id() const { return id_; }

    /// First 12 characters, as printed by the docker CLI
    std::string ShortId() const { return id_.substr(0, 12); }

    bool IsValid() const { return !id_.empty(); }

    bool operator==(const ContainerHandle& other) const { return id_ == other.id_; }
    bool operator!=(const ContainerHandle& other) const { return id_ != other.id_; }

private:
    std::string id_;
};

/**
 * @class ContainerRuntime
 * @brief Container engine operations required by one execution
 */
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    /// Guarantee the image is present locally, pulling it if absent. Idempotent.
    virtual void EnsureImage(const std::string& image, const CancellationToken& token) = 0;

    virtual ContainerHandle CreateContainer(const SandboxSpec& spec,
                                            const CancellationToken& token) = 0;

    virtual void StartContainer(const ContainerHandle& handle,
                                const CancellationToken& token) = 0;

    /**
     * @brief Block until the container is no longer running
     * @return Exit status, or nullopt when the engine reported no status
     */
    virtual std::optional<int> WaitContainer(const ContainerHandle& handle,
                                             const CancellationToken& token) = 0;

    /// Combined output: stdout, then stderr under a "[stderr]" label
    virtual std::string GetLogs(const ContainerHandle& handle,
                                const CancellationToken& token) = 0;

    /// Force-remove the container together with its anonymous volumes
    virtual void RemoveContainer(const ContainerHandle& handle,
                                 const CancellationToken& token) = 0;
};

/**
 * @class ScopedContainer
 * @brief Owns a created container and removes it exactly once
 *
 * Release() performs the removal under a fresh cleanup token bounded by
 * the cleanup timeout, never under the caller's token. If the guard is
 * destroyed without Release() (unexpected exception between create and
 * cleanup), the destructor removes the container and logs any failure.
 *
 * **Usage Example**:
 * @code
 * ScopedContainer container(runtime, runtime.CreateContainer(spec, token),
 *                           std::chrono::seconds(30));
 * runtime.StartContainer(container.Handle(), token);
 * ...
 * if (auto failure = container.Release()) {
 *     spdlog::warn("{}", failure->what());
 * }
 * @endcode
 */
class ScopedContainer {
public:
    ScopedContainer(ContainerRuntime& runtime,
                    ContainerHandle handle,
                    std::chrono::seconds cleanup_timeout);
    ~ScopedContainer();

    ScopedContainer(const ScopedContainer&) = delete;
    ScopedContainer& operator=(const ScopedContainer&) = delete;

    const ContainerHandle& Handle() const { return handle_; }

    /**
     * @brief Remove the container
     * @return CleanupError describing the failure, nullopt on success or
     *         if the container was already released
     */
    std::optional<CleanupError> Release();

    bool Released() const { return released_; }

private:
    ContainerRuntime& runtime_;
    ContainerHandle handle_;
    std::chrono::seconds cleanup_timeout_;
    bool released_{false};
};

} // namespace core
} // namespace sandexec
