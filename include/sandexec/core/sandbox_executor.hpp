/**
 * @file sandbox_executor.hpp
 * @brief Orchestration of one sandboxed guest execution
 *
 * Drives a request through the lifecycle
 *
 * ```
 * Resolve → EnsureImage → CreateContainer → StartContainer
 *         → WaitForExit → CollectLogs → RemoveContainer
 * ```
 *
 * and maps the outcome onto ExecutionResult or the error taxonomy of
 * errors.hpp. A guest program exiting non-zero is a normal result.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include "cancellation.hpp"
#include "command_builder.hpp"
#include "container_runtime.hpp"
#include "errors.hpp"
#include "language_catalog.hpp"
#include "sandbox_spec.hpp"
#include "timeout_resolver.hpp"

namespace sandexec {
namespace core {

/**
 * @struct ExecutionRequest
 * @brief One guest program to run
 */
struct ExecutionRequest {
    std::string language;      ///< Catalog identifier
    std::string code;          ///< Guest source, must be non-empty
    int timeout_seconds{0};    ///< <= 0 selects the default timeout
};

/**
 * @struct ExecutionResult
 * @brief Outcome of a guest program that ran to completion
 */
struct ExecutionResult {
    std::string output;                      ///< stdout, then labeled stderr
    int exit_code{0};                        ///< Guest exit status (data, not an error)
    std::string language;                    ///< Requested language
    std::string image;                       ///< Image the guest ran in
    std::string container_id;                ///< Container that was used (already removed)
    std::chrono::milliseconds duration{0};   ///< Wall time of the whole lifecycle
    std::vector<std::string> warnings;       ///< Cleanup problems that did not prevent a result
};

/**
 * @struct ExecutorConfig
 * @brief Operator-controlled executor settings
 */
struct ExecutorConfig {
    ResourceLimits limits;                               ///< Container resource ceilings
    std::chrono::seconds default_timeout{10};            ///< Wait timeout when none requested
    std::chrono::seconds cleanup_timeout{30};            ///< Bound on log collection and removal
    std::size_t max_code_bytes{64 * 1024};               ///< Largest accepted guest source
};

/// Invoked when the executor enters a lifecycle stage
using StageCallback = std::function<void(ExecutionStage)>;

/**
 * @class SandboxExecutor
 * @brief Runs guest programs in disposable hardened containers
 *
 * **Guarantees**:
 * - No container interaction happens before the request is validated.
 * - A created container is removed exactly once, on every exit path.
 * - Removal runs under its own token; caller cancellation cannot orphan
 *   a container.
 * - Cancellation or timeout during the wait returns promptly as an
 *   InfrastructureError (stage WAIT_FOR_EXIT, cancelled() == true) after
 *   log collection and removal were attempted.
 *
 * **Thread Safety**: Execute() may be called concurrently, provided the
 * runtime supports concurrent use. SetStageCallback() is not synchronized
 * and should be called before the first execution.
 *
 * **Usage Example**:
 * @code
 * auto runtime = std::make_shared<docker::DockerContainerRuntime>(client);
 * SandboxExecutor executor(runtime);
 *
 * auto result = executor.Execute({"python", "print(42)", 0});
 * // result.output == "42\n", result.exit_code == 0
 * @endcode
 */
class SandboxExecutor {
public:
    /**
     * @param runtime Container engine adapter
     * @param config Resource ceilings and timeouts
     * @param catalog Language table (must outlive the executor)
     *
     * @throws std::invalid_argument if runtime is null or config is invalid
     */
    explicit SandboxExecutor(std::shared_ptr<ContainerRuntime> runtime,
                             ExecutorConfig config = ExecutorConfig{},
                             const LanguageCatalog& catalog = LanguageCatalog::Default());

    /**
     * @brief Run one request to completion
     * @param request Guest program
     * @param token Caller cancellation (observed until the wait completes)
     * @return Result with the guest's exit status and output
     *
     * @throws InputError if the request is invalid (nothing was created)
     * @throws InfrastructureError if no result could be produced
     */
    ExecutionResult Execute(const ExecutionRequest& request,
                            const CancellationToken& token = CancellationToken()) const;

    /**
     * @brief Run Execute() on a separate thread
     *
     * The executor must outlive the returned future.
     */
    std::future<ExecutionResult> ExecuteAsync(ExecutionRequest request,
                                              CancellationToken token = CancellationToken()) const;

    void SetStageCallback(StageCallback callback);

    const ExecutorConfig& Config() const { return config_; }
    const LanguageCatalog& Catalog() const { return catalog_; }

private:
    void Notify(ExecutionStage stage) const;

    std::shared_ptr<ContainerRuntime> runtime_;
    ExecutorConfig config_;
    const LanguageCatalog& catalog_;
    CommandBuilder command_builder_;
    TimeoutResolver timeout_resolver_;
    StageCallback stage_callback_;
};

} // namespace core
} // namespace sandexec
