/**
 * @file sandbox_executor.cpp
 * @brief Lifecycle state machine of one sandboxed execution
 *
 * @date 2025
 */

#include "sandexec/core/sandbox_executor.hpp"
#include "sandexec/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <optional>
#include <stdexcept>
#include <utility>

namespace sandexec {
namespace core {

namespace {

/**
 * Run one runtime operation and translate adapter failures into an
 * InfrastructureError for the given stage.
 */
template <typename Operation>
auto RunStage(ExecutionStage stage, const std::string& failure_message, Operation&& operation)
    -> decltype(operation()) {
    try {
        return operation();
    } catch (const OperationCancelledError& e) {
        throw InfrastructureError(stage, failure_message + ": " + e.what(), true);
    } catch (const ContainerRuntimeError& e) {
        throw InfrastructureError(stage, failure_message + ": " + e.what());
    } catch (const std::exception& e) {
        spdlog::debug("Unclassified runtime failure at stage {}", ToString(stage));
        throw InfrastructureError(stage, failure_message + ": " + e.what());
    }
}

std::chrono::milliseconds ElapsedSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

} // anonymous namespace

SandboxExecutor::SandboxExecutor(std::shared_ptr<ContainerRuntime> runtime,
                                 ExecutorConfig config,
                                 const LanguageCatalog& catalog)
    : runtime_(std::move(runtime))
    , config_(std::move(config))
    , catalog_(catalog)
    , command_builder_(catalog)
    , timeout_resolver_(config_.default_timeout) {

    if (!runtime_) {
        throw std::invalid_argument("SandboxExecutor requires a container runtime");
    }
    if (config_.cleanup_timeout.count() <= 0) {
        throw std::invalid_argument("Cleanup timeout must be positive");
    }
    if (config_.max_code_bytes == 0) {
        throw std::invalid_argument("Maximum code size must be positive");
    }
}

void SandboxExecutor::SetStageCallback(StageCallback callback) {
    stage_callback_ = std::move(callback);
}

void SandboxExecutor::Notify(ExecutionStage stage) const {
    spdlog::debug("Stage: {}", ToString(stage));
    if (stage_callback_) {
        stage_callback_(stage);
    }
}

std::future<ExecutionResult> SandboxExecutor::ExecuteAsync(ExecutionRequest request,
                                                           CancellationToken token) const {
    return std::async(std::launch::async,
                      [this, request = std::move(request), token = std::move(token)]() {
                          return Execute(request, token);
                      });
}

ExecutionResult SandboxExecutor::Execute(const ExecutionRequest& request,
                                         const CancellationToken& token) const {
    const auto start_time = std::chrono::steady_clock::now();

    // ========================================================================
    // Resolve
    // ========================================================================

    Notify(ExecutionStage::RESOLVE);

    if (request.code.empty()) {
        throw InputError(InputErrorCode::EMPTY_CODE, "code must not be empty");
    }
    if (request.code.size() > config_.max_code_bytes) {
        throw InputError(InputErrorCode::CODE_TOO_LARGE,
                         "code is " + std::to_string(request.code.size()) +
                         " bytes, limit is " + std::to_string(config_.max_code_bytes));
    }

    const LanguageProfile& profile = catalog_.Resolve(request.language);
    const auto command = command_builder_.Build(profile.id, request.code);
    const auto timeout = timeout_resolver_.Resolve(request.timeout_seconds);
    const SandboxSpec spec = BuildHardenedSpec(profile.image, command, config_.limits);

    spdlog::info("Executing {} snippet ({} bytes, sha256 {}) in {} with {}s timeout",
                 profile.id, request.code.size(),
                 utils::HashUtils::ShortDigest(request.code),
                 profile.image, timeout.count());

    // ========================================================================
    // EnsureImage / CreateContainer (no cleanup obligation yet)
    // ========================================================================

    Notify(ExecutionStage::ENSURE_IMAGE);
    RunStage(ExecutionStage::ENSURE_IMAGE, "failed to pull image " + profile.image, [&]() {
        runtime_->EnsureImage(profile.image, token);
    });

    Notify(ExecutionStage::CREATE_CONTAINER);
    ContainerHandle handle = RunStage(ExecutionStage::CREATE_CONTAINER,
                                      "failed to create container", [&]() {
        return runtime_->CreateContainer(spec, token);
    });

    ScopedContainer container(*runtime_, handle, config_.cleanup_timeout);
    spdlog::info("✓ Container created: {}", handle.ShortId());

    // ========================================================================
    // StartContainer / WaitForExit
    // ========================================================================

    std::optional<InfrastructureError> failure;
    std::optional<int> exit_code;
    bool started = false;

    try {
        Notify(ExecutionStage::START_CONTAINER);
        RunStage(ExecutionStage::START_CONTAINER, "failed to start container", [&]() {
            runtime_->StartContainer(handle, token);
        });
        started = true;

        Notify(ExecutionStage::WAIT_FOR_EXIT);
        CancellationSource wait_scope(token, timeout);

        try {
            exit_code = runtime_->WaitContainer(handle, wait_scope.Token());
        } catch (const OperationCancelledError& e) {
            std::string message = e.deadline_exceeded()
                ? "execution timed out after " + std::to_string(timeout.count()) + "s"
                : "execution cancelled";
            throw InfrastructureError(ExecutionStage::WAIT_FOR_EXIT, message, true);
        } catch (const std::exception& e) {
            throw InfrastructureError(ExecutionStage::WAIT_FOR_EXIT,
                                      std::string("failed to wait for container: ") + e.what());
        }

        if (!exit_code) {
            throw InfrastructureError(ExecutionStage::WAIT_FOR_EXIT,
                                      "failed to wait for container: no exit status reported");
        }

    } catch (const InfrastructureError& e) {
        spdlog::error("Execution in {} failed at stage {}: {}",
                      handle.ShortId(), ToString(e.stage()), e.what());
        failure = e;
    }

    // ========================================================================
    // CollectLogs (best effort, independent of the caller's token)
    // ========================================================================

    std::string output;
    if (started) {
        Notify(ExecutionStage::COLLECT_LOGS);
        auto cleanup_scope = CancellationSource::WithTimeout(config_.cleanup_timeout);

        try {
            output = runtime_->GetLogs(handle, cleanup_scope.Token());
        } catch (const std::exception& e) {
            if (failure) {
                spdlog::warn("Could not collect partial output from {}: {}",
                             handle.ShortId(), e.what());
            } else {
                failure = InfrastructureError(ExecutionStage::COLLECT_LOGS,
                                              std::string("failed to retrieve logs: ") + e.what());
            }
        }
    }

    // ========================================================================
    // RemoveContainer
    // ========================================================================

    Notify(ExecutionStage::REMOVE_CONTAINER);
    auto cleanup_error = container.Release();
    if (cleanup_error) {
        spdlog::error("{}", cleanup_error->what());
    }

    if (failure) {
        throw InfrastructureError(failure->stage(), failure->what(),
                                  failure->cancelled(), std::move(output));
    }

    ExecutionResult result;
    result.output = std::move(output);
    result.exit_code = *exit_code;
    result.language = profile.id;
    result.image = profile.image;
    result.container_id = handle.Id();
    result.duration = ElapsedSince(start_time);
    if (cleanup_error) {
        result.warnings.push_back(cleanup_error->what());
    }

    spdlog::info("✓ Execution complete: exit code {} in {} ms",
                 result.exit_code, result.duration.count());

    return result;
}

} // namespace core
} // namespace sandexec
