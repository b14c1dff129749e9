/**
 * @file errors.hpp
 * @brief Failure taxonomy of the sandbox execution engine
 *
 * Distinguishes caller mistakes (InputError) from failures of the execution
 * machinery (InfrastructureError) and from container removal failures
 * (CleanupError). A guest program that exits with a non-zero status is NOT
 * represented here: its exit code is returned as data in ExecutionResult.
 *
 * Container runtime adapters report their own failures with
 * ContainerRuntimeError (or OperationCancelledError when a cancellation
 * token fired); the executor maps those onto the taxonomy above.
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace sandexec {
namespace core {

/**
 * @enum ErrorKind
 * @brief Top-level classification of an engine error
 */
enum class ErrorKind {
    INPUT,           ///< Malformed or unsupported request, no side effects
    INFRASTRUCTURE,  ///< Image, container lifecycle or engine communication failure
    CLEANUP          ///< Container removal failed
};

/**
 * @enum InputErrorCode
 * @brief Reason an execution request was rejected
 */
enum class InputErrorCode {
    MALFORMED_PAYLOAD,     ///< Not valid JSON / wrong shape
    SCHEMA_VIOLATION,      ///< Failed schema validation
    MISSING_FIELD,         ///< Required field absent
    EMPTY_CODE,            ///< Code is empty
    CODE_TOO_LARGE,        ///< Code exceeds the configured size ceiling
    UNSUPPORTED_LANGUAGE   ///< Language not present in the catalog
};

/**
 * @enum ExecutionStage
 * @brief Lifecycle states of one sandboxed execution, in strict order
 */
enum class ExecutionStage {
    RESOLVE,           ///< Validate input, resolve language, build command
    ENSURE_IMAGE,      ///< Pull image if absent
    CREATE_CONTAINER,  ///< Submit hardened spec, obtain handle
    START_CONTAINER,   ///< Begin execution
    WAIT_FOR_EXIT,     ///< Block until exit, timeout or cancellation
    COLLECT_LOGS,      ///< Fetch combined output (best effort)
    REMOVE_CONTAINER   ///< Force-remove container and anonymous volumes
};

std::string ToString(ErrorKind kind);
std::string ToString(InputErrorCode code);
std::string ToString(ExecutionStage stage);

/**
 * @class SandboxError
 * @brief Base class of every error surfaced by the engine
 */
class SandboxError : public std::runtime_error {
public:
    SandboxError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * @class InputError
 * @brief Request rejected before any container interaction
 */
class InputError : public SandboxError {
public:
    InputError(InputErrorCode code, const std::string& message)
        : SandboxError(ErrorKind::INPUT, message), code_(code) {}

    InputErrorCode code() const noexcept { return code_; }

private:
    InputErrorCode code_;
};

/**
 * @class InfrastructureError
 * @brief Execution machinery failed to produce a result
 *
 * Carries the lifecycle stage that failed, whether the failure was caused by
 * timeout or caller cancellation, and whatever guest output could still be
 * collected before the container was removed.
 */
class InfrastructureError : public SandboxError {
public:
    InfrastructureError(ExecutionStage stage,
                        const std::string& message,
                        bool cancelled = false,
                        std::string partial_output = {})
        : SandboxError(ErrorKind::INFRASTRUCTURE, message)
        , stage_(stage)
        , cancelled_(cancelled)
        , partial_output_(std::move(partial_output)) {}

    ExecutionStage stage() const noexcept { return stage_; }
    bool cancelled() const noexcept { return cancelled_; }
    const std::string& partial_output() const noexcept { return partial_output_; }

private:
    ExecutionStage stage_;
    bool cancelled_;
    std::string partial_output_;
};

/**
 * @class CleanupError
 * @brief Container removal failed
 */
class CleanupError : public SandboxError {
public:
    CleanupError(std::string container_id, const std::string& message)
        : SandboxError(ErrorKind::CLEANUP, message)
        , container_id_(std::move(container_id)) {}

    const std::string& container_id() const noexcept { return container_id_; }

private:
    std::string container_id_;
};

/**
 * @class ContainerRuntimeError
 * @brief Failure reported by a ContainerRuntime implementation
 */
class ContainerRuntimeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class OperationCancelledError
 * @brief A runtime operation was interrupted by its cancellation token
 */
class OperationCancelledError : public ContainerRuntimeError {
public:
    OperationCancelledError(const std::string& message, bool deadline_exceeded)
        : ContainerRuntimeError(message), deadline_exceeded_(deadline_exceeded) {}

    /// True when the token's deadline elapsed, false for explicit cancellation
    bool deadline_exceeded() const noexcept { return deadline_exceeded_; }

private:
    bool deadline_exceeded_;
};

} // namespace core
} // namespace sandexec
