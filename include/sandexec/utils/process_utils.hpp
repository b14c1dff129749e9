/**
 * @file process_utils.hpp
 * @brief Cancellable subprocess execution without a shell
 *
 * Commands are passed as argv and started with fork/execvp, so no argument
 * is ever interpreted by a shell. Standard input can be fed from memory;
 * standard output and standard error are captured separately.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "sandexec/core/cancellation.hpp"

namespace sandexec {
namespace utils {

/**
 * @struct ProcessResult
 * @brief Outcome of a finished subprocess
 */
struct ProcessResult {
    int exit_code{-1};                      ///< Exit status, 128 + signal if killed by a signal
    std::string stdout_output;              ///< Captured standard output
    std::string stderr_output;              ///< Captured standard error
    std::chrono::milliseconds duration{0};  ///< Wall time
    bool success{false};                    ///< exit_code == 0
};

/**
 * @struct ProcessOptions
 * @brief Optional subprocess inputs
 */
struct ProcessOptions {
    std::string stdin_data;  ///< Written to the child's stdin, which is then closed
};

/**
 * @class ProcessError
 * @brief The subprocess could not be started or supervised
 */
class ProcessError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class ProcessRunner
 * @brief Runs argv-style commands and captures their output
 *
 * **Cancellation**: the token is polled while the child runs. When it
 * fires, the child is killed with SIGKILL, reaped, and
 * core::OperationCancelledError is thrown.
 *
 * **Usage Example**:
 * @code
 * core::CancellationSource source;
 * auto result = ProcessRunner::Run({"curl", "--version"}, source.Token());
 * if (result.success) {
 *     spdlog::info("{}", result.stdout_output);
 * }
 * @endcode
 */
class ProcessRunner {
public:
    /**
     * @brief Run a command to completion
     * @param argv Program and arguments (argv[0] is looked up in PATH)
     * @param token Cancellation token
     * @param options Standard input data
     * @return Exit status and captured output
     *
     * @throws ProcessError if argv is empty or the program cannot be started
     * @throws core::OperationCancelledError if the token fired
     */
    static ProcessResult Run(const std::vector<std::string>& argv,
                             const core::CancellationToken& token,
                             const ProcessOptions& options = ProcessOptions{});

    /// True if argv[0] of a command can be found in PATH (or is an executable path)
    static bool IsExecutableAvailable(const std::string& program);
};

} // namespace utils
} // namespace sandexec
