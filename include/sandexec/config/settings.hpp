/**
 * @file settings.hpp
 * @brief Operator configuration of the sandbox engine
 *
 * Settings are loaded from an optional JSON file and then overridden by
 * command-line options. Every key is optional; unknown keys are rejected so
 * that a typo cannot silently fall back to a default.
 *
 * ```json
 * {
 *   "default_timeout_seconds": 10,
 *   "max_timeout_seconds": 30,
 *   "memory_limit_mb": 64,
 *   "cpu_limit": 0.5,
 *   "pids_limit": 64,
 *   "tmpfs_size_mb": 16,
 *   "docker_socket": "/var/run/docker.sock",
 *   "curl_binary": "curl",
 *   "cleanup_timeout_seconds": 30,
 *   "log_level": "info"
 * }
 * ```
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "sandexec/core/sandbox_executor.hpp"

namespace sandexec {
namespace config {

/**
 * @struct Settings
 * @brief All operator-tunable values with their defaults
 */
struct Settings {
    // Timeouts
    int default_timeout_seconds{10};       ///< Used when a request names no timeout
    int max_timeout_seconds{30};           ///< Largest timeout a request may ask for
    int cleanup_timeout_seconds{30};       ///< Bound on log collection and removal

    // Resource ceilings
    std::int64_t memory_limit_mb{64};      ///< Memory (and memory+swap) ceiling
    double cpu_limit{0.5};                 ///< CPUs (0.5 = half a core)
    std::int64_t pids_limit{64};           ///< Process-count ceiling
    std::int64_t tmpfs_size_mb{16};        ///< Size of the writable /tmp
    std::size_t max_code_bytes{64 * 1024}; ///< Largest accepted guest source

    // Engine access
    std::string docker_socket{"/var/run/docker.sock"};  ///< Engine API socket
    std::string curl_binary{"curl"};                    ///< curl used as transport
    std::string api_version;                            ///< e.g. "v1.43"; empty = engine default

    // Logging
    std::string log_level{"info"};         ///< trace, debug, info, warn, error, critical, off

    /**
     * @brief Build settings from a JSON object
     * @throws std::invalid_argument on unknown keys or wrongly typed values
     */
    static Settings FromJson(const nlohmann::json& document);

    /**
     * @brief Load settings from a JSON file
     * @throws std::runtime_error if the file cannot be read or parsed
     * @throws std::invalid_argument on unknown keys or wrongly typed values
     */
    static Settings LoadFromFile(const std::filesystem::path& path);

    nlohmann::json ToJson() const;

    /// Problems that make the settings unusable (empty when valid)
    std::vector<std::string> Validate() const;

    /// Executor configuration derived from these settings
    core::ExecutorConfig ToExecutorConfig() const;
};

} // namespace config
} // namespace sandexec
