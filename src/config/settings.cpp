/**
 * @file settings.cpp
 * @brief Settings loading and validation
 *
 * @date 2025
 */

#include "sandexec/config/settings.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <fstream>
#include <set>
#include <stdexcept>

namespace sandexec {
namespace config {

using json = nlohmann::json;

namespace {

constexpr std::int64_t kBytesPerMiB = 1024 * 1024;

// The engine rejects memory limits below 6 MiB
constexpr std::int64_t kMinMemoryMb = 6;

// The encoded program travels as a single exec argument inside the
// container, and Linux caps one argument at 128 KiB (MAX_ARG_STRLEN).
// Base64 inflates by 4/3.
constexpr std::size_t kMaxCodeBytesCeiling = 96 * 1024 - 1024;

const std::set<std::string> kKnownKeys = {
    "default_timeout_seconds", "max_timeout_seconds", "cleanup_timeout_seconds",
    "memory_limit_mb", "cpu_limit", "pids_limit", "tmpfs_size_mb", "max_code_bytes",
    "docker_socket", "curl_binary", "api_version", "log_level",
};

const std::set<std::string> kLogLevels = {
    "trace", "debug", "info", "warn", "error", "critical", "off",
};

template <typename T>
void ReadInteger(const json& document, const char* key, T& target) {
    if (!document.contains(key)) {
        return;
    }
    const auto& value = document[key];
    if (!value.is_number_integer()) {
        throw std::invalid_argument(std::string("settings: '") + key + "' must be an integer");
    }
    target = value.get<T>();
}

void ReadNumber(const json& document, const char* key, double& target) {
    if (!document.contains(key)) {
        return;
    }
    const auto& value = document[key];
    if (!value.is_number()) {
        throw std::invalid_argument(std::string("settings: '") + key + "' must be a number");
    }
    target = value.get<double>();
}

void ReadString(const json& document, const char* key, std::string& target) {
    if (!document.contains(key)) {
        return;
    }
    const auto& value = document[key];
    if (!value.is_string()) {
        throw std::invalid_argument(std::string("settings: '") + key + "' must be a string");
    }
    target = value.get<std::string>();
}

} // anonymous namespace

Settings Settings::FromJson(const json& document) {
    if (!document.is_object()) {
        throw std::invalid_argument("settings: document must be a JSON object");
    }

    for (const auto& item : document.items()) {
        if (kKnownKeys.count(item.key()) == 0) {
            throw std::invalid_argument("settings: unknown key '" + item.key() + "'");
        }
    }

    Settings settings;
    ReadInteger(document, "default_timeout_seconds", settings.default_timeout_seconds);
    ReadInteger(document, "max_timeout_seconds", settings.max_timeout_seconds);
    ReadInteger(document, "cleanup_timeout_seconds", settings.cleanup_timeout_seconds);
    ReadInteger(document, "memory_limit_mb", settings.memory_limit_mb);
    ReadNumber(document, "cpu_limit", settings.cpu_limit);
    ReadInteger(document, "pids_limit", settings.pids_limit);
    ReadInteger(document, "tmpfs_size_mb", settings.tmpfs_size_mb);
    ReadInteger(document, "max_code_bytes", settings.max_code_bytes);
    ReadString(document, "docker_socket", settings.docker_socket);
    ReadString(document, "curl_binary", settings.curl_binary);
    ReadString(document, "api_version", settings.api_version);
    ReadString(document, "log_level", settings.log_level);
    return settings;
}

Settings Settings::LoadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open settings file: " + path.string());
    }

    json document;
    try {
        file >> document;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Invalid settings file " + path.string() + ": " + e.what());
    }

    spdlog::debug("Loaded settings from {}", path.string());
    return FromJson(document);
}

json Settings::ToJson() const {
    json out = {
        {"default_timeout_seconds", default_timeout_seconds},
        {"max_timeout_seconds", max_timeout_seconds},
        {"cleanup_timeout_seconds", cleanup_timeout_seconds},
        {"memory_limit_mb", memory_limit_mb},
        {"cpu_limit", cpu_limit},
        {"pids_limit", pids_limit},
        {"tmpfs_size_mb", tmpfs_size_mb},
        {"max_code_bytes", max_code_bytes},
        {"docker_socket", docker_socket},
        {"curl_binary", curl_binary},
        {"log_level", log_level},
    };
    if (!api_version.empty()) {
        out["api_version"] = api_version;
    }
    return out;
}

std::vector<std::string> Settings::Validate() const {
    std::vector<std::string> problems;

    if (max_timeout_seconds < 1) {
        problems.push_back("max_timeout_seconds must be at least 1");
    }
    if (default_timeout_seconds < 1 || default_timeout_seconds > max_timeout_seconds) {
        problems.push_back("default_timeout_seconds must be between 1 and max_timeout_seconds");
    }
    if (cleanup_timeout_seconds < 1) {
        problems.push_back("cleanup_timeout_seconds must be at least 1");
    }
    if (memory_limit_mb < kMinMemoryMb) {
        problems.push_back("memory_limit_mb must be at least " + std::to_string(kMinMemoryMb));
    }
    if (!(cpu_limit > 0.0) || !std::isfinite(cpu_limit)) {
        problems.push_back("cpu_limit must be a positive number");
    }
    if (pids_limit < 1) {
        problems.push_back("pids_limit must be at least 1");
    }
    if (tmpfs_size_mb < 1) {
        problems.push_back("tmpfs_size_mb must be at least 1");
    }
    if (max_code_bytes < 1 || max_code_bytes > kMaxCodeBytesCeiling) {
        problems.push_back("max_code_bytes must be between 1 and " +
                           std::to_string(kMaxCodeBytesCeiling));
    }
    if (docker_socket.empty()) {
        problems.push_back("docker_socket must not be empty");
    }
    if (curl_binary.empty()) {
        problems.push_back("curl_binary must not be empty");
    }
    if (kLogLevels.count(log_level) == 0) {
        problems.push_back("log_level '" + log_level + "' is not a valid level");
    }

    return problems;
}

core::ExecutorConfig Settings::ToExecutorConfig() const {
    core::ExecutorConfig config;
    config.limits.memory_limit_bytes = memory_limit_mb * kBytesPerMiB;
    config.limits.cpu_nanos = static_cast<std::int64_t>(std::llround(cpu_limit * 1e9));
    config.limits.pids_limit = pids_limit;
    config.limits.tmpfs_size_bytes = tmpfs_size_mb * kBytesPerMiB;
    config.default_timeout = std::chrono::seconds(default_timeout_seconds);
    config.cleanup_timeout = std::chrono::seconds(cleanup_timeout_seconds);
    config.max_code_bytes = max_code_bytes;
    return config;
}

} // namespace config
} // namespace sandexec
