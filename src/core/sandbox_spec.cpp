/**
 * @file sandbox_spec.cpp
 * @brief Hardened spec construction and verification
 *
 * @date 2025
 */

#include "sandexec/core/sandbox_spec.hpp"
#include "sandexec/utils/string_utils.hpp"

#include <algorithm>
#include <stdexcept>

namespace sandexec {
namespace core {

namespace {

constexpr std::int64_t kMiB = 1024 * 1024;

bool HasValue(const std::vector<std::string>& values, const std::string& wanted) {
    return std::find(values.begin(), values.end(), wanted) != values.end();
}

} // anonymous namespace

std::string TmpfsOptions(std::int64_t size_bytes) {
    std::string size = (size_bytes % kMiB == 0)
        ? std::to_string(size_bytes / kMiB) + "m"
        : std::to_string(size_bytes);
    return "size=" + size + ",noexec,nosuid";
}

SandboxSpec BuildHardenedSpec(const std::string& image,
                              const std::vector<std::string>& command,
                              const ResourceLimits& limits) {
    if (limits.memory_limit_bytes <= 0 || limits.cpu_nanos <= 0 ||
        limits.pids_limit <= 0 || limits.tmpfs_size_bytes <= 0) {
        throw std::invalid_argument("Resource limits must be positive");
    }

    SandboxSpec spec;
    spec.image = image;
    spec.command = command;

    spec.memory_limit_bytes = limits.memory_limit_bytes;
    spec.memory_swap_bytes = limits.memory_limit_bytes;
    spec.cpu_nanos = limits.cpu_nanos;
    spec.pids_limit = limits.pids_limit;

    spec.network_disabled = true;
    spec.network_mode = "none";
    spec.readonly_rootfs = true;
    spec.tmpfs_mounts[kScratchPath] = TmpfsOptions(limits.tmpfs_size_bytes);
    spec.cap_drop = {"ALL"};
    spec.security_opt = {"no-new-privileges"};
    spec.privileged = false;
    spec.auto_remove = false;
    spec.binds.clear();

    spec.labels[kManagedLabel] = "true";

    return spec;
}

std::vector<std::string> CheckSecurityIssues(const SandboxSpec& spec) {
    std::vector<std::string> issues;

    if (!spec.network_disabled) {
        issues.push_back("network is not disabled in container config");
    }
    if (spec.network_mode != "none") {
        issues.push_back("network mode is '" + spec.network_mode + "', expected 'none'");
    }
    if (spec.memory_limit_bytes <= 0) {
        issues.push_back("memory limit is not set");
    }
    if (spec.memory_swap_bytes != spec.memory_limit_bytes) {
        issues.push_back("memory swap differs from memory limit");
    }
    if (spec.cpu_nanos <= 0) {
        issues.push_back("CPU quota is not set");
    }
    if (spec.pids_limit <= 0) {
        issues.push_back("pids limit is not set");
    }
    if (!spec.readonly_rootfs) {
        issues.push_back("root filesystem is writable");
    }
    if (!HasValue(spec.cap_drop, "ALL")) {
        issues.push_back("capabilities are not all dropped");
    }
    if (!HasValue(spec.security_opt, "no-new-privileges")) {
        issues.push_back("privilege escalation is not disabled");
    }
    if (spec.privileged) {
        issues.push_back("container is privileged");
    }
    if (spec.auto_remove) {
        issues.push_back("auto-remove is enabled");
    }
    if (!spec.binds.empty()) {
        issues.push_back("host bind mounts are present");
    }

    for (const auto& [path, options] : spec.tmpfs_mounts) {
        auto flags = utils::StringUtils::Split(options, ',');
        if (!HasValue(flags, "noexec") || !HasValue(flags, "nosuid")) {
            issues.push_back("tmpfs " + path + " lacks noexec/nosuid");
        }
        bool sized = std::any_of(flags.begin(), flags.end(), [](const std::string& flag) {
            return utils::StringUtils::StartsWith(flag, "size=");
        });
        if (!sized) {
            issues.push_back("tmpfs " + path + " has no size cap");
        }
    }

    return issues;
}

} // namespace core
} // namespace sandexec
