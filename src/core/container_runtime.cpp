/**
 * @file container_runtime.cpp
 * @brief Scoped container ownership
 *
 * @date 2025
 */

#include "sandexec/core/container_runtime.hpp"

#include <spdlog/spdlog.h>

namespace sandexec {
namespace core {

ScopedContainer::ScopedContainer(ContainerRuntime& runtime,
                                 ContainerHandle handle,
                                 std::chrono::seconds cleanup_timeout)
    : runtime_(runtime)
    , handle_(std::move(handle))
    , cleanup_timeout_(cleanup_timeout) {}

ScopedContainer::~ScopedContainer() {
    if (released_) {
        return;
    }

    auto failure = Release();
    if (failure) {
        spdlog::error("Container {} may be orphaned: {}", handle_.ShortId(), failure->what());
    }
}

std::optional<CleanupError> ScopedContainer::Release() {
    if (released_) {
        return std::nullopt;
    }
    released_ = true;

    auto cleanup = CancellationSource::WithTimeout(cleanup_timeout_);

    try {
        runtime_.RemoveContainer(handle_, cleanup.Token());
        spdlog::debug("✓ Container removed: {}", handle_.ShortId());
        return std::nullopt;

    } catch (const std::exception& e) {
        return CleanupError(handle_.Id(),
                            "failed to remove container " + handle_.ShortId() + ": " + e.what());
    }
}

} // namespace core
} // namespace sandexec
