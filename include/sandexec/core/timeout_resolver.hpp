/**
 * @file timeout_resolver.hpp
 * @brief Normalization of caller-supplied execution timeouts
 *
 * @date 2025
 */

#pragma once

#include <chrono>

namespace sandexec {
namespace core {

/**
 * @class TimeoutResolver
 * @brief Maps a requested timeout in seconds onto an effective duration
 *
 * Zero and negative requests select the default; positive requests are
 * honored exactly. Resolve() never fails.
 */
class TimeoutResolver {
public:
    static constexpr std::chrono::seconds kDefaultTimeout{10};

    /**
     * @param default_timeout Duration used for non-positive requests
     * @throws std::invalid_argument if default_timeout is not positive
     */
    explicit TimeoutResolver(std::chrono::seconds default_timeout = kDefaultTimeout);

    std::chrono::seconds Resolve(int requested_seconds) const;

    std::chrono::seconds DefaultTimeout() const { return default_timeout_; }

private:
    std::chrono::seconds default_timeout_;
};

} // namespace core
} // namespace sandexec
