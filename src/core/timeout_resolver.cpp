/**
 * @file timeout_resolver.cpp
 * @brief Implementation of timeout normalization
 *
 * @date 2025
 */

#include "sandexec/core/timeout_resolver.hpp"

#include <stdexcept>

namespace sandexec {
namespace core {

TimeoutResolver::TimeoutResolver(std::chrono::seconds default_timeout)
    : default_timeout_(default_timeout) {
    if (default_timeout_.count() <= 0) {
        throw std::invalid_argument("Default timeout must be positive");
    }
}

std::chrono::seconds TimeoutResolver::Resolve(int requested_seconds) const {
    if (requested_seconds <= 0) {
        return default_timeout_;
    }
    return std::chrono::seconds(requested_seconds);
}

} // namespace core
} // namespace sandexec
