/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation for blocking sandbox operations
 *
 * A CancellationSource owns the right to cancel; the CancellationTokens it
 * hands out only observe. Sources may be linked to a parent token and may
 * carry a deadline, so the executor can derive a "caller cancel OR timeout"
 * token for the wait step while cleanup uses an unrelated token that the
 * caller cannot cancel.
 *
 * **Usage Example**:
 * @code
 * CancellationSource caller;
 * CancellationSource wait_scope(caller.Token(), std::chrono::seconds(10));
 *
 * auto token = wait_scope.Token();
 * while (!token.IsCancelled()) {
 *     if (PollOnce()) break;
 *     token.WaitFor(std::chrono::milliseconds(50));
 * }
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <utility>

namespace sandexec {
namespace core {

/**
 * @enum CancelReason
 * @brief Why a token reports cancellation
 */
enum class CancelReason {
    NONE,               ///< Not cancelled
    CANCELLED,          ///< CancellationSource::Cancel() was called (here or on a parent)
    DEADLINE_EXCEEDED   ///< Deadline elapsed
};

namespace detail {
struct CancellationState;
}

/**
 * @class CancellationToken
 * @brief Read-only view of a cancellation state
 *
 * A default-constructed token is never cancelled. Tokens are cheap to copy
 * and safe to share between threads.
 */
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() = default;

    bool IsCancelled() const;
    CancelReason Reason() const;

    /**
     * @brief Block until cancelled or until the duration elapses
     * @param duration Maximum time to block
     * @return true if the token is cancelled on return
     */
    bool WaitFor(std::chrono::milliseconds duration) const;

    /// Effective deadline (inherited from parents), if any
    std::optional<Clock::time_point> Deadline() const;

private:
    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

/**
 * @class CancellationSource
 * @brief Owner of a cancellation state
 *
 * Destroying a source does not cancel its tokens.
 */
class CancellationSource {
public:
    CancellationSource();

    /// Child source: cancelled whenever the parent is
    explicit CancellationSource(const CancellationToken& parent);

    /// Child source with a deadline `timeout` from now
    CancellationSource(const CancellationToken& parent,
                       std::chrono::steady_clock::duration timeout);

    /// Root source with a deadline
    static CancellationSource WithTimeout(std::chrono::steady_clock::duration timeout);

    /// Cancel this source and every source linked below it. Idempotent.
    void Cancel();

    CancellationToken Token() const;

private:
    std::shared_ptr<detail::CancellationState> state_;
};

} // namespace core
} // namespace sandexec
