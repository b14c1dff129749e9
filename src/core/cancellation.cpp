/**
 * @file cancellation.cpp
 * @brief Implementation of linked cancellation sources and tokens
 *
 * Each source owns a shared state guarded by a mutex and a condition
 * variable. Children register a weak reference with their parent so that a
 * parent Cancel() propagates downwards and wakes every waiter. Deadlines are
 * not events: they are evaluated lazily against the steady clock and bound
 * the condition-variable waits.
 *
 * @date 2025
 */

#include "sandexec/core/cancellation.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

namespace sandexec {
namespace core {

namespace detail {

struct CancellationState {
    mutable std::mutex mutex;
    std::condition_variable cv;
    bool cancelled{false};
    CancelReason reason{CancelReason::NONE};
    std::optional<CancellationToken::Clock::time_point> deadline;
    std::vector<std::weak_ptr<CancellationState>> children;
};

} // namespace detail

namespace {

using detail::CancellationState;
using Clock = CancellationToken::Clock;

void CancelState(const std::shared_ptr<CancellationState>& state, CancelReason reason) {
    std::vector<std::weak_ptr<CancellationState>> children;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->cancelled) {
            return;
        }
        state->cancelled = true;
        state->reason = reason;
        children.swap(state->children);
    }
    state->cv.notify_all();

    for (const auto& weak_child : children) {
        if (auto child = weak_child.lock()) {
            CancelState(child, reason);
        }
    }
}

CancelReason ReasonOf(const CancellationState& state) {
    std::lock_guard<std::mutex> lock(state.mutex);
    if (state.cancelled) {
        return state.reason;
    }
    if (state.deadline && Clock::now() >= *state.deadline) {
        return CancelReason::DEADLINE_EXCEEDED;
    }
    return CancelReason::NONE;
}

std::shared_ptr<CancellationState> MakeChildState(
    const std::shared_ptr<CancellationState>& parent,
    std::optional<Clock::time_point> deadline) {

    auto child = std::make_shared<CancellationState>();
    child->deadline = deadline;

    if (!parent) {
        return child;
    }

    std::unique_lock<std::mutex> lock(parent->mutex);

    // Inherit the tighter of the two deadlines
    if (parent->deadline && (!child->deadline || *parent->deadline < *child->deadline)) {
        child->deadline = parent->deadline;
    }

    if (parent->cancelled) {
        CancelReason reason = parent->reason;
        lock.unlock();
        CancelState(child, reason);
        return child;
    }

    // Drop registrations of children that no longer exist
    auto& siblings = parent->children;
    siblings.erase(std::remove_if(siblings.begin(), siblings.end(),
                                  [](const std::weak_ptr<CancellationState>& w) {
                                      return w.expired();
                                  }),
                   siblings.end());
    siblings.push_back(child);

    return child;
}

} // anonymous namespace

// ============================================================================
// CancellationToken
// ============================================================================

bool CancellationToken::IsCancelled() const {
    return Reason() != CancelReason::NONE;
}

CancelReason CancellationToken::Reason() const {
    if (!state_) {
        return CancelReason::NONE;
    }
    return ReasonOf(*state_);
}

bool CancellationToken::WaitFor(std::chrono::milliseconds duration) const {
    if (!state_) {
        std::this_thread::sleep_for(duration);
        return false;
    }

    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        auto wake_at = Clock::now() + duration;
        if (state_->deadline && *state_->deadline < wake_at) {
            wake_at = *state_->deadline;
        }
        state_->cv.wait_until(lock, wake_at, [this] { return state_->cancelled; });
    }

    return IsCancelled();
}

std::optional<CancellationToken::Clock::time_point> CancellationToken::Deadline() const {
    if (!state_) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->deadline;
}

// ============================================================================
// CancellationSource
// ============================================================================

CancellationSource::CancellationSource()
    : state_(std::make_shared<CancellationState>()) {}

CancellationSource::CancellationSource(const CancellationToken& parent)
    : state_(MakeChildState(parent.state_, std::nullopt)) {}

CancellationSource::CancellationSource(const CancellationToken& parent,
                                       std::chrono::steady_clock::duration timeout)
    : state_(MakeChildState(parent.state_, Clock::now() + timeout)) {}

CancellationSource CancellationSource::WithTimeout(std::chrono::steady_clock::duration timeout) {
    return CancellationSource(CancellationToken(), timeout);
}

void CancellationSource::Cancel() {
    CancelState(state_, CancelReason::CANCELLED);
}

CancellationToken CancellationSource::Token() const {
    return CancellationToken(state_);
}

} // namespace core
} // namespace sandexec
