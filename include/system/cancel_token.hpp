#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace genup {

enum class CancelReason {
    None,
    Cancelled,
    TimedOut,
};

const char* ToString(CancelReason reason);

// Copyable handle to a shared cancellation state. A token reports cancelled when
// Cancel() was called on it or on any ancestor, when a linked flag is set, or
// when its own or an ancestor's deadline has passed.
class CancelToken {
public:
    using Clock = std::chrono::steady_clock;

    CancelToken();

    // Token that also trips when `*flag` becomes true (e.g. g_cancel).
    static CancelToken LinkedTo(const std::atomic_bool* flag);

    // Child token; cancelling the child leaves this token untouched.
    CancelToken WithDeadline(Clock::time_point deadline) const;
    CancelToken WithTimeout(std::chrono::milliseconds timeout) const;
    CancelToken Child() const;

    void Cancel() const;

    bool IsCancelled() const { return Reason() != CancelReason::None; }
    CancelReason Reason() const;

    // Earliest deadline along the chain, if any.
    std::optional<Clock::time_point> Deadline() const;

private:
    struct State {
        std::atomic_bool cancelled{false};
        std::optional<Clock::time_point> deadline;
        const std::atomic_bool* flag = nullptr;
        std::shared_ptr<const State> parent;
    };

    explicit CancelToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

} // namespace genup
