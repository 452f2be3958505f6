#include "system/cancel_token.hpp"

namespace genup {

const char* ToString(CancelReason reason) {
    switch (reason) {
        case CancelReason::None:      return "none";
        case CancelReason::Cancelled: return "cancelled";
        case CancelReason::TimedOut:  return "timed out";
    }
    return "unknown";
}

CancelToken::CancelToken() : state_(std::make_shared<State>()) {}

CancelToken CancelToken::LinkedTo(const std::atomic_bool* flag) {
    auto state = std::make_shared<State>();
    state->flag = flag;
    return CancelToken(std::move(state));
}

CancelToken CancelToken::WithDeadline(Clock::time_point deadline) const {
    auto state = std::make_shared<State>();
    state->deadline = deadline;
    state->parent = state_;
    return CancelToken(std::move(state));
}

CancelToken CancelToken::WithTimeout(std::chrono::milliseconds timeout) const {
    return WithDeadline(Clock::now() + timeout);
}

CancelToken CancelToken::Child() const {
    auto state = std::make_shared<State>();
    state->parent = state_;
    return CancelToken(std::move(state));
}

void CancelToken::Cancel() const {
    state_->cancelled.store(true, std::memory_order_relaxed);
}

CancelReason CancelToken::Reason() const {
    const auto now = Clock::now();
    bool timed_out = false;
    for (const State* s = state_.get(); s != nullptr; s = s->parent.get()) {
        if (s->cancelled.load(std::memory_order_relaxed))
            return CancelReason::Cancelled;
        if (s->flag && s->flag->load(std::memory_order_relaxed))
            return CancelReason::Cancelled;
        if (s->deadline && now >= *s->deadline)
            timed_out = true;
    }
    return timed_out ? CancelReason::TimedOut : CancelReason::None;
}

std::optional<CancelToken::Clock::time_point> CancelToken::Deadline() const {
    std::optional<Clock::time_point> earliest;
    for (const State* s = state_.get(); s != nullptr; s = s->parent.get()) {
        if (s->deadline && (!earliest || *s->deadline < *earliest))
            earliest = s->deadline;
    }
    return earliest;
}

} // namespace genup
