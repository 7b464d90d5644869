#include "utils/CancellationToken.hpp"

#include <algorithm>

namespace {

// 等待时的最长单次睡眠，父令牌的取消不会唤醒子令牌的条件变量
constexpr std::chrono::milliseconds kPollSlice{20};

}  // namespace

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

CancellationToken CancellationToken::withTimeout(std::chrono::milliseconds timeout) {
    auto state = std::make_shared<State>();
    state->hasDeadline = true;
    state->deadline = Clock::now() + timeout;
    return CancellationToken(state);
}

CancellationToken CancellationToken::childWithTimeout(std::chrono::milliseconds timeout) const {
    auto state = std::make_shared<State>();
    state->parent = state_;
    state->hasDeadline = true;
    state->deadline = Clock::now() + timeout;

    Clock::time_point parentDeadline;
    if(effectiveDeadline(*state_, parentDeadline)) {
        state->deadline = std::min(state->deadline, parentDeadline);
    }
    return CancellationToken(state);
}

void CancellationToken::cancel() const {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled = true;
    }
    state_->condition.notify_all();
}

CancellationToken::Reason CancellationToken::reason() const {
    return reasonOf(*state_, Clock::now());
}

std::chrono::milliseconds CancellationToken::remaining(std::chrono::milliseconds fallback) const {
    Clock::time_point deadline;
    if(!effectiveDeadline(*state_, deadline)) {
        return fallback;
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return std::max(left, std::chrono::milliseconds(0));
}

bool CancellationToken::waitFor(std::chrono::milliseconds duration) const {
    auto until = Clock::now() + duration;
    std::unique_lock<std::mutex> lock(state_->mutex);
    while(true) {
        if(isCancelled()) {
            return true;
        }
        auto now = Clock::now();
        if(now >= until) {
            return false;
        }
        auto slice = std::min<Clock::duration>(until - now, kPollSlice);
        state_->condition.wait_for(lock, slice);
    }
}

const char* CancellationToken::reasonText(Reason reason) {
    switch(reason) {
        case Reason::CANCELLED:         return "operation cancelled";
        case Reason::DEADLINE_EXCEEDED: return "deadline exceeded";
        case Reason::NONE:
        default:                        return "not cancelled";
    }
}

CancellationToken::Reason CancellationToken::reasonOf(const State& state, Clock::time_point now) {
    if(state.cancelled) {
        return Reason::CANCELLED;
    }
    if(state.hasDeadline && now >= state.deadline) {
        return Reason::DEADLINE_EXCEEDED;
    }
    if(state.parent) {
        return reasonOf(*state.parent, now);
    }
    return Reason::NONE;
}

bool CancellationToken::effectiveDeadline(const State& state, Clock::time_point& deadline) {
    // 子令牌创建时已合并父截止时间，这里只在自身没有截止时间时向上查找
    if(state.hasDeadline) {
        deadline = state.deadline;
        return true;
    }
    if(state.parent) {
        return effectiveDeadline(*state.parent, deadline);
    }
    return false;
}
