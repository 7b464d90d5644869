#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

/**
 * @brief 取消令牌 - 显式取消或截止时间到达后进入已取消状态
 *
 * 令牌是值语义的句柄，拷贝共享同一个状态。
 * 子令牌（withTimeout）在父令牌取消时同样视为已取消，反之不成立。
 */
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief 取消原因
     */
    enum class Reason {
        NONE,
        CANCELLED,          // 显式调用 cancel()
        DEADLINE_EXCEEDED   // 截止时间已过
    };

    /**
     * @brief 创建一个没有截止时间的根令牌
     */
    CancellationToken();

    /**
     * @brief 创建一个在 timeout 后过期的根令牌
     */
    static CancellationToken withTimeout(std::chrono::milliseconds timeout);

    /**
     * @brief 派生子令牌：截止时间取 min(父截止时间, now + timeout)
     */
    CancellationToken childWithTimeout(std::chrono::milliseconds timeout) const;

    /**
     * @brief 显式取消，唤醒所有等待者
     */
    void cancel() const;

    bool isCancelled() const { return reason() != Reason::NONE; }

    Reason reason() const;

    /**
     * @brief 距离截止时间的剩余时长；没有截止时间时返回 fallback
     */
    std::chrono::milliseconds remaining(std::chrono::milliseconds fallback) const;

    /**
     * @brief 可中断的睡眠
     * @return 等待期间令牌被取消返回 true
     */
    bool waitFor(std::chrono::milliseconds duration) const;

    static const char* reasonText(Reason reason);

private:
    struct State {
        std::atomic<bool> cancelled{false};
        bool hasDeadline = false;
        Clock::time_point deadline;
        std::shared_ptr<State> parent;
        mutable std::mutex mutex;
        mutable std::condition_variable condition;
    };

    explicit CancellationToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

    static Reason reasonOf(const State& state, Clock::time_point now);
    static bool effectiveDeadline(const State& state, Clock::time_point& deadline);

    std::shared_ptr<State> state_;
};
