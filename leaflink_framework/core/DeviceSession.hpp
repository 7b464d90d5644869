#pragma once

#include <functional>
#include <string>
#include "core/DeviceConfig.hpp"

/**
 * @brief 设备会话状态机
 *
 * UNCONFIGURED -> CONFIGURED(address) -> PAIRED(address, credential)
 *
 * ready 标志不是状态机的一部分：只有在设备API探测成功后才由编排层置位，
 * 任何状态迁移都会清除它（持久化的凭据可能已失效）。
 * 会话由编排层单线程访问，不加锁。
 */
class DeviceSession {
public:
    enum class SessionState {
        UNCONFIGURED,
        CONFIGURED,
        PAIRED
    };

    using StateCallback = std::function<void(SessionState oldState, SessionState newState)>;

    DeviceSession() = default;

    /**
     * @brief 设置目标地址，丢弃之前的凭据
     * 任意状态下有效；空地址回到 UNCONFIGURED
     */
    void setAddress(const std::string& address);

    /**
     * @brief 提交配对凭据
     * 仅在已有地址时有效，否则抛出 LeafError(PRECONDITION)
     */
    void commit(const std::string& credential);

    /**
     * @brief 用持久化的配置恢复会话（setAddress + commit）
     */
    void hydrate(const DeviceConfig& config);

    /**
     * @brief 回到 UNCONFIGURED
     */
    void clear();

    /**
     * @brief 记录最近一次可达性探测的结果
     */
    void markReady(bool ready);

    bool isReady() const { return ready_; }
    bool isPaired() const { return state_ == SessionState::PAIRED; }

    SessionState getState() const { return state_; }
    const DeviceConfig& getConfig() const { return config_; }
    const std::string& getAddress() const { return config_.address; }
    const std::string& getCredential() const { return config_.credential; }

    void setStateCallback(StateCallback callback) {
        stateCallback_ = std::move(callback);
    }

    static std::string getStateName(SessionState state);

private:
    void setState(SessionState newState);

    DeviceConfig config_;
    SessionState state_ = SessionState::UNCONFIGURED;
    bool ready_ = false;
    StateCallback stateCallback_;
};
