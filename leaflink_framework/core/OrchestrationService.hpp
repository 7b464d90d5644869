#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "api/IDeviceApi.hpp"
#include "config/SessionStore.hpp"
#include "core/DeviceSession.hpp"
#include "core/ServiceResult.hpp"
#include "net/IDeviceScanner.hpp"
#include "utils/CancellationToken.hpp"

/**
 * @brief 编排服务 - 每个用户操作对应一个方法
 *
 * 负责前置条件检查、调用扫描器/设备API/会话存储、维护 DeviceSession，
 * 并把下层抛出的 LeafError 转换为 ServiceResult。所有公开方法都不抛异常。
 * 单线程使用。
 */
class OrchestrationService {
public:
    static constexpr int kMinBrightness = 0;
    static constexpr int kMaxBrightness = 100;

    /**
     * @param scanTimeout 单次扫描的截止时间（作为调用方令牌的子令牌）
     * @throws LeafError(PRECONDITION) 任一依赖为空
     */
    OrchestrationService(std::shared_ptr<IDeviceApi> api,
                         std::shared_ptr<IDeviceScanner> scanner,
                         std::shared_ptr<ISessionStore> store,
                         std::chrono::milliseconds scanTimeout = std::chrono::milliseconds(10000));

    /**
     * @brief 扫描局域网，把第一个（主机号最小的）设备地址设置到会话
     * 数据：AddressList
     */
    ServiceResult scan(const CancellationToken& ctx);

    /**
     * @brief 与指定地址配对，成功后提交凭据并尽力持久化
     * 持久化失败不影响配对结果，只在消息中附加警告。数据：Credential
     */
    ServiceResult pair(const CancellationToken& ctx, const std::string& address);

    /**
     * @brief 与会话中的地址配对
     */
    ServiceResult pair(const CancellationToken& ctx);

    ServiceResult setPower(const CancellationToken& ctx, const std::string& address,
                           const std::string& credential, bool on);
    ServiceResult setPower(const CancellationToken& ctx, bool on);

    /**
     * @brief 设置亮度，level 不在 [0,100] 时本地失败，不发起网络请求
     */
    ServiceResult setBrightness(const CancellationToken& ctx, const std::string& address,
                                const std::string& credential, int level);
    ServiceResult setBrightness(const CancellationToken& ctx, int level);

    /**
     * @brief 数据：DeviceInfo
     */
    ServiceResult getInfo(const CancellationToken& ctx, const std::string& address, const std::string& credential);
    ServiceResult getInfo(const CancellationToken& ctx);

    /**
     * @brief 获取设备上的灯效列表；目标为会话设备时更新灯效缓存。数据：EffectList
     */
    ServiceResult listEffects(const CancellationToken& ctx, const std::string& address, const std::string& credential);
    ServiceResult listEffects(const CancellationToken& ctx);

    /**
     * @brief 选择灯效；已缓存该设备的灯效列表时，名称必须在列表中
     */
    ServiceResult setEffect(const CancellationToken& ctx, const std::string& address,
                            const std::string& credential, const std::string& effect);
    ServiceResult setEffect(const CancellationToken& ctx, const std::string& effect);

    /**
     * @brief 从会话存储恢复会话。数据：DeviceConfig
     */
    ServiceResult loadConfiguration();

    /**
     * @brief 可达性探测：调用 getInfo 并记录到会话的 ready 标志
     * 成功时顺带刷新灯效缓存（失败只记日志）。数据：DeviceInfo
     */
    ServiceResult checkReadiness(const CancellationToken& ctx);

    /**
     * @brief 清空内存中的会话和灯效缓存，不修改持久化记录
     */
    ServiceResult disconnect();

    const DeviceSession& getSession() const { return session_; }
    DeviceSession& getSession() { return session_; }

    const std::vector<std::string>& getCachedEffects() const { return cachedEffects_; }

private:
    bool hasPairing(const std::string& address, const std::string& credential) const {
        return !address.empty() && !credential.empty();
    }

    void cacheEffects(const std::string& address, std::vector<std::string> effects);
    void clearEffectCache();

    template<typename Body>
    ServiceResult runGuarded(const std::string& failurePrefix, Body&& body);

    std::shared_ptr<IDeviceApi> api_;
    std::shared_ptr<IDeviceScanner> scanner_;
    std::shared_ptr<ISessionStore> store_;
    std::chrono::milliseconds scanTimeout_;

    DeviceSession session_;

    // 灯效缓存只对应一个设备地址
    std::string cachedEffectsAddress_;
    std::vector<std::string> cachedEffects_;
};
