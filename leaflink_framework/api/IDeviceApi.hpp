#pragma once

#include <map>
#include <string>
#include <vector>
#include "utils/CancellationToken.hpp"

// 设备属性，嵌套对象展开为点分键，如 state.on.value
using DeviceInfo = std::map<std::string, std::string>;

/**
 * @brief 灯板设备API接口
 *
 * 所有调用失败时抛出 LeafError（TRANSPORT / CANCELLED）。
 * 除 pair 外，对调用方而言都是幂等的。
 */
class IDeviceApi {
public:
    virtual ~IDeviceApi() = default;

    /**
     * @brief 请求设备签发新的认证令牌（设备需处于配对模式）
     * @return 认证令牌
     */
    virtual std::string pair(const std::string& address, const CancellationToken& token) = 0;

    virtual DeviceInfo getInfo(const std::string& address, const std::string& credential,
                               const CancellationToken& token) = 0;

    virtual void setPower(const std::string& address, const std::string& credential, bool on,
                          const CancellationToken& token) = 0;

    /**
     * @param level 亮度 0..100，由调用方保证范围
     */
    virtual void setBrightness(const std::string& address, const std::string& credential, int level,
                               const CancellationToken& token) = 0;

    virtual std::vector<std::string> listEffects(const std::string& address, const std::string& credential,
                                                 const CancellationToken& token) = 0;

    virtual void setEffect(const std::string& address, const std::string& credential, const std::string& effect,
                           const CancellationToken& token) = 0;
};
