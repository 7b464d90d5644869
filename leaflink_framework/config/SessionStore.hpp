#pragma once

#include <string>
#include "core/DeviceConfig.hpp"

/**
 * @brief 会话持久化接口（设备地址 + 认证令牌）
 */
class ISessionStore {
public:
    virtual ~ISessionStore() = default;

    virtual bool exists() const = 0;

    /**
     * @throws LeafError(PERSISTENCE) 地址或令牌为空、写入失败
     */
    virtual void save(const std::string& address, const std::string& credential) = 0;

    /**
     * @throws LeafError(PERSISTENCE) 记录不存在、格式错误或字段为空
     */
    virtual DeviceConfig load() const = 0;
};
