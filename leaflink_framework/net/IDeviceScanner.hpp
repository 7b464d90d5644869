#pragma once

#include <string>
#include <vector>
#include "utils/CancellationToken.hpp"

/**
 * @brief 设备扫描接口，编排层通过它发现设备
 */
class IDeviceScanner {
public:
    virtual ~IDeviceScanner() = default;

    /**
     * @brief 扫描本地网络
     * @return 可达地址列表，按主机号升序
     * @throws LeafError NO_INTERFACE / CANCELLED / TRANSPORT
     */
    virtual std::vector<std::string> scan(const CancellationToken& token) = 0;
};
