#pragma once

#include <functional>
#include <memory>
#include "net/IDeviceScanner.hpp"
#include "net/ScanCoordinator.hpp"

/**
 * @brief 生产环境的设备扫描器：子网探测 + 扫描协调器
 */
class NetworkScanner : public IDeviceScanner {
public:
    // 返回扫描前缀，失败时抛出 LeafError(NO_INTERFACE)
    using PrefixProvider = std::function<std::string()>;

    /**
     * @brief 使用本机网卡和 AsioConnector
     */
    NetworkScanner();

    NetworkScanner(std::shared_ptr<IConnector> connector, PrefixProvider prefixProvider);

    std::vector<std::string> scan(const CancellationToken& token) override;

private:
    ScanCoordinator coordinator_;
    PrefixProvider prefixProvider_;
};
