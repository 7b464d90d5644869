#pragma once

#include <chrono>
#include <memory>
#include <set>
#include <string>
#include "net/IConnector.hpp"
#include "net/DeviceProtocol.hpp"
#include "utils/CancellationToken.hpp"

/**
 * @brief 扫描发现的可达地址，按主机号排序
 */
struct DiscoveredAddress {
    std::string prefix;   // "a.b.c."
    int suffix = 0;       // 1..254

    std::string toString() const { return prefix + std::to_string(suffix); }

    bool operator<(const DiscoveredAddress& other) const {
        if(suffix != other.suffix) {
            return suffix < other.suffix;
        }
        return prefix < other.prefix;
    }

    bool operator==(const DiscoveredAddress& other) const {
        return suffix == other.suffix && prefix == other.prefix;
    }
};

/**
 * @brief 扫描协调器 - 用固定大小的线程池探测 /24 子网内的全部主机
 *
 * 254 个候选主机经有界队列分发给工作线程，每个线程对设备端口做一次有超时的连接探测，
 * 协调器必须收齐 254 份报告（找到/未找到）才正常返回。
 *
 * - 令牌在收齐之前被取消：丢弃部分结果，抛出 LeafError(CANCELLED)
 * - 任一探测因本地原因失败：整次扫描抛出 LeafError(TRANSPORT)
 * - 单个主机不重试；返回前所有工作线程均已 join
 */
class ScanCoordinator {
public:
    explicit ScanCoordinator(std::shared_ptr<IConnector> connector,
                             size_t workerCount = protocol::kScanWorkerCount,
                             std::chrono::milliseconds probeTimeout = protocol::kProbeTimeout);

    /**
     * @brief 扫描 prefix1 .. prefix254
     * @param prefix 形如 "192.168.1." 的前缀
     * @param token 调用方的取消令牌（截止时间或显式取消）
     * @return 可达地址集合
     */
    std::set<DiscoveredAddress> scan(const std::string& prefix, const CancellationToken& token);

    size_t getWorkerCount() const { return workerCount_; }

private:
    std::shared_ptr<IConnector> connector_;
    size_t workerCount_;
    std::chrono::milliseconds probeTimeout_;
};
