#pragma once

#include <string>
#include <vector>

/**
 * @brief 本机网卡地址信息
 */
struct InterfaceAddress {
    std::string name;       // 网卡名，如 eth0
    std::string address;    // 点分十进制地址
    bool isUp = false;      // IFF_UP
    bool isLoopback = false;
    bool isIPv4 = false;
};

/**
 * @brief 子网探测 - 从本机网卡推导需要扫描的 /24 前缀（"a.b.c."）
 *
 * 取枚举顺序中第一个已启用、非回环的IPv4地址；
 * 没有符合条件的网卡时抛出 LeafError(NO_INTERFACE)，不在内部重试。
 */
class SubnetDetector {
public:
    /**
     * @brief 枚举本机网卡并返回扫描前缀
     */
    static std::string detect();

    /**
     * @brief 在给定的网卡列表上应用选择规则
     */
    static std::string detect(const std::vector<InterfaceAddress>& interfaces);

    /**
     * @brief 通过 getifaddrs 枚举本机IPv4网卡
     */
    static std::vector<InterfaceAddress> enumerateInterfaces();

    /**
     * @brief 取IPv4地址的前三段，如 "192.168.1.23" -> "192.168.1."
     * 地址不合法时抛出 LeafError(NO_INTERFACE)
     */
    static std::string prefixOf(const std::string& ipv4);
};
