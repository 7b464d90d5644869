#include "net/SubnetDetector.hpp"
#include "core/LeafError.hpp"
#include "utils/Logger.hpp"

#include <arpa/inet.h>
#include <errno.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <cstring>
#include <memory>
#include <sstream>

std::string SubnetDetector::detect() {
    return detect(enumerateInterfaces());
}

std::string SubnetDetector::detect(const std::vector<InterfaceAddress>& interfaces) {
    for(const auto& iface : interfaces) {
        if(!iface.isIPv4 || !iface.isUp || iface.isLoopback) {
            continue;
        }
        // 127.0.0.0/8 即使没有 IFF_LOOPBACK 标志也视为回环
        if(iface.address.rfind("127.", 0) == 0) {
            continue;
        }

        std::string prefix = prefixOf(iface.address);
        LOG_DEBUG("Using interface ", iface.name, " (", iface.address, "), scan prefix ", prefix);
        return prefix;
    }

    throw LeafError(ErrorKind::NO_INTERFACE, "no suitable network interface found");
}

std::vector<InterfaceAddress> SubnetDetector::enumerateInterfaces() {
    struct ifaddrs* ifaddr = nullptr;
    if(getifaddrs(&ifaddr) != 0) {
        throw LeafError(ErrorKind::NO_INTERFACE,
                        std::string("failed to get network interfaces: ") + std::strerror(errno));
    }

    // 遍历中抛异常时也要释放链表
    std::unique_ptr<struct ifaddrs, decltype(&freeifaddrs)> guard(ifaddr, &freeifaddrs);

    std::vector<InterfaceAddress> result;
    for(struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if(ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET) {
            continue;
        }

        char buffer[INET_ADDRSTRLEN] = {0};
        auto* sin = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
        if(inet_ntop(AF_INET, &sin->sin_addr, buffer, sizeof(buffer)) == nullptr) {
            LOG_WARN("Skipping interface ", ifa->ifa_name, ": cannot format address");
            continue;
        }

        InterfaceAddress iface;
        iface.name = ifa->ifa_name ? ifa->ifa_name : "";
        iface.address = buffer;
        iface.isIPv4 = true;
        iface.isUp = (ifa->ifa_flags & IFF_UP) != 0;
        iface.isLoopback = (ifa->ifa_flags & IFF_LOOPBACK) != 0;
        result.push_back(iface);
    }

    LOG_DEBUG("Enumerated ", result.size(), " IPv4 interface(s)");
    return result;
}

std::string SubnetDetector::prefixOf(const std::string& ipv4) {
    struct in_addr addr;
    if(inet_pton(AF_INET, ipv4.c_str(), &addr) != 1) {
        throw LeafError(ErrorKind::NO_INTERFACE, "invalid IPv4 address: " + ipv4);
    }

    const auto* bytes = reinterpret_cast<const unsigned char*>(&addr.s_addr);
    std::ostringstream oss;
    oss << static_cast<int>(bytes[0]) << "." << static_cast<int>(bytes[1]) << "."
        << static_cast<int>(bytes[2]) << ".";
    return oss.str();
}
