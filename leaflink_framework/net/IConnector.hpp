#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include "utils/CancellationToken.hpp"

/**
 * @brief 连接器接口 - 单次有超时的TCP可达性探测
 */
class IConnector {
public:
    virtual ~IConnector() = default;

    /**
     * @brief 探测 address:port 是否可以建立TCP连接
     * @param address IPv4地址
     * @param port 端口
     * @param timeout 单次探测超时
     * @param token 取消令牌，取消后应尽快返回
     * @return 连接成功返回 true；拒绝、不可达、超时、被取消返回 false
     * @throws LeafError(TRANSPORT) 本地原因导致无法探测（文件描述符耗尽、地址非法等）
     */
    virtual bool probe(const std::string& address, uint16_t port,
                       std::chrono::milliseconds timeout, const CancellationToken& token) = 0;
};
