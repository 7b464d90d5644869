#pragma once

#include "net/IConnector.hpp"

/**
 * @brief 基于 asio 的TCP连接器
 *
 * 每次探测使用独立的 io_context，在调用线程上分片运行，
 * 以便在超时或令牌取消时及时放弃连接。可被多个扫描线程并发调用。
 */
class AsioConnector : public IConnector {
public:
    AsioConnector() = default;
    ~AsioConnector() override = default;

    bool probe(const std::string& address, uint16_t port,
               std::chrono::milliseconds timeout, const CancellationToken& token) override;
};
