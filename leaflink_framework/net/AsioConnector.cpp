#include "net/AsioConnector.hpp"
#include "core/LeafError.hpp"
#include "utils/Logger.hpp"

#include <asio.hpp>
#include <algorithm>

namespace {

constexpr std::chrono::milliseconds kPollSlice{20};

// 本机资源问题，属于传输错误，不能当作"主机不存在"
bool isLocalFailure(const asio::error_code& ec) {
    return ec == asio::error::no_descriptors ||
           ec == asio::error::no_buffer_space ||
           ec == asio::error::no_memory;
}

}  // namespace

bool AsioConnector::probe(const std::string& address, uint16_t port,
                          std::chrono::milliseconds timeout, const CancellationToken& token) {
    asio::error_code parseError;
    auto ip = asio::ip::make_address_v4(address, parseError);
    if(parseError) {
        throw LeafError(ErrorKind::TRANSPORT, "invalid probe address '" + address + "': " + parseError.message());
    }

    asio::io_context io;
    asio::ip::tcp::socket socket(io);
    asio::ip::tcp::endpoint endpoint(ip, port);

    asio::error_code result = asio::error::would_block;
    socket.async_connect(endpoint, [&result](const asio::error_code& ec) { result = ec; });

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while(result == asio::error::would_block) {
        if(token.isCancelled()) {
            break;
        }
        auto now = std::chrono::steady_clock::now();
        if(now >= deadline) {
            break;
        }
        io.restart();
        io.run_for(std::min<std::chrono::steady_clock::duration>(deadline - now, kPollSlice));
    }

    asio::error_code closeError;
    if(result == asio::error::would_block) {
        // 超时或被取消：关闭socket让挂起的connect以 operation_aborted 结束
        socket.close(closeError);
        io.restart();
        io.run();
        if(closeError) {
            LOG_DEBUG("Closing aborted probe socket for ", address, " failed: ", closeError.message());
        }
        return false;
    }

    socket.close(closeError);
    if(closeError) {
        LOG_DEBUG("Closing probe socket for ", address, " failed: ", closeError.message());
    }

    if(!result) {
        return true;
    }
    if(isLocalFailure(result)) {
        throw LeafError(ErrorKind::TRANSPORT, "probe of " + address + " failed locally: " + result.message());
    }
    return false;
}
