#include "api/AsioHttpClient.hpp"
#include "core/LeafError.hpp"
#include "utils/Logger.hpp"

#include <asio.hpp>
#include <algorithm>
#include <sstream>

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::chrono::milliseconds kPollSlice{20};
constexpr size_t kMaxResponseBytes = 4 * 1024 * 1024;

/**
 * @brief 驱动 io_context 直到当前异步步骤完成
 * 超时抛 TRANSPORT，令牌取消抛 CANCELLED；抛出前关闭socket并排空挂起的handler
 */
void runStep(asio::io_context& io, const bool& finished, Clock::time_point deadline,
             const CancellationToken& token, asio::ip::tcp::socket& socket,
             asio::ip::tcp::resolver& resolver, const std::string& stage, const std::string& url) {
    while(!finished) {
        bool cancelled = token.isCancelled();
        bool timedOut = !cancelled && Clock::now() >= deadline;
        if(cancelled || timedOut) {
            asio::error_code ignored;
            resolver.cancel();
            socket.close(ignored);
            io.restart();
            io.run();

            if(cancelled) {
                throw LeafError(ErrorKind::CANCELLED, stage + " " + url + " aborted: " +
                                CancellationToken::reasonText(token.reason()));
            }
            throw LeafError(ErrorKind::TRANSPORT, stage + " " + url + " timed out");
        }
        io.restart();
        io.run_for(std::min<Clock::duration>(deadline - Clock::now(), kPollSlice));
    }
}

}  // namespace

std::string AsioHttpClient::buildRequest(const HttpRequest& request, const Url& url) {
    std::ostringstream out;
    out << request.method << " " << url.target << " HTTP/1.1\r\n";
    out << "Host: " << url.host;
    if(url.port != 80) {
        out << ":" << url.port;
    }
    out << "\r\n";
    out << "Connection: close\r\n";
    out << "Accept: application/json\r\n";
    for(const auto& header : request.headers) {
        out << header.first << ": " << header.second << "\r\n";
    }
    if(!request.body.empty() || request.method == "POST" || request.method == "PUT") {
        out << "Content-Length: " << request.body.size() << "\r\n";
    }
    out << "\r\n";
    out << request.body;
    return out.str();
}

HttpResponse AsioHttpClient::send(const HttpRequest& request, const CancellationToken& token) {
    Url url = Url::parse(request.url);

    auto fallback = request.timeout.count() > 0 ? request.timeout : std::chrono::hours(24);
    auto deadline = Clock::now() + std::min(fallback, token.remaining(fallback));

    if(token.isCancelled()) {
        throw LeafError(ErrorKind::CANCELLED, request.method + " " + request.url + " aborted: " +
                        CancellationToken::reasonText(token.reason()));
    }

    LOG_DEBUG("HTTP ", request.method, " ", request.url);

    asio::io_context io;
    asio::ip::tcp::resolver resolver(io);
    asio::ip::tcp::socket socket(io);

    // 1. 解析主机名
    bool finished = false;
    asio::error_code result;
    asio::ip::tcp::resolver::results_type endpoints;
    resolver.async_resolve(url.host, std::to_string(url.port),
        [&](const asio::error_code& ec, asio::ip::tcp::resolver::results_type found) {
            result = ec;
            endpoints = std::move(found);
            finished = true;
        });
    runStep(io, finished, deadline, token, socket, resolver, "resolving", request.url);
    if(result) {
        throw LeafError(ErrorKind::TRANSPORT, "cannot resolve " + url.host + ": " + result.message());
    }

    // 2. 建立连接
    finished = false;
    asio::async_connect(socket, endpoints,
        [&](const asio::error_code& ec, const asio::ip::tcp::endpoint&) {
            result = ec;
            finished = true;
        });
    runStep(io, finished, deadline, token, socket, resolver, "connecting to", request.url);
    if(result) {
        throw LeafError(ErrorKind::TRANSPORT, "cannot connect to " + request.url + ": " + result.message());
    }

    // 3. 发送请求
    std::string payload = buildRequest(request, url);
    finished = false;
    asio::async_write(socket, asio::buffer(payload),
        [&](const asio::error_code& ec, size_t) {
            result = ec;
            finished = true;
        });
    runStep(io, finished, deadline, token, socket, resolver, "sending", request.url);
    if(result) {
        throw LeafError(ErrorKind::TRANSPORT, "failed to send " + request.url + ": " + result.message());
    }

    // 4. 读取到对端关闭连接
    std::string raw;
    finished = false;
    asio::async_read(socket, asio::dynamic_buffer(raw, kMaxResponseBytes),
        [&](const asio::error_code& ec, size_t) {
            result = ec;
            finished = true;
        });
    runStep(io, finished, deadline, token, socket, resolver, "reading", request.url);
    if(result && result != asio::error::eof) {
        throw LeafError(ErrorKind::TRANSPORT, "failed to read response from " + request.url + ": " + result.message());
    }

    asio::error_code closeError;
    socket.close(closeError);
    if(closeError) {
        LOG_DEBUG("Closing HTTP socket for ", request.url, " failed: ", closeError.message());
    }

    HttpResponse response = parseHttpResponse(raw);
    LOG_DEBUG("HTTP ", request.method, " ", request.url, " -> ", response.statusCode);
    return response;
}
