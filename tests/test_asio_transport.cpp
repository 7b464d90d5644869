#include "api/AsioHttpClient.hpp"
#include "core/LeafError.hpp"
#include "net/AsioConnector.hpp"
#include <gtest/gtest.h>
#include <asio.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>

using namespace std::chrono_literals;
using Clock = std::chrono::steady_clock;

namespace {

/**
 * @brief 本地回环HTTP服务端，只服务一个连接
 *
 * 读完请求头和 Content-Length 指定的请求体后写回固定响应并关闭连接；
 * reply 为空时保持连接不回复，用于超时与取消场景。
 */
class LoopbackServer {
public:
    explicit LoopbackServer(std::string reply)
        : reply_(std::move(reply)),
          acceptor_(io_, asio::ip::tcp::endpoint(asio::ip::make_address_v4("127.0.0.1"), 0)),
          socket_(io_) {
        acceptor_.async_accept(socket_, [this](const asio::error_code& ec) {
            if(!ec) {
                readHeaders();
            }
        });
        worker_ = std::thread([this] { io_.run(); });
    }

    ~LoopbackServer() {
        io_.stop();
        if(worker_.joinable()) {
            worker_.join();
        }
    }

    uint16_t port() const { return acceptor_.local_endpoint().port(); }

    std::string url(const std::string& target) const {
        return "http://127.0.0.1:" + std::to_string(port()) + target;
    }

    std::string received() {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

private:
    void readHeaders() {
        asio::async_read_until(socket_, asio::dynamic_buffer(buffer_), "\r\n\r\n",
            [this](const asio::error_code& ec, size_t headerBytes) {
                if(ec) {
                    return;
                }
                size_t total = headerBytes + contentLength(buffer_.substr(0, headerBytes));
                readBody(total);
            });
    }

    void readBody(size_t total) {
        if(buffer_.size() >= total) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                received_ = buffer_.substr(0, total);
            }
            writeReply();
            return;
        }
        asio::async_read(socket_, asio::dynamic_buffer(buffer_), asio::transfer_exactly(total - buffer_.size()),
            [this, total](const asio::error_code& ec, size_t) {
                if(!ec) {
                    readBody(total);
                }
            });
    }

    void writeReply() {
        if(reply_.empty()) {
            return;
        }
        asio::async_write(socket_, asio::buffer(reply_), [this](const asio::error_code&, size_t) {
            asio::error_code ignored;
            socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
            socket_.close(ignored);
        });
    }

    static size_t contentLength(std::string headers) {
        std::transform(headers.begin(), headers.end(), headers.begin(), [](unsigned char ch) {
            return static_cast<char>(std::tolower(ch));
        });
        auto pos = headers.find("content-length:");
        if(pos == std::string::npos) {
            return 0;
        }
        return std::stoul(headers.substr(pos + 15));
    }

    std::string reply_;
    asio::io_context io_;
    asio::ip::tcp::acceptor acceptor_;
    asio::ip::tcp::socket socket_;
    std::string buffer_;
    std::mutex mutex_;
    std::string received_;
    std::thread worker_;
};

// 绑定后立即释放，得到一个当前无人监听的端口
uint16_t closedPort() {
    asio::io_context io;
    asio::ip::tcp::acceptor acceptor(io, asio::ip::tcp::endpoint(asio::ip::make_address_v4("127.0.0.1"), 0));
    uint16_t port = acceptor.local_endpoint().port();
    acceptor.close();
    return port;
}

ErrorKind errorKindOf(AsioHttpClient& client, const HttpRequest& request, const CancellationToken& token) {
    try {
        client.send(request, token);
    } catch(const LeafError& e) {
        return e.kind();
    }
    return ErrorKind::NONE;
}

}  // namespace

// =================== AsioConnector ===================

TEST(AsioConnectorTest, ListeningPortIsReachable) {
    asio::io_context io;
    asio::ip::tcp::acceptor acceptor(io, asio::ip::tcp::endpoint(asio::ip::make_address_v4("127.0.0.1"), 0));

    AsioConnector connector;
    EXPECT_TRUE(connector.probe("127.0.0.1", acceptor.local_endpoint().port(), 300ms, CancellationToken()));
}

TEST(AsioConnectorTest, ClosedPortIsUnreachable) {
    AsioConnector connector;
    EXPECT_FALSE(connector.probe("127.0.0.1", closedPort(), 300ms, CancellationToken()));
}

TEST(AsioConnectorTest, SilentHostGivesUpWithinTimeout) {
    AsioConnector connector;
    auto start = Clock::now();
    // TEST-NET-1，不会有主机应答
    EXPECT_FALSE(connector.probe("192.0.2.1", 16021, 300ms, CancellationToken()));
    EXPECT_LT(Clock::now() - start, 1500ms);
}

TEST(AsioConnectorTest, CancelledTokenAbortsProbe) {
    AsioConnector connector;
    CancellationToken token;
    token.cancel();

    auto start = Clock::now();
    EXPECT_FALSE(connector.probe("192.0.2.1", 16021, 5s, token));
    EXPECT_LT(Clock::now() - start, 1s);
}

TEST(AsioConnectorTest, InvalidAddressIsTransportError) {
    AsioConnector connector;
    try {
        connector.probe("not.an.address", 16021, 300ms, CancellationToken());
        FAIL() << "expected TRANSPORT";
    } catch(const LeafError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TRANSPORT);
    }
}

// =================== AsioHttpClient ===================

class AsioHttpClientTest : public ::testing::Test {
protected:
    AsioHttpClient client;
};

TEST_F(AsioHttpClientTest, ExchangesRequestAndResponse) {
    LoopbackServer server("HTTP/1.1 200 OK\r\nContent-Type: application/json\r\n"
                          "Content-Length: 22\r\n\r\n{\"auth_token\":\"abc12\"}");

    HttpRequest request;
    request.method = "POST";
    request.url = server.url("/api/v1/new");
    request.body = "{}";
    request.headers["Content-Type"] = "application/json";
    request.timeout = 2s;

    HttpResponse response = client.send(request, CancellationToken());
    EXPECT_EQ(response.statusCode, 200);
    EXPECT_EQ(response.headers.at("content-type"), "application/json");
    EXPECT_EQ(response.body, "{\"auth_token\":\"abc12\"}");

    std::string received = server.received();
    EXPECT_EQ(received.rfind("POST /api/v1/new HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(received.find("Content-Length: 2\r\n"), std::string::npos);
    EXPECT_EQ(received.substr(received.size() - 2), "{}");
}

TEST_F(AsioHttpClientTest, ReadsBodyUntilPeerCloses) {
    LoopbackServer server("HTTP/1.1 200 OK\r\n\r\n[\"Flames\",\"Forest\"]");

    HttpRequest request;
    request.method = "GET";
    request.url = server.url("/api/v1/tok/effects/effectsList");
    request.timeout = 2s;

    HttpResponse response = client.send(request, CancellationToken());
    EXPECT_EQ(response.statusCode, 200);
    EXPECT_EQ(response.body, "[\"Flames\",\"Forest\"]");
}

TEST_F(AsioHttpClientTest, SilentServerTimesOut) {
    LoopbackServer server("");

    HttpRequest request;
    request.method = "GET";
    request.url = server.url("/api/v1/tok");
    request.timeout = 200ms;

    auto start = Clock::now();
    EXPECT_EQ(errorKindOf(client, request, CancellationToken()), ErrorKind::TRANSPORT);
    EXPECT_LT(Clock::now() - start, 2s);
}

TEST_F(AsioHttpClientTest, CancelDuringRequestIsCancelled) {
    LoopbackServer server("");

    HttpRequest request;
    request.method = "GET";
    request.url = server.url("/api/v1/tok");
    request.timeout = 10s;

    CancellationToken token;
    std::thread canceller([token] {
        std::this_thread::sleep_for(100ms);
        token.cancel();
    });

    auto start = Clock::now();
    ErrorKind kind = errorKindOf(client, request, token);
    canceller.join();

    EXPECT_EQ(kind, ErrorKind::CANCELLED);
    EXPECT_LT(Clock::now() - start, 3s);
}

TEST_F(AsioHttpClientTest, RefusedConnectionIsTransportError) {
    HttpRequest request;
    request.method = "GET";
    request.url = "http://127.0.0.1:" + std::to_string(closedPort()) + "/api/v1/tok";
    request.timeout = 2s;

    EXPECT_EQ(errorKindOf(client, request, CancellationToken()), ErrorKind::TRANSPORT);
}
