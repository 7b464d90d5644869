#pragma once

#include "api/HttpTypes.hpp"

/**
 * @brief 基于 asio 的 HTTP/1.1 客户端
 *
 * 每次请求使用独立的 io_context 和连接（Connection: close），
 * 截止时间取 min(请求超时, 令牌截止时间)。
 */
class AsioHttpClient : public IHttpClient {
public:
    AsioHttpClient() = default;

    HttpResponse send(const HttpRequest& request, const CancellationToken& token) override;

    /**
     * @brief 组装请求报文（不含网络IO）
     */
    static std::string buildRequest(const HttpRequest& request, const Url& url);
};
