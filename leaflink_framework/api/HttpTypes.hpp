#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include "utils/CancellationToken.hpp"

/**
 * @brief HTTP请求
 */
struct HttpRequest {
    std::string method;                           // GET / POST / PUT
    std::string url;                              // http://host[:port]/path
    std::string body;
    std::map<std::string, std::string> headers;
    std::chrono::milliseconds timeout{0};         // 0 表示只受取消令牌约束
};

/**
 * @brief HTTP响应
 */
struct HttpResponse {
    int statusCode = 0;
    std::string status;                           // 状态行中的原因短语
    std::string body;
    std::map<std::string, std::string> headers;   // 头部名称统一为小写
};

/**
 * @brief 解析后的 http URL（仅支持 http 明文）
 */
struct Url {
    std::string host;
    uint16_t port = 80;
    std::string target = "/";

    /**
     * @throws LeafError(PRECONDITION) URL格式不合法或不是 http
     */
    static Url parse(const std::string& url);
};

/**
 * @brief 解析完整的 HTTP/1.x 响应报文（支持 Content-Length 与 chunked）
 * @throws LeafError(TRANSPORT) 报文不完整或格式错误
 */
HttpResponse parseHttpResponse(const std::string& raw);

/**
 * @brief HTTP客户端接口
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    /**
     * @brief 发送请求并等待完整响应
     * @throws LeafError TRANSPORT（连接/读写失败、请求超时）或 CANCELLED（令牌取消）
     */
    virtual HttpResponse send(const HttpRequest& request, const CancellationToken& token) = 0;
};
