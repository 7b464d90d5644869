#pragma once

#include <chrono>
#include <memory>
#include <json/json.h>
#include "api/HttpTypes.hpp"
#include "api/IDeviceApi.hpp"

/**
 * @brief 基于 HTTP/JSON 的设备API实现
 *
 * 请求地址为 http://<address>:16021/api/v1/...，
 * 若 address 本身以 http 开头则直接作为基地址使用。
 */
class HttpDeviceApi : public IDeviceApi {
public:
    explicit HttpDeviceApi(std::shared_ptr<IHttpClient> httpClient,
                           std::chrono::milliseconds requestTimeout = std::chrono::milliseconds(10000));

    std::string pair(const std::string& address, const CancellationToken& token) override;

    DeviceInfo getInfo(const std::string& address, const std::string& credential,
                       const CancellationToken& token) override;

    void setPower(const std::string& address, const std::string& credential, bool on,
                  const CancellationToken& token) override;

    void setBrightness(const std::string& address, const std::string& credential, int level,
                       const CancellationToken& token) override;

    std::vector<std::string> listEffects(const std::string& address, const std::string& credential,
                                         const CancellationToken& token) override;

    void setEffect(const std::string& address, const std::string& credential, const std::string& effect,
                   const CancellationToken& token) override;

    /**
     * @brief 计算设备基地址（以 / 结尾）
     */
    static std::string baseUrl(const std::string& address);

    /**
     * @brief 将JSON对象展开为点分键的扁平映射
     */
    static DeviceInfo flatten(const Json::Value& root);

private:
    HttpResponse execute(const std::string& operation, const std::string& method, const std::string& url,
                         const Json::Value* body, int expectedStatus, const CancellationToken& token);

    static Json::Value parseBody(const std::string& operation, const std::string& body);
    static void flattenInto(const Json::Value& node, const std::string& prefix, DeviceInfo& out);

    std::shared_ptr<IHttpClient> httpClient_;
    std::chrono::milliseconds requestTimeout_;
};
