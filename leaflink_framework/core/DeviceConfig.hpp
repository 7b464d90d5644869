#pragma once

#include <string>

/**
 * @brief 设备地址与配对凭据
 * 两者皆空：未配置；仅有地址：已配置未配对；两者皆有：已配对
 */
struct DeviceConfig {
    std::string address;     // 设备IPv4地址
    std::string credential;  // 配对时设备签发的 auth token

    bool empty() const { return address.empty() && credential.empty(); }

    bool operator==(const DeviceConfig& other) const {
        return address == other.address && credential == other.credential;
    }

    bool operator!=(const DeviceConfig& other) const { return !(*this == other); }
};
