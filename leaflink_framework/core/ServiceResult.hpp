#pragma once

#include <string>
#include <variant>
#include <vector>
#include "api/IDeviceApi.hpp"
#include "core/DeviceConfig.hpp"
#include "core/LeafError.hpp"

// 结果数据的具体类型，用结构体包装以区分同为字符串列表的数据
struct AddressList {
    std::vector<std::string> addresses;
};

struct Credential {
    std::string token;
};

struct EffectList {
    std::vector<std::string> effects;
};

using ResultData = std::variant<std::monostate, AddressList, Credential, DeviceInfo, DeviceConfig, EffectList>;

/**
 * @brief 编排层对外的唯一结果类型
 *
 * 失败时 errorKind 标明错误类别；success=false 且 errorKind=NONE
 * 表示操作正常完成但没有结果（例如扫描未发现设备）。
 */
struct ServiceResult {
    bool success = false;
    std::string message;
    ResultData data;
    ErrorKind errorKind = ErrorKind::NONE;

    static ServiceResult ok(const std::string& message, ResultData data = {}) {
        ServiceResult result;
        result.success = true;
        result.message = message;
        result.data = std::move(data);
        return result;
    }

    static ServiceResult failure(ErrorKind kind, const std::string& message, ResultData data = {}) {
        ServiceResult result;
        result.success = false;
        result.message = message;
        result.data = std::move(data);
        result.errorKind = kind;
        return result;
    }

    bool hasData() const { return !std::holds_alternative<std::monostate>(data); }

    /**
     * @brief 按类型取数据，类型不符返回 nullptr
     */
    template<typename T>
    const T* get() const { return std::get_if<T>(&data); }
};
