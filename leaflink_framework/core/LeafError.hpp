#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief 错误分类
 */
enum class ErrorKind {
    NONE,
    PRECONDITION,   // 缺少地址/凭据、参数越界，由调用方修正，不重试
    NO_INTERFACE,   // 没有可用的IPv4网卡
    TRANSPORT,      // 探测或API调用失败
    CANCELLED,      // 截止时间到达或被显式取消
    PERSISTENCE     // 会话存储读写失败
};

inline const char* errorKindName(ErrorKind kind) {
    switch(kind) {
        case ErrorKind::NONE:         return "NONE";
        case ErrorKind::PRECONDITION: return "PRECONDITION";
        case ErrorKind::NO_INTERFACE: return "NO_INTERFACE";
        case ErrorKind::TRANSPORT:    return "TRANSPORT";
        case ErrorKind::CANCELLED:    return "CANCELLED";
        case ErrorKind::PERSISTENCE:  return "PERSISTENCE";
        default:                      return "UNKNOWN";
    }
}

/**
 * @brief 编排层以下各组件抛出的异常
 * OrchestrationService 负责捕获并转换为 ServiceResult
 */
class LeafError : public std::runtime_error {
public:
    LeafError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

    std::string getMessage() const { return what(); }

private:
    ErrorKind kind_;
};
