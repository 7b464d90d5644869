#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

// 设备协议常量，不可配置
namespace protocol {

constexpr uint16_t kDevicePort = 16021;                       // 设备服务端口（探测与REST API共用）
constexpr int kFirstHostSuffix = 1;
constexpr int kLastHostSuffix = 254;
constexpr int kHostCount = kLastHostSuffix - kFirstHostSuffix + 1;
constexpr size_t kScanWorkerCount = 50;                       // 扫描线程池大小
constexpr std::chrono::milliseconds kProbeTimeout{300};       // 单次连接探测超时

} // namespace protocol
