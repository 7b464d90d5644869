#pragma once

#include <string>
#include "utils/Logger.hpp"

/**
 * @brief 配置管理器 - 单例模式
 * 提供应用程序的所有配置选项，支持配置验证
 *
 * 工作线程数(50)、探测超时(300ms)、设备端口(16021)是协议常量，见 DeviceProtocol.hpp
 */
class ConfigHelper {
public:
    static ConfigHelper& getInstance() {
        static ConfigHelper instance;
        return instance;
    }

    // 扫描配置
    struct ScanConfig {
        int scanTimeoutMs = 10000;           // 整次扫描的截止时间(毫秒)

        bool validate() const;
    } scanConfig;

    // 设备API配置
    struct ApiConfig {
        int requestTimeoutMs = 10000;        // 单次HTTP请求超时(毫秒)

        bool validate() const;
    } apiConfig;

    // 会话存储配置
    struct SessionConfig {
        std::string sessionFile = "";        // 会话文件路径，空表示 $HOME/.nanoleaf_config.json

        bool validate() const;
    } sessionConfig;

    // 日志系统配置
    struct LoggerConfig {
        Logger::Level logLevel = Logger::Level::INFO;   // 日志级别
        bool enableConsole = true;                      // 是否启用控制台输出
        bool enableFileLogging = false;                 // 是否启用文件日志
        std::string logDirectory = "logs/";             // 日志目录

        bool validate() const;
    } loggerConfig;

    /**
     * @brief 按 loggerConfig 初始化日志系统
     */
    bool initializeLogger();

    /**
     * @brief 验证所有配置的有效性
     * @return true if all configurations are valid
     */
    bool validateAll() const;

    /**
     * @brief 打印当前配置
     */
    void printConfig() const;

    /**
     * @brief 重置为默认配置
     */
    void resetToDefaults();

    /**
     * @brief 会话文件的实际路径
     */
    std::string resolveSessionFile() const;

private:
    ConfigHelper();
    ~ConfigHelper() = default;
    ConfigHelper(const ConfigHelper&) = delete;
    ConfigHelper& operator=(const ConfigHelper&) = delete;
};
