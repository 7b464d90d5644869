#include "config/ConfigHelper.hpp"
#include "config/JsonSessionStore.hpp"

// =================== 构造函数 ===================

ConfigHelper::ConfigHelper() {
    if(!validateAll()) {
        LOG_WARN("Warning: Default configuration validation failed!");
    }
}

// =================== 配置验证实现 ===================

bool ConfigHelper::ScanConfig::validate() const {
    return scanTimeoutMs > 0;
}

bool ConfigHelper::ApiConfig::validate() const {
    return requestTimeoutMs > 0;
}

bool ConfigHelper::SessionConfig::validate() const {
    // 空路径表示使用默认位置
    return true;
}

bool ConfigHelper::LoggerConfig::validate() const {
    return (!enableFileLogging || !logDirectory.empty());
}

// =================== 日志系统实现 ===================

bool ConfigHelper::initializeLogger() {
    bool success = Logger::getInstance().initializeAdvanced(
        loggerConfig.logLevel,
        loggerConfig.enableConsole,
        loggerConfig.enableFileLogging,
        loggerConfig.logDirectory,
        "leaflink",
        true
    );

    if (success) {
        LOG_DEBUG("Configuration-based logger initialization completed");
    } else {
        LOG_ERROR("Failed to initialize logger with configuration");
    }

    return success;
}

// =================== 配置管理实现 ===================

bool ConfigHelper::validateAll() const {
    return scanConfig.validate() &&
           apiConfig.validate() &&
           sessionConfig.validate() &&
           loggerConfig.validate();
}

void ConfigHelper::printConfig() const {
    LOG_INFO("=== Current Configuration ===");
    LOG_INFO("Scan: TimeoutMs=", scanConfig.scanTimeoutMs);
    LOG_INFO("Api: RequestTimeoutMs=", apiConfig.requestTimeoutMs);
    LOG_INFO("Session: File=", resolveSessionFile());
    LOG_INFO("Logger: Level=", Logger::levelName(loggerConfig.logLevel),
             ", Console=", loggerConfig.enableConsole ? "enabled" : "disabled",
             ", FileLogging=", loggerConfig.enableFileLogging ? "enabled" : "disabled",
             ", Directory=", loggerConfig.logDirectory);
    LOG_INFO("============================");
}

void ConfigHelper::resetToDefaults() {
    scanConfig = ScanConfig{};
    apiConfig = ApiConfig{};
    sessionConfig = SessionConfig{};
    loggerConfig = LoggerConfig{};
}

std::string ConfigHelper::resolveSessionFile() const {
    return sessionConfig.sessionFile.empty() ? JsonSessionStore::defaultPath() : sessionConfig.sessionFile;
}
