#pragma once

#include <string>
#include <json/json.h>
#include "config/ConfigHelper.hpp"

/**
 * @brief 动态配置解析器
 * 负责从 JSON 读取配置并应用到 ConfigHelper，未出现或类型不符的键保持原值
 */
class ConfigParser {
public:
    /**
     * @brief 从JSON文件加载所有配置
     * @param filepath JSON配置文件路径
     * @return 是否成功加载
     */
    static bool loadFromFile(const std::string& filepath);

    /**
     * @brief 保存所有配置到JSON文件
     * @param filepath JSON配置文件路径
     * @return 是否成功保存
     */
    static bool saveToFile(const std::string& filepath);

    /**
     * @brief 从JSON字符串加载配置
     * @param jsonStr JSON字符串
     * @return 是否成功加载
     */
    static bool loadFromString(const std::string& jsonStr);

    /**
     * @brief 将当前配置导出为JSON字符串
     * @return JSON字符串
     */
    static std::string saveToString();

private:
    static void applyRoot(const Json::Value& root);
    static Json::Value buildRoot();

    static void parseScanConfig(const Json::Value& json, ConfigHelper::ScanConfig& config);
    static void parseApiConfig(const Json::Value& json, ConfigHelper::ApiConfig& config);
    static void parseSessionConfig(const Json::Value& json, ConfigHelper::SessionConfig& config);

    /**
     * @brief 解析日志配置，logLevel 支持整数或 "DEBUG"/"INFO" 等字符串
     */
    static void parseLoggerConfig(const Json::Value& json, ConfigHelper::LoggerConfig& config);

    // 序列化方法
    static Json::Value scanConfigToJson(const ConfigHelper::ScanConfig& config);
    static Json::Value apiConfigToJson(const ConfigHelper::ApiConfig& config);
    static Json::Value sessionConfigToJson(const ConfigHelper::SessionConfig& config);
    static Json::Value loggerConfigToJson(const ConfigHelper::LoggerConfig& config);

    /**
     * @brief 安全获取JSON值的辅助方法
     */
    template<typename T>
    static T safeGetValue(const Json::Value& json, const std::string& key, const T& defaultValue);
};
