#include "config/ConfigParser.hpp"
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>

// =================== 模板特化实现 ===================

template<>
bool ConfigParser::safeGetValue<bool>(const Json::Value& json, const std::string& key, const bool& defaultValue) {
    return json.isMember(key) && json[key].isBool() ? json[key].asBool() : defaultValue;
}

template<>
int ConfigParser::safeGetValue<int>(const Json::Value& json, const std::string& key, const int& defaultValue) {
    return json.isMember(key) && json[key].isInt() ? json[key].asInt() : defaultValue;
}

template<>
std::string ConfigParser::safeGetValue<std::string>(const Json::Value& json, const std::string& key, const std::string& defaultValue) {
    return json.isMember(key) && json[key].isString() ? json[key].asString() : defaultValue;
}

// =================== 公共接口实现 ===================

// 配置在日志初始化之前加载，这里的错误直接输出到 stderr
bool ConfigParser::loadFromFile(const std::string& filepath) {
    try {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            std::cerr << "Failed to open config file: " << filepath << std::endl;
            return false;
        }

        Json::CharReaderBuilder builder;
        Json::Value root;
        std::string errs;

        if (!Json::parseFromStream(builder, file, &root, &errs)) {
            std::cerr << "Failed to parse JSON: " << errs << std::endl;
            return false;
        }
        if (!root.isObject()) {
            std::cerr << "Config file is not a JSON object: " << filepath << std::endl;
            return false;
        }

        applyRoot(root);
        LOG_DEBUG("Configuration loaded successfully from: ", filepath);
        return true;
    }
    catch (const std::exception& e) {
        std::cerr << "Exception while loading config: " << e.what() << std::endl;
        return false;
    }
}

bool ConfigParser::saveToFile(const std::string& filepath) {
    try {
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());

        std::ofstream file(filepath);
        if (!file.is_open()) {
            std::cerr << "Failed to open file for writing: " << filepath << std::endl;
            return false;
        }

        writer->write(buildRoot(), &file);
        file << std::endl;
        LOG_INFO("Configuration saved successfully to: ", filepath);
        return true;
    }
    catch (const std::exception& e) {
        std::cerr << "Exception while saving config: " << e.what() << std::endl;
        return false;
    }
}

bool ConfigParser::loadFromString(const std::string& jsonStr) {
    try {
        Json::CharReaderBuilder builder;
        Json::Value root;
        std::string errs;
        std::istringstream stream(jsonStr);

        if (!Json::parseFromStream(builder, stream, &root, &errs)) {
            std::cerr << "Failed to parse JSON string: " << errs << std::endl;
            return false;
        }
        if (!root.isObject()) {
            std::cerr << "Config string is not a JSON object" << std::endl;
            return false;
        }

        applyRoot(root);
        LOG_DEBUG("Configuration loaded successfully from JSON string");
        return true;
    }
    catch (const std::exception& e) {
        std::cerr << "Exception while loading config from string: " << e.what() << std::endl;
        return false;
    }
}

std::string ConfigParser::saveToString() {
    try {
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        return Json::writeString(builder, buildRoot());
    }
    catch (const std::exception& e) {
        std::cerr << "Exception while converting config to string: " << e.what() << std::endl;
        return "";
    }
}

// =================== 解析方法实现 ===================

void ConfigParser::applyRoot(const Json::Value& root) {
    auto& configHelper = ConfigHelper::getInstance();

    if (root.isMember("scan")) {
        parseScanConfig(root["scan"], configHelper.scanConfig);
    }
    if (root.isMember("api")) {
        parseApiConfig(root["api"], configHelper.apiConfig);
    }
    if (root.isMember("session")) {
        parseSessionConfig(root["session"], configHelper.sessionConfig);
    }
    if (root.isMember("logger")) {
        parseLoggerConfig(root["logger"], configHelper.loggerConfig);
    }
}

Json::Value ConfigParser::buildRoot() {
    auto& configHelper = ConfigHelper::getInstance();

    Json::Value root;
    root["scan"] = scanConfigToJson(configHelper.scanConfig);
    root["api"] = apiConfigToJson(configHelper.apiConfig);
    root["session"] = sessionConfigToJson(configHelper.sessionConfig);
    root["logger"] = loggerConfigToJson(configHelper.loggerConfig);
    return root;
}

void ConfigParser::parseScanConfig(const Json::Value& json, ConfigHelper::ScanConfig& config) {
    config.scanTimeoutMs = safeGetValue(json, "scanTimeoutMs", config.scanTimeoutMs);
}

void ConfigParser::parseApiConfig(const Json::Value& json, ConfigHelper::ApiConfig& config) {
    config.requestTimeoutMs = safeGetValue(json, "requestTimeoutMs", config.requestTimeoutMs);
}

void ConfigParser::parseSessionConfig(const Json::Value& json, ConfigHelper::SessionConfig& config) {
    config.sessionFile = safeGetValue(json, "sessionFile", config.sessionFile);
}

void ConfigParser::parseLoggerConfig(const Json::Value& json, ConfigHelper::LoggerConfig& config) {
    if (json.isMember("logLevel")) {
        const Json::Value& level = json["logLevel"];
        if (level.isInt()) {
            int value = level.asInt();
            if (value >= 0 && value <= static_cast<int>(Logger::Level::OFF)) {
                config.logLevel = static_cast<Logger::Level>(value);
            }
        } else if (level.isString()) {
            config.logLevel = Logger::parseLevel(level.asString(), config.logLevel);
        }
    }
    config.enableConsole = safeGetValue(json, "enableConsole", config.enableConsole);
    config.enableFileLogging = safeGetValue(json, "enableFileLogging", config.enableFileLogging);
    config.logDirectory = safeGetValue(json, "logDirectory", config.logDirectory);
}

// =================== 序列化方法实现 ===================

Json::Value ConfigParser::scanConfigToJson(const ConfigHelper::ScanConfig& config) {
    Json::Value json;
    json["scanTimeoutMs"] = config.scanTimeoutMs;
    return json;
}

Json::Value ConfigParser::apiConfigToJson(const ConfigHelper::ApiConfig& config) {
    Json::Value json;
    json["requestTimeoutMs"] = config.requestTimeoutMs;
    return json;
}

Json::Value ConfigParser::sessionConfigToJson(const ConfigHelper::SessionConfig& config) {
    Json::Value json;
    json["sessionFile"] = config.sessionFile;
    return json;
}

Json::Value ConfigParser::loggerConfigToJson(const ConfigHelper::LoggerConfig& config) {
    Json::Value json;
    json["logLevel"] = Logger::levelName(config.logLevel);
    json["enableConsole"] = config.enableConsole;
    json["enableFileLogging"] = config.enableFileLogging;
    json["logDirectory"] = config.logDirectory;
    return json;
}
