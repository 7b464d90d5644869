#include "utils/Logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

// 获取进程名的全局变量
extern char* __progname;

namespace {

constexpr size_t kMaxLogFileSize = 1024 * 1024 * 10;
constexpr size_t kMaxLogFiles = 3;
const char* const kConsolePattern = "[%Y-%m-%d %H:%M:%S.%e][%^%l%$][%t] %v";
const char* const kFilePattern = "[%Y-%m-%d %H:%M:%S.%e][%l][%t] %v";

}  // namespace

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    try {
        if (logger_) {
            logger_->flush();
            logger_.reset();
        }
    } catch (const std::exception& e) {
        std::cerr << "Logger flush failed during shutdown: " << e.what() << std::endl;
    }
}

bool Logger::initialize(Level level, bool enableConsole, const std::string& logFilePath) {
    if (initialized_) {
        return true;
    }

    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (enableConsole) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern(kConsolePattern);
            sinks.push_back(console_sink);
        }

        if (!logFilePath.empty()) {
            auto dir = std::filesystem::path(logFilePath).parent_path();
            if (!dir.empty()) {
                std::filesystem::create_directories(dir);
            }

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFilePath, kMaxLogFileSize, kMaxLogFiles);
            file_sink->set_pattern(kFilePattern);
            sinks.push_back(file_sink);
        }

        // 没有任何sink时消息被丢弃
        logger_ = std::make_shared<spdlog::logger>("leaflink", begin(sinks), end(sinks));

        setLevel(level);
        logger_->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(logger_);

        initialized_ = true;

        info("Logger initialized - level: ", levelName(level),
             ", console: ", enableConsole, ", file: ", logFilePath.empty() ? "disabled" : logFilePath);
        return true;

    } catch (const std::exception& e) {
        // 初始化失败时退回到简单的控制台logger
        try {
            logger_ = spdlog::stdout_color_mt("leaflink_fallback");
            logger_->error("Logger initialization failed: {}, using fallback console logger", e.what());
            initialized_ = true;
            return true;
        } catch (const spdlog::spdlog_ex& fallbackError) {
            std::cerr << "Fallback logger creation failed: " << fallbackError.what() << std::endl;
            return false;
        }
    }
}

bool Logger::initializeAdvanced(Level level, bool enableConsole, bool enableFileLogging,
                               const std::string& logDirectory, const std::string& filePrefix,
                               bool useTimestamp) {
    if (initialized_) {
        return true;
    }

    std::string actualLogFile;
    if (enableFileLogging) {
        std::string logDir = logDirectory.empty() ? "logs/" : logDirectory;
        if (logDir.back() != '/') {
            logDir += '/';
        }

        try {
            std::filesystem::create_directories(logDir);
        } catch (const std::filesystem::filesystem_error& e) {
            // logger还未就绪，只能写stderr；目录不可用时放弃文件日志
            std::cerr << "Failed to create log directory: " << logDir << " - " << e.what() << std::endl;
            enableFileLogging = false;
        }

        if (enableFileLogging) {
            std::string baseName = getProcessName();
            if (baseName.empty() || baseName == "unknown") {
                baseName = filePrefix.empty() ? "leaflink" : filePrefix;
            }

            std::string fileName = baseName;
            if (useTimestamp) {
                auto now = std::chrono::system_clock::now();
                auto time_t = std::chrono::system_clock::to_time_t(now);
                std::ostringstream ss;
                ss << baseName << "_" << std::put_time(std::localtime(&time_t), "%Y%m%d_%H%M%S");
                fileName = ss.str();
            }
            actualLogFile = logDir + fileName + ".log";
        }
    }

    return initialize(level, enableConsole, actualLogFile);
}

void Logger::setLevel(Level level) {
    if (logger_) {
        logger_->set_level(toSpdlogLevel(level));
    }
}

void Logger::flush() {
    if (logger_) {
        logger_->flush();
    }
}

Logger::Level Logger::parseLevel(const std::string& levelStr, Level fallback) {
    std::string upper = levelStr;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });

    if (upper == "DEBUG") return Level::DEBUG;
    if (upper == "INFO") return Level::INFO;
    if (upper == "WARN" || upper == "WARNING") return Level::WARN;
    if (upper == "ERROR") return Level::ERROR;
    if (upper == "OFF") return Level::OFF;
    return fallback;
}

std::string Logger::levelName(Level level) {
    switch (level) {
        case Level::DEBUG: return "DEBUG";
        case Level::INFO:  return "INFO";
        case Level::WARN:  return "WARN";
        case Level::ERROR: return "ERROR";
        case Level::OFF:   return "OFF";
        default:           return "INFO";
    }
}

spdlog::level::level_enum Logger::toSpdlogLevel(Level level) const {
    switch (level) {
        case Level::DEBUG: return spdlog::level::debug;
        case Level::INFO:  return spdlog::level::info;
        case Level::WARN:  return spdlog::level::warn;
        case Level::ERROR: return spdlog::level::err;
        case Level::OFF:   return spdlog::level::off;
        default:           return spdlog::level::info;
    }
}

std::string Logger::getProcessName() {
    if (__progname && std::strlen(__progname) > 0) {
        return std::string(__progname);
    }
    return "leaflink";
}
