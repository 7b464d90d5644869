#pragma once

#include <memory>
#include <string>
#include <sstream>
#include <spdlog/spdlog.h>

/**
 * @brief 日志管理器 - 基于spdlog的单例模式
 *
 * 设计原则：
 * - 支持参数串联风格：LOG_INFO("Found ", count, " device(s)")
 * - 线程安全：扫描工作线程与主线程共用同一个logger
 * - 未初始化时日志被丢弃，库代码和单元测试可以随意调用
 * - 析构函数不抛异常
 */
class Logger {
public:
    /**
     * @brief 日志级别枚举
     */
    enum class Level {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        ERROR = 3,
        OFF = 4
    };

    /**
     * @brief 获取单例实例
     */
    static Logger& getInstance();

    /**
     * @brief 初始化日志系统
     * @param level 日志级别
     * @param enableConsole 是否启用控制台输出
     * @param logFilePath 日志文件路径（空字符串表示不输出到文件）
     */
    bool initialize(Level level = Level::INFO,
                   bool enableConsole = true,
                   const std::string& logFilePath = "");

    /**
     * @brief 高级初始化日志系统 - 支持目录路径和自动文件名生成
     * @param level 日志级别
     * @param enableConsole 是否启用控制台输出
     * @param enableFileLogging 是否启用文件日志
     * @param logDirectory 日志目录路径（空字符串表示当前目录下的logs/）
     * @param filePrefix 日志文件前缀（默认为"leaflink"）
     * @param useTimestamp 是否在文件名中添加时间戳
     */
    bool initializeAdvanced(Level level = Level::INFO,
                          bool enableConsole = true,
                          bool enableFileLogging = true,
                          const std::string& logDirectory = "",
                          const std::string& filePrefix = "leaflink",
                          bool useTimestamp = true);

    bool isInitialized() const { return initialized_; }

    template<typename... Args>
    void debug(Args&&... args) {
        if (logger_) {
            logger_->debug(buildMessage(std::forward<Args>(args)...));
        }
    }

    template<typename... Args>
    void info(Args&&... args) {
        if (logger_) {
            logger_->info(buildMessage(std::forward<Args>(args)...));
        }
    }

    template<typename... Args>
    void warn(Args&&... args) {
        if (logger_) {
            logger_->warn(buildMessage(std::forward<Args>(args)...));
        }
    }

    template<typename... Args>
    void error(Args&&... args) {
        if (logger_) {
            logger_->error(buildMessage(std::forward<Args>(args)...));
        }
    }

    /**
     * @brief 设置日志级别
     */
    void setLevel(Level level);

    /**
     * @brief 刷新日志缓冲区
     */
    void flush();

    /**
     * @brief 从字符串解析日志级别（"DEBUG"/"INFO"/"WARN"/"ERROR"/"OFF"）
     * @param levelStr 级别字符串，大小写不敏感
     * @param fallback 无法识别时返回的级别
     */
    static Level parseLevel(const std::string& levelStr, Level fallback = Level::INFO);

    /**
     * @brief 日志级别转字符串
     */
    static std::string levelName(Level level);

    /**
     * @brief 获取进程名字（使用 __progname 全局变量）
     * @return 进程名字字符串
     */
    static std::string getProcessName();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::shared_ptr<spdlog::logger> logger_;
    bool initialized_ = false;

    spdlog::level::level_enum toSpdlogLevel(Level level) const;

    template<typename... Args>
    std::string buildMessage(Args&&... args) {
        std::ostringstream oss;
        (oss << ... << args);
        return oss.str();
    }
};

#define LOG_DEBUG(...) Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) Logger::getInstance().error(__VA_ARGS__)
