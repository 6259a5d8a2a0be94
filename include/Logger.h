#pragma once
#include <string>
#include <fstream>
#include <mutex>

enum class LogLevel { DEBUG = 0, INFO, WARN, ERROR };

// 进程级日志, 输出到 stderr 和可选的日志文件
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void setLogFile(const std::string& path);
    void setLevel(LogLevel level);
    LogLevel level() const { return level_; }

    void log(LogLevel level, const std::string& msg);

    static LogLevel parseLevel(const std::string& name);

private:
    Logger() = default;
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::ofstream file_;
    LogLevel level_ = LogLevel::INFO;
    std::mutex mu_;
};

#define LOG_DEBUG(msg) Logger::instance().log(LogLevel::DEBUG, (msg))
#define LOG_INFO(msg)  Logger::instance().log(LogLevel::INFO, (msg))
#define LOG_WARN(msg)  Logger::instance().log(LogLevel::WARN, (msg))
#define LOG_ERROR(msg) Logger::instance().log(LogLevel::ERROR, (msg))
