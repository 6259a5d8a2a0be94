#include "Logger.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

static const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

void Logger::setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lk(mu_);
    if (file_.is_open()) file_.close();
    file_.open(path, std::ios::app);
    if (!file_) {
        std::cerr << "[WARN] cannot open log file: " << path << std::endl;
    }
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lk(mu_);
    level_ = level;
}

LogLevel Logger::parseLevel(const std::string& name) {
    if (name == "debug" || name == "DEBUG") return LogLevel::DEBUG;
    if (name == "warn" || name == "WARN") return LogLevel::WARN;
    if (name == "error" || name == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

void Logger::log(LogLevel level, const std::string& msg) {
    std::lock_guard<std::mutex> lk(mu_);
    if (level < level_) return;

    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tmUtc{};
    gmtime_r(&now, &tmUtc);

    std::ostringstream line;
    line << std::put_time(&tmUtc, "%F %T") << " [" << levelName(level) << "] " << msg;

    std::cerr << line.str() << std::endl;
    if (file_.is_open()) {
        file_ << line.str() << std::endl;
    }
}
