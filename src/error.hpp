#pragma once

#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <stdexcept>
#include <string>

namespace logger {

enum class LogLevel : int { DEBUG = 0, NOTICE = 1, WARNING = 2, ERROR = 3 };

class Logger {
public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void setLevel(LogLevel level) { level_ = level; }
    LogLevel getLevel() const { return level_; }
    bool enabled(LogLevel level) const {
        return static_cast<int>(level) >= static_cast<int>(level_);
    }
    void setStream(FILE* fp) { fp_ = fp; }

    void write(LogLevel level, const std::string& msg);

private:
    Logger() = default;
    LogLevel level_ = LogLevel::NOTICE;
    FILE* fp_ = stderr;
    std::mutex mtx_;
};

} // namespace logger

std::string vformat(const char* fmt, va_list args);

// printf-style logging; error() logs and throws std::runtime_error
void debug(const char* fmt, ...);
void notice(const char* fmt, ...);
void warning(const char* fmt, ...);
[[noreturn]] void error(const char* fmt, ...);
