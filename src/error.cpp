#include "error.hpp"
#include <chrono>
#include <ctime>
#include <vector>

namespace logger {

void Logger::write(LogLevel level, const std::string& msg) {
    if (!enabled(level)) return;
    const char* tag = "NOTICE";
    switch (level) {
        case LogLevel::DEBUG:   tag = "DEBUG"; break;
        case LogLevel::NOTICE:  tag = "NOTICE"; break;
        case LogLevel::WARNING: tag = "WARNING"; break;
        case LogLevel::ERROR:   tag = "ERROR"; break;
    }
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    char ts[32];
    std::strftime(ts, sizeof(ts), "%Y/%m/%d %H:%M:%S", std::localtime(&now));
    std::lock_guard<std::mutex> lock(mtx_);
    fprintf(fp_, "%s %s [%s] %s\n", "[tissueseg]", ts, tag, msg.c_str());
    fflush(fp_);
}

} // namespace logger

std::string vformat(const char* fmt, va_list args) {
    va_list copy;
    va_copy(copy, args);
    int n = vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);
    if (n < 0) return std::string(fmt);
    std::vector<char> buf(static_cast<size_t>(n) + 1);
    vsnprintf(buf.data(), buf.size(), fmt, args);
    return std::string(buf.data(), static_cast<size_t>(n));
}

void debug(const char* fmt, ...) {
    auto& log = logger::Logger::getInstance();
    if (!log.enabled(logger::LogLevel::DEBUG)) return;
    va_list args;
    va_start(args, fmt);
    std::string msg = vformat(fmt, args);
    va_end(args);
    log.write(logger::LogLevel::DEBUG, msg);
}

void notice(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    std::string msg = vformat(fmt, args);
    va_end(args);
    logger::Logger::getInstance().write(logger::LogLevel::NOTICE, msg);
}

void warning(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    std::string msg = vformat(fmt, args);
    va_end(args);
    logger::Logger::getInstance().write(logger::LogLevel::WARNING, msg);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    std::string msg = vformat(fmt, args);
    va_end(args);
    logger::Logger::getInstance().write(logger::LogLevel::ERROR, msg);
    throw std::runtime_error(msg);
}
