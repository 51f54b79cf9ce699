#ifndef kanboard_CORE_LOGGER_HPP
#define kanboard_CORE_LOGGER_HPP

#include <string>
#include <utility>
#include <cstdio>
#include <ctime>
#include <cstdarg>
#include <mutex>
#include <atomic>

namespace kanboard {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Parse "debug" / "info" / "warn" / "error". Unknown names map to INFO.
LogLevel parse_log_level(const std::string& name);

class Logger {
public:
    static Logger& instance();
    
    void set_level(LogLevel level);
    LogLevel level() const;
    
    // Disable ANSI colors (e.g. when stderr is redirected to a file)
    void set_color(bool enabled);
    
    void debug(const char* file, int line, const char* func, const char* fmt, ...);
    void info(const char* file, int line, const char* func, const char* fmt, ...);
    void warn(const char* file, int line, const char* func, const char* fmt, ...);
    void error(const char* file, int line, const char* func, const char* fmt, ...);

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);
    
    void log_impl(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args);
    
    std::atomic<LogLevel> level_;
    std::atomic<bool> color_;
    std::mutex mutex_;
};

// Convenience macros
#define LOG_DEBUG(...) kanboard::Logger::instance().debug(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_INFO(...)  kanboard::Logger::instance().info(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_WARN(...)  kanboard::Logger::instance().warn(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_ERROR(...) kanboard::Logger::instance().error(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)

} // namespace kanboard

#endif // kanboard_CORE_LOGGER_HPP
