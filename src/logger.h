#pragma once

#include <string>
#include <iostream>
#include <mutex>
#include <sstream>
#include <chrono>
#include <iomanip>
#include <cstdint>
#include <unistd.h>

namespace piecestream {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * @brief Process-wide log sink shared by every stream and piece list
 *
 * Errors go to stderr, everything else to stdout. Each line carries an
 * optional timestamp, the level and the module tag of the caller.
 */
class Logger {
public:
    static Logger& getInstance();
    
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    
    void set_log_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }
    
    LogLevel log_level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return min_level_;
    }
    
    void set_colors_enabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        colors_enabled_ = enabled;
    }
    
    void set_timestamps_enabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        timestamps_enabled_ = enabled;
    }
    
    bool is_enabled(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return level >= min_level_;
    }
    
    void log(LogLevel level, const std::string& module, const std::string& message);

private:
    Logger();
    
    static const char* level_string(LogLevel level);
    std::string color_code(LogLevel level) const;
    std::string module_color(const std::string& module) const;
    std::string reset_code() const;
    
    mutable std::mutex mutex_;
    LogLevel min_level_;
    bool colors_enabled_;
    bool timestamps_enabled_;
    bool is_terminal_;
};

} // namespace piecestream

// Convenience macros; the message is a stream expression
#define LOG_DEBUG(module, message) \
    do { \
        if (piecestream::Logger::getInstance().is_enabled(piecestream::LogLevel::DEBUG)) { \
            std::ostringstream oss; \
            oss << message; \
            piecestream::Logger::getInstance().log(piecestream::LogLevel::DEBUG, module, oss.str()); \
        } \
    } while(0)

#define LOG_INFO(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        piecestream::Logger::getInstance().log(piecestream::LogLevel::INFO, module, oss.str()); \
    } while(0)

#define LOG_WARN(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        piecestream::Logger::getInstance().log(piecestream::LogLevel::WARN, module, oss.str()); \
    } while(0)

#define LOG_ERROR(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        piecestream::Logger::getInstance().log(piecestream::LogLevel::ERROR, module, oss.str()); \
    } while(0)
