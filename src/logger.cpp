#include "logger.h"

#include <cstdio>
#include <ctime>

namespace piecestream {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : min_level_(LogLevel::INFO)
    , colors_enabled_(true)
    , timestamps_enabled_(true)
    , is_terminal_(isatty(fileno(stdout)) != 0) {
}

void Logger::log(LogLevel level, const std::string& module, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (level < min_level_) {
        return;
    }
    
    std::ostringstream oss;
    
    if (timestamps_enabled_) {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        
        std::tm local_tm{};
        localtime_r(&time_t, &local_tm);
        oss << "[" << std::put_time(&local_tm, "%H:%M:%S");
        oss << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";
    }
    
    oss << color_code(level) << "[" << level_string(level) << "]" << reset_code();
    
    if (!module.empty()) {
        oss << " " << module_color(module) << "[" << module << "]" << reset_code();
    }
    
    oss << " " << message << std::endl;
    
    if (level >= LogLevel::ERROR) {
        std::cerr << oss.str();
        std::cerr.flush();
    } else {
        std::cout << oss.str();
        std::cout.flush();
    }
}

const char* Logger::level_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

std::string Logger::color_code(LogLevel level) const {
    if (!colors_enabled_ || !is_terminal_) return "";
    
    switch (level) {
        case LogLevel::DEBUG: return "\033[36m";  // Cyan
        case LogLevel::INFO:  return "\033[32m";  // Green
        case LogLevel::WARN:  return "\033[33m";  // Yellow
        case LogLevel::ERROR: return "\033[31m";  // Red
        default: return "";
    }
}

std::string Logger::module_color(const std::string& module) const {
    if (!colors_enabled_ || !is_terminal_) return "";
    
    static const char* colors[] = {
        "\033[35m",  // Magenta
        "\033[94m",  // Bright Blue
        "\033[95m",  // Bright Magenta
        "\033[96m",  // Bright Cyan
        "\033[93m",  // Bright Yellow
        "\033[92m",  // Bright Green
        "\033[38;5;208m", // Orange
        "\033[38;5;141m", // Purple
    };
    
    // djb2
    uint32_t hash = 5381;
    for (char c : module) {
        hash = ((hash << 5) + hash) + static_cast<uint8_t>(c);
    }
    return colors[hash % (sizeof(colors) / sizeof(colors[0]))];
}

std::string Logger::reset_code() const {
    if (!colors_enabled_ || !is_terminal_) return "";
    return "\033[0m";
}

} // namespace piecestream
