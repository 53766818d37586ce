#include "stream_config.h"
#include "fs.h"
#include "stream_log_macros.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>

namespace piecestream {

bool parse_log_level(const std::string& name, LogLevel& level) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    
    if (lower == "debug") {
        level = LogLevel::DEBUG;
    } else if (lower == "info") {
        level = LogLevel::INFO;
    } else if (lower == "warn" || lower == "warning") {
        level = LogLevel::WARN;
    } else if (lower == "error") {
        level = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}

const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO:  return "info";
        case LogLevel::WARN:  return "warn";
        case LogLevel::ERROR: return "error";
        default: return "info";
    }
}

bool load_stream_config(const std::string& path, StreamConfig& config) {
    LOG_CONFIG_INFO("Loading configuration from " << path);
    
    std::string config_data;
    if (!read_file_text(path.c_str(), config_data)) {
        LOG_CONFIG_ERROR("Failed to read configuration file " << path);
        return false;
    }
    if (config_data.empty()) {
        LOG_CONFIG_ERROR("Configuration file is empty");
        return false;
    }
    
    StreamConfig loaded = config;
    try {
        nlohmann::json json = nlohmann::json::parse(config_data);
        if (!json.is_object()) {
            LOG_CONFIG_ERROR("Configuration root must be an object");
            return false;
        }
        
        loaded.buffer_size = json.value("buffer_size", loaded.buffer_size);
        loaded.piece_wait_timeout_ms = json.value("piece_wait_timeout_ms", loaded.piece_wait_timeout_ms);
        loaded.log_colors = json.value("log_colors", loaded.log_colors);
        loaded.log_timestamps = json.value("log_timestamps", loaded.log_timestamps);
        
        if (json.contains("log_level")) {
            std::string level_name = json.at("log_level").get<std::string>();
            if (!parse_log_level(level_name, loaded.log_level)) {
                LOG_CONFIG_ERROR("Unknown log level: " << level_name);
                return false;
            }
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_CONFIG_ERROR("Failed to parse configuration file: " << e.what());
        return false;
    }
    
    if (loaded.buffer_size <= 0) {
        LOG_CONFIG_ERROR("buffer_size must be positive, got " << loaded.buffer_size);
        return false;
    }
    if (loaded.piece_wait_timeout_ms < 0) {
        LOG_CONFIG_ERROR("piece_wait_timeout_ms must not be negative, got " << loaded.piece_wait_timeout_ms);
        return false;
    }
    
    config = loaded;
    LOG_CONFIG_INFO("Loaded configuration: buffer size " << config.buffer_size
                    << ", piece wait timeout " << config.piece_wait_timeout_ms << " ms"
                    << ", log level " << log_level_to_string(config.log_level));
    return true;
}

bool save_stream_config(const std::string& path, const StreamConfig& config) {
    nlohmann::json json;
    json["buffer_size"] = config.buffer_size;
    json["piece_wait_timeout_ms"] = config.piece_wait_timeout_ms;
    json["log_level"] = log_level_to_string(config.log_level);
    json["log_colors"] = config.log_colors;
    json["log_timestamps"] = config.log_timestamps;
    
    if (!create_file(path, json.dump(4))) {
        LOG_CONFIG_ERROR("Failed to save configuration to " << path);
        return false;
    }
    return true;
}

void apply_logging_config(const StreamConfig& config) {
    Logger& logger = Logger::getInstance();
    logger.set_log_level(config.log_level);
    logger.set_colors_enabled(config.log_colors);
    logger.set_timestamps_enabled(config.log_timestamps);
}

void apply_stream_config(const StreamConfig& config, TorrentInputOptions& options) {
    options.buffer_size = config.buffer_size;
    options.piece_wait_timeout = std::chrono::milliseconds(config.piece_wait_timeout_ms);
}

} // namespace piecestream
