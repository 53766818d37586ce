#pragma once

/**
 * @file stream_config.h
 * @brief JSON configuration for streams and logging
 *
 * Example file:
 * @code
 * {
 *     "buffer_size": 8388608,
 *     "piece_wait_timeout_ms": 30000,
 *     "log_level": "info",
 *     "log_colors": true,
 *     "log_timestamps": true
 * }
 * @endcode
 */

#include "logger.h"
#include "stream_types.h"
#include "torrent_input.h"

#include <cstdint>
#include <string>

namespace piecestream {

struct StreamConfig {
    int64_t buffer_size = PS_DEFAULT_BUFFER_SIZE;
    int64_t piece_wait_timeout_ms = 0;      // 0 waits forever
    LogLevel log_level = LogLevel::INFO;
    bool log_colors = true;
    bool log_timestamps = true;
};

/**
 * @brief Parse "debug", "info", "warn"/"warning" or "error" (any case)
 * @return false for anything else; `level` is left untouched
 */
bool parse_log_level(const std::string& name, LogLevel& level);
const char* log_level_to_string(LogLevel level);

/**
 * @brief Load settings from a JSON file
 *
 * Keys missing from the file keep the values already in `config`.
 * Values of the wrong type or out of range are rejected.
 *
 * @return false if the file cannot be read or is invalid; errors are logged
 */
bool load_stream_config(const std::string& path, StreamConfig& config);

/// Write all settings to a JSON file
bool save_stream_config(const std::string& path, const StreamConfig& config);

/// Push the logging settings into the Logger
void apply_logging_config(const StreamConfig& config);

/// Copy the stream settings into a TorrentInputOptions
void apply_stream_config(const StreamConfig& config, TorrentInputOptions& options);

} // namespace piecestream
