/**
 * @file stream_log_macros.h
 * @brief Module-tagged logging macros shared by the piecestream sources.
 *
 * In TESTING builds the stream macros embed the `this` pointer so that
 * log lines from different TorrentInput instances can be told apart.
 */

#ifndef PIECESTREAM_STREAM_LOG_MACROS_H
#define PIECESTREAM_STREAM_LOG_MACROS_H

#include "logger.h"

#ifdef TESTING
#define LOG_STREAM_DEBUG(message) LOG_DEBUG("stream", "[pointer: " << this << "] " << message)
#define LOG_STREAM_INFO(message)  LOG_INFO("stream", "[pointer: " << this << "] " << message)
#define LOG_STREAM_WARN(message)  LOG_WARN("stream", "[pointer: " << this << "] " << message)
#define LOG_STREAM_ERROR(message) LOG_ERROR("stream", "[pointer: " << this << "] " << message)
#else
#define LOG_STREAM_DEBUG(message) LOG_DEBUG("stream", message)
#define LOG_STREAM_INFO(message)  LOG_INFO("stream", message)
#define LOG_STREAM_WARN(message)  LOG_WARN("stream", message)
#define LOG_STREAM_ERROR(message) LOG_ERROR("stream", message)
#endif

#define LOG_PIECES_DEBUG(message) LOG_DEBUG("pieces", message)
#define LOG_PIECES_WARN(message)  LOG_WARN("pieces", message)

#define LOG_FILE_DEBUG(message) LOG_DEBUG("file", message)
#define LOG_FILE_ERROR(message) LOG_ERROR("file", message)

#define LOG_CONFIG_INFO(message)  LOG_INFO("config", message)
#define LOG_CONFIG_WARN(message)  LOG_WARN("config", message)
#define LOG_CONFIG_ERROR(message) LOG_ERROR("config", message)

#endif // PIECESTREAM_STREAM_LOG_MACROS_H
