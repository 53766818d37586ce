#pragma once

/**
 * @file stream_types.h
 * @brief Core types and constants for piecestream
 *
 * Piece readiness states, the half-open byte range used for the buffer
 * window, and default sizes.
 */

#include <algorithm>
#include <cstdint>
#include <ostream>
#include <string>

namespace piecestream {

//=============================================================================
// Constants
//=============================================================================

/// Default number of bytes buffered ahead of and behind the read position
constexpr int64_t PS_DEFAULT_BUFFER_SIZE = 8 * 1024 * 1024;

/// Default piece length (256 KB)
constexpr int64_t PS_DEFAULT_PIECE_LENGTH = 262144;

//=============================================================================
// Piece State
//=============================================================================

/**
 * @brief Download state of a piece, as reported by the download engine
 */
enum class PieceState : uint8_t {
    NotReady = 0,       ///< Not requested yet
    Downloading = 1,    ///< Blocks are in flight
    Failed = 2,         ///< Hash check failed, will be downloaded again
    Finished = 3        ///< Written to disk and verified
};

inline const char* piece_state_to_string(PieceState state) {
    switch (state) {
        case PieceState::NotReady:    return "NotReady";
        case PieceState::Downloading: return "Downloading";
        case PieceState::Failed:      return "Failed";
        case PieceState::Finished:    return "Finished";
        default: return "Unknown";
    }
}

//=============================================================================
// Byte Range
//=============================================================================

/**
 * @brief Half-open range [start, end) of stream offsets
 *
 * A default-constructed range is the empty sentinel [-1, -1).
 */
struct ByteRange {
    int64_t start;
    int64_t end;
    
    ByteRange() : start(-1), end(-1) {}
    ByteRange(int64_t s, int64_t e) : start(s), end(e) {}
    
    int64_t length() const { return end > start ? end - start : 0; }
    bool empty() const { return end <= start; }
    
    bool contains(int64_t pos) const { return pos >= start && pos < end; }
    
    /// Overlap with another range; the empty sentinel when there is none
    ByteRange intersect(const ByteRange& other) const {
        if (empty() || other.empty()) {
            return ByteRange();
        }
        int64_t s = (std::max)(start, other.start);
        int64_t e = (std::min)(end, other.end);
        if (s >= e) {
            return ByteRange();
        }
        return ByteRange(s, e);
    }
    
    bool operator==(const ByteRange& other) const {
        return start == other.start && end == other.end;
    }
    
    bool operator!=(const ByteRange& other) const {
        return !(*this == other);
    }
    
    std::string to_string() const {
        return "[" + std::to_string(start) + ", " + std::to_string(end) + ")";
    }
};

inline std::ostream& operator<<(std::ostream& os, const ByteRange& range) {
    return os << range.to_string();
}

} // namespace piecestream
