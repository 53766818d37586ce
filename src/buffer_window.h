#pragma once

/**
 * @file buffer_window.h
 * @brief Single reusable read-ahead / read-behind buffer
 *
 * The window caches one contiguous range of stream bytes. Moving it to a
 * new range keeps every byte the two ranges share and fetches only the
 * missing head and tail.
 */

#include "stream_types.h"

#include <cstdint>
#include <cstddef>
#include <functional>
#include <vector>

namespace piecestream {

/**
 * @brief Reads needed to move a window from one range to another
 */
struct RefillPlan {
    ByteRange keep;                 ///< Bytes reused from the current window (may be empty)
    std::vector<ByteRange> reads;   ///< Ranges to fetch, in ascending order
    
    bool is_noop() const { return reads.empty(); }
};

/**
 * @brief Plan the move of a window from `current` to `want`
 *
 * - No overlap (or empty current): one read covering `want`.
 * - Overlap: `keep` is the intersection; a head read covers
 *   [want.start, keep.start) and a tail read covers [keep.end, want.end),
 *   each only when non-empty. A `want` inside `current` needs no read.
 */
RefillPlan plan_refill(const ByteRange& current, const ByteRange& want);

/**
 * @brief Owner of the buffered bytes
 *
 * Bytes are stored in one vector indexed by `offset - range().start`.
 * Not thread-safe; TorrentInput serializes access.
 */
class BufferWindow {
public:
    /// Fill `range.length()` bytes at `dest` with the stream bytes of `range`
    using FetchFunction = std::function<void(const ByteRange& range, uint8_t* dest)>;
    
    /**
     * @param capacity_hint Bytes to reserve up front (typically twice the radius)
     */
    explicit BufferWindow(size_t capacity_hint = 0);
    
    const ByteRange& range() const { return range_; }
    bool contains(int64_t offset) const { return range_.contains(offset); }
    
    /**
     * @brief Move the window to `want`
     *
     * Kept bytes are moved to their new position inside the vector and only
     * the planned deltas are fetched. If a fetch throws the window is left
     * empty and the exception propagates.
     *
     * @return The plan that was executed
     */
    RefillPlan refill(const ByteRange& want, const FetchFunction& fetch);
    
    /**
     * @brief Copy buffered bytes starting at `offset`
     * @return Bytes copied; 0 when `offset` is outside the window
     */
    size_t copy_out(int64_t offset, uint8_t* dest, size_t max_length) const;
    
    /// Drop the contents and the memory
    void release();
    
    uint64_t fetch_count() const { return fetch_count_; }
    uint64_t bytes_fetched() const { return bytes_fetched_; }
    uint64_t bytes_reused() const { return bytes_reused_; }

private:
    std::vector<uint8_t> data_;
    ByteRange range_;
    
    uint64_t fetch_count_;
    uint64_t bytes_fetched_;
    uint64_t bytes_reused_;
};

} // namespace piecestream
