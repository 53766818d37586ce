#pragma once

/**
 * @file offset_translator.h
 * @brief Mapping between stream (logical) offsets and piece space
 *
 * A stream is usually one file inside a torrent. Its first byte sits
 * `logical_start_offset` bytes into the piece space, so the first and last
 * pieces of the list may carry bytes that belong to neighbouring files.
 */

#include "piece_list.h"

#include <cstdint>
#include <memory>

namespace piecestream {

class OffsetTranslator {
public:
    /**
     * @param pieces Pieces covering the stream
     * @param logical_start_offset Piece-space offset of stream byte 0
     * @param size Declared length of the stream
     * @throws std::invalid_argument on a null list or negative size
     */
    OffsetTranslator(std::shared_ptr<const PieceList> pieces,
                     int64_t logical_start_offset,
                     int64_t size);
    
    int64_t logical_start_offset() const { return logical_start_offset_; }
    int64_t size() const { return size_; }
    const PieceList& pieces() const { return *pieces_; }
    
    int64_t to_physical(int64_t logical_offset) const { return logical_offset + logical_start_offset_; }
    int64_t to_logical(int64_t physical_offset) const { return physical_offset - logical_start_offset_; }
    
    /**
     * @brief Index of the piece holding a stream offset
     *
     * Binary search; clamps to the first and last piece. Non-decreasing in
     * its argument.
     */
    size_t find_piece_index(int64_t logical_offset) const;
    
    /**
     * @brief Stream range of a piece, clipped to [0, size)
     */
    ByteRange piece_logical_range(size_t index) const;
    
    /**
     * @brief Bytes readable from `from` onwards without touching an
     *        unfinished piece
     *
     * Zero when the piece holding `from` is not finished or `from` is at or
     * past the end of the stream. Capped at `max_size` and at the end of the
     * stream.
     */
    int64_t compute_max_buffer_size_forward(int64_t from, int64_t max_size) const;
    
    /**
     * @brief Bytes readable strictly before `from` without touching an
     *        unfinished piece
     *
     * Zero when the piece holding `from` is not finished, even if earlier
     * pieces are. Capped at `max_size` and at stream offset 0.
     */
    int64_t compute_max_buffer_size_backward(int64_t from, int64_t max_size) const;

private:
    std::shared_ptr<const PieceList> pieces_;
    int64_t logical_start_offset_;
    int64_t size_;
};

} // namespace piecestream
