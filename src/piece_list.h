#pragma once

/**
 * @file piece_list.h
 * @brief Ordered list of pieces with download readiness states
 *
 * The list is shared between the download engine, which moves pieces
 * through their states, and readers, which query states and block until
 * the piece they need is finished.
 */

#include "stream_types.h"
#include "cancellation.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace piecestream {

/**
 * @brief Snapshot of one piece
 *
 * `offset` is the start of the piece in piece space, i.e. the byte offset
 * from the start of the torrent's data.
 */
struct Piece {
    uint32_t piece_index;
    int64_t offset;
    int64_t size;
    PieceState state;
    
    Piece() : piece_index(0), offset(0), size(0), state(PieceState::NotReady) {}
    Piece(uint32_t index, int64_t off, int64_t sz, PieceState st)
        : piece_index(index), offset(off), size(sz), state(st) {}
    
    int64_t end() const { return offset + size; }
};

/**
 * @brief Contiguous, non-overlapping pieces sorted by index
 *
 * Piece i covers [offset(i), offset(i) + size(i)). The first piece starts at
 * `initial_data_offset`, which lets a list describe only the pieces of one
 * file inside a larger torrent.
 *
 * Offsets and sizes are immutable after construction; states are guarded
 * by an internal mutex. Thread-safe.
 */
class PieceList {
public:
    /**
     * @brief Split `total_size` bytes into pieces of `piece_length`
     *
     * The last piece holds the remainder and may be shorter.
     *
     * @throws std::invalid_argument on negative sizes or a non-positive piece length
     */
    PieceList(int64_t total_size, int64_t piece_length, int64_t initial_data_offset = 0);
    
    /**
     * @brief Build a list from explicit piece sizes
     * @throws std::invalid_argument if any size is negative
     */
    PieceList(const std::vector<int64_t>& piece_sizes, int64_t initial_data_offset);
    
    PieceList(const PieceList&) = delete;
    PieceList& operator=(const PieceList&) = delete;
    
    //=========================================================================
    // Layout
    //=========================================================================
    
    size_t piece_count() const { return offsets_.size(); }
    bool empty() const { return offsets_.empty(); }
    
    int64_t offset(size_t index) const { return offsets_.at(index); }
    int64_t size(size_t index) const { return sizes_.at(index); }
    
    int64_t initial_data_offset() const { return initial_data_offset_; }
    int64_t total_size() const { return total_size_; }
    
    /// One past the last byte covered by the list, in piece space
    int64_t end_offset() const { return initial_data_offset_ + total_size_; }
    
    /**
     * @brief Index of the piece containing a piece-space offset
     *
     * Offsets before the first piece map to 0 and offsets at or past the
     * end map to the last piece.
     */
    size_t index_of_offset(int64_t offset) const;
    
    //=========================================================================
    // States
    //=========================================================================
    
    Piece piece_at(size_t index) const;
    
    PieceState state(size_t index) const;
    bool is_finished(size_t index) const { return state(index) == PieceState::Finished; }
    
    /// Update a piece's state and wake every waiter
    void set_state(size_t index, PieceState state);
    
    void set_all_states(PieceState state);
    
    std::vector<PieceState> states_snapshot() const;
    
    size_t finished_count() const;
    bool is_all_finished() const;
    
    /**
     * @brief Block until the piece is finished
     *
     * @param index Piece index within this list
     * @param token Cancels the wait from another thread
     * @param timeout Zero waits forever
     * @throws OperationCancelled if the token fires first
     * @throws PieceWaitTimeout if the timeout elapses first
     * @throws std::out_of_range on a bad index
     */
    void await_finished(size_t index,
                        const CancellationToken& token = CancellationToken(),
                        std::chrono::milliseconds timeout = std::chrono::milliseconds(0)) const;

private:
    struct WaitState {
        std::mutex mutex;
        std::condition_variable cv;
        std::vector<PieceState> states;
    };
    
    void check_index(size_t index) const;
    
    std::vector<int64_t> offsets_;
    std::vector<int64_t> sizes_;
    int64_t initial_data_offset_;
    int64_t total_size_;
    
    // Shared with cancellation callbacks, which may outlive a wait
    std::shared_ptr<WaitState> wait_;
};

} // namespace piecestream
