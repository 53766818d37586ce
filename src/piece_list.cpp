#include "piece_list.h"
#include "stream_errors.h"
#include "stream_log_macros.h"

#include <algorithm>
#include <stdexcept>

namespace piecestream {

//=============================================================================
// Constructors
//=============================================================================

PieceList::PieceList(int64_t total_size, int64_t piece_length, int64_t initial_data_offset)
    : initial_data_offset_(initial_data_offset)
    , total_size_(0)
    , wait_(std::make_shared<WaitState>()) {
    if (total_size < 0) {
        throw std::invalid_argument("total_size must not be negative");
    }
    if (piece_length <= 0) {
        throw std::invalid_argument("piece_length must be positive");
    }
    
    size_t num_pieces = static_cast<size_t>((total_size + piece_length - 1) / piece_length);
    offsets_.reserve(num_pieces);
    sizes_.reserve(num_pieces);
    
    int64_t remaining = total_size;
    int64_t offset = initial_data_offset;
    while (remaining > 0) {
        int64_t size = (std::min)(remaining, piece_length);
        offsets_.push_back(offset);
        sizes_.push_back(size);
        offset += size;
        remaining -= size;
    }
    
    total_size_ = total_size;
    wait_->states.assign(offsets_.size(), PieceState::NotReady);
}

PieceList::PieceList(const std::vector<int64_t>& piece_sizes, int64_t initial_data_offset)
    : initial_data_offset_(initial_data_offset)
    , total_size_(0)
    , wait_(std::make_shared<WaitState>()) {
    offsets_.reserve(piece_sizes.size());
    sizes_.reserve(piece_sizes.size());
    
    int64_t offset = initial_data_offset;
    for (int64_t size : piece_sizes) {
        if (size < 0) {
            throw std::invalid_argument("piece size must not be negative");
        }
        offsets_.push_back(offset);
        sizes_.push_back(size);
        offset += size;
    }
    
    total_size_ = offset - initial_data_offset;
    wait_->states.assign(offsets_.size(), PieceState::NotReady);
}

//=============================================================================
// Layout
//=============================================================================

size_t PieceList::index_of_offset(int64_t offset) const {
    if (offsets_.empty()) {
        return 0;
    }
    
    // First piece starting after `offset`; the one before it contains it
    auto it = std::upper_bound(offsets_.begin(), offsets_.end(), offset);
    if (it == offsets_.begin()) {
        return 0;
    }
    return static_cast<size_t>(std::distance(offsets_.begin(), it) - 1);
}

//=============================================================================
// States
//=============================================================================

void PieceList::check_index(size_t index) const {
    if (index >= offsets_.size()) {
        throw std::out_of_range("piece index " + std::to_string(index) +
                                " out of range (" + std::to_string(offsets_.size()) + " pieces)");
    }
}

Piece PieceList::piece_at(size_t index) const {
    check_index(index);
    return Piece(static_cast<uint32_t>(index), offsets_[index], sizes_[index], state(index));
}

PieceState PieceList::state(size_t index) const {
    check_index(index);
    std::lock_guard<std::mutex> lock(wait_->mutex);
    return wait_->states[index];
}

void PieceList::set_state(size_t index, PieceState state) {
    check_index(index);
    {
        std::lock_guard<std::mutex> lock(wait_->mutex);
        if (wait_->states[index] == state) {
            return;
        }
        wait_->states[index] = state;
    }
    LOG_PIECES_DEBUG("Piece " << index << " -> " << piece_state_to_string(state));
    wait_->cv.notify_all();
}

void PieceList::set_all_states(PieceState state) {
    {
        std::lock_guard<std::mutex> lock(wait_->mutex);
        std::fill(wait_->states.begin(), wait_->states.end(), state);
    }
    wait_->cv.notify_all();
}

std::vector<PieceState> PieceList::states_snapshot() const {
    std::lock_guard<std::mutex> lock(wait_->mutex);
    return wait_->states;
}

size_t PieceList::finished_count() const {
    std::lock_guard<std::mutex> lock(wait_->mutex);
    return static_cast<size_t>(std::count(wait_->states.begin(), wait_->states.end(),
                                          PieceState::Finished));
}

bool PieceList::is_all_finished() const {
    return finished_count() == piece_count();
}

void PieceList::await_finished(size_t index, const CancellationToken& token,
                               std::chrono::milliseconds timeout) const {
    check_index(index);
    
    std::shared_ptr<WaitState> wait = wait_;
    CancellationRegistration registration(token, [wait]() {
        // Taking the mutex orders the wakeup after the waiter's predicate check
        std::lock_guard<std::mutex> lock(wait->mutex);
        wait->cv.notify_all();
    });
    
    std::unique_lock<std::mutex> lock(wait->mutex);
    auto ready = [&]() {
        return wait->states[index] == PieceState::Finished || token.is_cancelled();
    };
    
    if (timeout.count() > 0) {
        if (!wait->cv.wait_for(lock, timeout, ready)) {
            LOG_PIECES_WARN("Timed out after " << timeout.count() << " ms waiting for piece " << index);
            throw PieceWaitTimeout("timed out waiting for piece " + std::to_string(index));
        }
    } else {
        wait->cv.wait(lock, ready);
    }
    
    if (wait->states[index] != PieceState::Finished) {
        throw OperationCancelled("wait for piece " + std::to_string(index) + " cancelled");
    }
}

} // namespace piecestream
