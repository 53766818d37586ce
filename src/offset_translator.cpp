#include "offset_translator.h"

#include <algorithm>
#include <stdexcept>

namespace piecestream {

OffsetTranslator::OffsetTranslator(std::shared_ptr<const PieceList> pieces,
                                   int64_t logical_start_offset,
                                   int64_t size)
    : pieces_(std::move(pieces))
    , logical_start_offset_(logical_start_offset)
    , size_(size) {
    if (!pieces_) {
        throw std::invalid_argument("piece list must not be null");
    }
    if (size_ < 0) {
        throw std::invalid_argument("stream size must not be negative");
    }
    if (logical_start_offset_ < pieces_->initial_data_offset()) {
        throw std::invalid_argument("stream starts before the first piece");
    }
}

size_t OffsetTranslator::find_piece_index(int64_t logical_offset) const {
    return pieces_->index_of_offset(to_physical(logical_offset));
}

ByteRange OffsetTranslator::piece_logical_range(size_t index) const {
    int64_t start = to_logical(pieces_->offset(index));
    int64_t end = start + pieces_->size(index);
    return ByteRange((std::max)(start, int64_t(0)), (std::min)(end, size_));
}

int64_t OffsetTranslator::compute_max_buffer_size_forward(int64_t from, int64_t max_size) const {
    if (from >= size_ || max_size <= 0 || pieces_->empty()) {
        return 0;
    }
    
    size_t index = find_piece_index(from);
    if (!pieces_->is_finished(index)) {
        return 0;
    }
    
    int64_t physical = to_physical(from);
    int64_t available = pieces_->offset(index) + pieces_->size(index) - physical;
    if (available < 0) {
        // Past the end of the last piece
        return 0;
    }
    
    size_t count = pieces_->piece_count();
    for (size_t i = index + 1; available < max_size && i < count; ++i) {
        if (!pieces_->is_finished(i)) {
            break;
        }
        available += pieces_->size(i);
    }
    
    return (std::min)({available, max_size, size_ - from});
}

int64_t OffsetTranslator::compute_max_buffer_size_backward(int64_t from, int64_t max_size) const {
    if (from <= 0 || max_size <= 0 || pieces_->empty()) {
        return 0;
    }
    
    size_t index = find_piece_index(from);
    if (!pieces_->is_finished(index)) {
        return 0;
    }
    
    int64_t physical = to_physical(from);
    int64_t available = physical - pieces_->offset(index);
    
    for (size_t i = index; available < max_size && i > 0; --i) {
        if (!pieces_->is_finished(i - 1)) {
            break;
        }
        available += pieces_->size(i - 1);
    }
    
    return (std::min)({available, max_size, from});
}

} // namespace piecestream
