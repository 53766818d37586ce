#include "buffer_window.h"

#include <algorithm>
#include <cstring>

namespace piecestream {

//=============================================================================
// Planning
//=============================================================================

RefillPlan plan_refill(const ByteRange& current, const ByteRange& want) {
    RefillPlan plan;
    if (want.empty()) {
        return plan;
    }
    
    plan.keep = current.intersect(want);
    if (plan.keep.empty()) {
        plan.reads.push_back(want);
        return plan;
    }
    
    if (want.start < plan.keep.start) {
        plan.reads.emplace_back(want.start, plan.keep.start);
    }
    if (plan.keep.end < want.end) {
        plan.reads.emplace_back(plan.keep.end, want.end);
    }
    return plan;
}

//=============================================================================
// BufferWindow
//=============================================================================

BufferWindow::BufferWindow(size_t capacity_hint)
    : fetch_count_(0), bytes_fetched_(0), bytes_reused_(0) {
    data_.reserve(capacity_hint);
}

RefillPlan BufferWindow::refill(const ByteRange& want, const FetchFunction& fetch) {
    if (want == range_) {
        return RefillPlan{range_, {}};
    }
    if (want.empty()) {
        range_ = ByteRange();
        data_.clear();
        return RefillPlan();
    }

    RefillPlan plan = plan_refill(range_, want);
    size_t new_length = static_cast<size_t>(want.length());
    
    if (!plan.keep.empty()) {
        size_t src = static_cast<size_t>(plan.keep.start - range_.start);
        size_t dst = static_cast<size_t>(plan.keep.start - want.start);
        size_t keep_length = static_cast<size_t>(plan.keep.length());
        
        // Grow first so both source and destination are addressable
        if (data_.size() < new_length) {
            data_.resize(new_length);
        }
        if (src != dst) {
            std::memmove(data_.data() + dst, data_.data() + src, keep_length);
        }
        bytes_reused_ += keep_length;
    }
    data_.resize(new_length);
    range_ = want;
    
    try {
        for (const ByteRange& read : plan.reads) {
            fetch(read, data_.data() + (read.start - want.start));
            ++fetch_count_;
            bytes_fetched_ += static_cast<uint64_t>(read.length());
        }
    } catch (...) {
        // Contents are partially overwritten
        range_ = ByteRange();
        data_.clear();
        throw;
    }
    
    return plan;
}

size_t BufferWindow::copy_out(int64_t offset, uint8_t* dest, size_t max_length) const {
    if (!range_.contains(offset)) {
        return 0;
    }
    size_t start = static_cast<size_t>(offset - range_.start);
    size_t n = (std::min)(max_length, data_.size() - start);
    std::memcpy(dest, data_.data() + start, n);
    return n;
}

void BufferWindow::release() {
    range_ = ByteRange();
    data_.clear();
    data_.shrink_to_fit();
}

} // namespace piecestream
