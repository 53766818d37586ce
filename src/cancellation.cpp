#include "cancellation.h"

#include <vector>

namespace piecestream {

//=============================================================================
// CancellationToken
//=============================================================================

uint64_t CancellationToken::register_callback(std::function<void()> callback) const {
    if (!state_ || !callback) {
        return 0;
    }
    
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled.load()) {
            uint64_t id = state_->next_id++;
            state_->callbacks.emplace(id, std::move(callback));
            return id;
        }
    }
    
    // Already cancelled: run outside the lock
    callback();
    return 0;
}

void CancellationToken::unregister_callback(uint64_t id) const {
    if (!state_ || id == 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->callbacks.erase(id);
}

//=============================================================================
// CancellationSource
//=============================================================================

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {
}

void CancellationSource::cancel() {
    std::vector<std::function<void()>> to_run;
    
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled.exchange(true)) {
            return;
        }
        for (auto& entry : state_->callbacks) {
            to_run.push_back(std::move(entry.second));
        }
        state_->callbacks.clear();
    }
    
    for (auto& callback : to_run) {
        callback();
    }
}

} // namespace piecestream
