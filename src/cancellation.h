#pragma once

/**
 * @file cancellation.h
 * @brief Cooperative cancellation for blocking piece waits
 *
 * A CancellationSource owns the flag; CancellationTokens are cheap copies
 * handed to blocking calls. Waiters register a callback that wakes their
 * condition variable, so nothing has to poll the flag.
 */

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace piecestream {

namespace detail {

struct CancellationState {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    uint64_t next_id = 1;
    std::map<uint64_t, std::function<void()>> callbacks;
};

} // namespace detail

class CancellationToken {
public:
    /// A token that is never cancelled
    CancellationToken() = default;
    
    bool is_cancelled() const {
        return state_ && state_->cancelled.load();
    }
    
    bool can_be_cancelled() const { return state_ != nullptr; }
    
    /**
     * @brief Register a callback to run when the source is cancelled
     *
     * If the token is already cancelled the callback runs immediately on
     * the calling thread.
     *
     * @return Registration id for unregister_callback, 0 if nothing was kept
     */
    uint64_t register_callback(std::function<void()> callback) const;
    
    void unregister_callback(uint64_t id) const;

private:
    friend class CancellationSource;
    
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}
    
    std::shared_ptr<detail::CancellationState> state_;
};

class CancellationSource {
public:
    CancellationSource();
    
    CancellationToken token() const { return CancellationToken(state_); }
    
    /// Idempotent; callbacks run once, on the cancelling thread
    void cancel();
    
    bool is_cancelled() const { return state_->cancelled.load(); }

private:
    std::shared_ptr<detail::CancellationState> state_;
};

/**
 * @brief Scoped callback registration, unregistered on destruction
 */
class CancellationRegistration {
public:
    CancellationRegistration(const CancellationToken& token, std::function<void()> callback)
        : token_(token), id_(token.register_callback(std::move(callback))) {}
    
    ~CancellationRegistration() {
        if (id_ != 0) {
            token_.unregister_callback(id_);
        }
    }
    
    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;

private:
    CancellationToken token_;
    uint64_t id_;
};

} // namespace piecestream
