#pragma once
#include "cancellation.hpp"
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <algorithm>

namespace agentgate {

// Counting semaphore that admits waiters strictly in arrival order.
class ConcurrencyLimiter {
public:
    explicit ConcurrencyLimiter(int max_concurrent)
        : max_(max_concurrent < 1 ? 1 : max_concurrent) {}

    // Blocks until a slot is free and every earlier waiter has been served.
    // Returns false when cancelled while queued.
    bool acquire(const CancellationToken& cancel) {
        CancelScope wake(cancel, [this] {
            std::lock_guard<std::mutex> lock(mutex_);
            cv_.notify_all();
        });

        std::unique_lock<std::mutex> lock(mutex_);
        uint64_t ticket = next_ticket_++;
        waiting_.push_back(ticket);

        cv_.wait(lock, [&] {
            return cancel.is_cancelled() || (waiting_.front() == ticket && active_ < max_);
        });

        if (cancel.is_cancelled()) {
            waiting_.erase(std::find(waiting_.begin(), waiting_.end(), ticket));
            cv_.notify_all();
            return false;
        }

        waiting_.pop_front();
        active_++;
        cv_.notify_all();
        return true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (active_ > 0) active_--;
        }
        cv_.notify_all();
    }

    int active() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return active_;
    }

    int queued() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(waiting_.size());
    }

    int capacity() const { return max_; }

private:
    const int max_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    int active_ = 0;
    uint64_t next_ticket_ = 0;
    std::deque<uint64_t> waiting_;
};

// RAII slot
class Permit {
public:
    Permit() = default;
    explicit Permit(ConcurrencyLimiter* limiter) : limiter_(limiter) {}
    ~Permit() { if (limiter_) limiter_->release(); }
    Permit(Permit&& o) noexcept : limiter_(o.limiter_) { o.limiter_ = nullptr; }
    Permit& operator=(Permit&& o) noexcept {
        if (this != &o) {
            if (limiter_) limiter_->release();
            limiter_ = o.limiter_;
            o.limiter_ = nullptr;
        }
        return *this;
    }
    Permit(const Permit&) = delete;
    Permit& operator=(const Permit&) = delete;
private:
    ConcurrencyLimiter* limiter_ = nullptr;
};

} // namespace agentgate
