#pragma once
#include "utils.hpp"
#include <atomic>
#include <condition_variable>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace agentgate {

// Shared cancellation flag threaded through every suspension point of an
// operation. Copies share state; cancel() is idempotent.
class CancellationToken {
public:
    using Callback = std::function<void()>;

    CancellationToken() : state_(std::make_shared<State>()) {}

    void cancel() {
        std::vector<Callback> to_run;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->cancelled.exchange(true)) return;
            for (auto& [_, cb] : state_->callbacks) to_run.push_back(cb);
            state_->callbacks.clear();
        }
        state_->cv.notify_all();
        for (auto& cb : to_run) cb();
    }

    bool is_cancelled() const { return state_->cancelled.load(); }

    // Runs immediately when already cancelled. Returns 0 in that case.
    int on_cancel(Callback cb) {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (!state_->cancelled) {
                int id = ++state_->next_id;
                state_->callbacks[id] = std::move(cb);
                return id;
            }
        }
        cb();
        return 0;
    }

    void remove_callback(int id) {
        if (id == 0) return;
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->callbacks.erase(id);
    }

    // Sleeps until the duration elapses or the token trips.
    // Returns false when cancelled.
    bool sleep_for(std::chrono::milliseconds d) const {
        std::unique_lock<std::mutex> lock(state_->mutex);
        return !state_->cv.wait_for(lock, d, [this] { return state_->cancelled.load(); });
    }

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        std::atomic<bool> cancelled{false};
        std::map<int, Callback> callbacks;
        int next_id = 0;
    };
    std::shared_ptr<State> state_;
};

// RAII registration of a cancel callback.
class CancelScope {
public:
    CancelScope(CancellationToken token, CancellationToken::Callback cb)
        : token_(std::move(token)), id_(token_.on_cancel(std::move(cb))) {}
    ~CancelScope() { token_.remove_callback(id_); }
    CancelScope(const CancelScope&) = delete;
    CancelScope& operator=(const CancelScope&) = delete;
private:
    CancellationToken token_;
    int id_;
};

enum class WaitStatus { ready, timed_out, cancelled };

template <typename T>
struct WaitResult {
    WaitStatus status = WaitStatus::timed_out;
    std::optional<T> value;
    std::exception_ptr error;   // set when fn threw

    bool ok() const { return status == WaitStatus::ready && !error && value.has_value(); }
};

// Runs fn on a detached worker and waits for it until the deadline or
// cancellation, whichever comes first. A late result is dropped; fn must
// own everything it touches.
template <typename T, typename Fn>
WaitResult<T> await_with_deadline(Fn fn, Deadline deadline, CancellationToken cancel) {
    struct Shared {
        std::mutex mutex;
        std::condition_variable cv;
        bool done = false;
        std::optional<T> value;
        std::exception_ptr error;
    };
    auto shared = std::make_shared<Shared>();

    std::thread([shared, fn = std::move(fn)]() mutable {
        std::optional<T> value;
        std::exception_ptr error;
        try {
            value.emplace(fn());
        } catch (...) {
            error = std::current_exception();
        }
        {
            std::lock_guard<std::mutex> lock(shared->mutex);
            shared->value = std::move(value);
            shared->error = error;
            shared->done = true;
        }
        shared->cv.notify_all();
    }).detach();

    CancelScope scope(cancel, [shared] {
        std::lock_guard<std::mutex> lock(shared->mutex);
        shared->cv.notify_all();
    });

    WaitResult<T> result;
    std::unique_lock<std::mutex> lock(shared->mutex);
    bool finished = shared->cv.wait_until(lock, deadline, [&] {
        return shared->done || cancel.is_cancelled();
    });
    if (cancel.is_cancelled()) {
        result.status = WaitStatus::cancelled;
    } else if (finished && shared->done) {
        result.status = WaitStatus::ready;
        result.value = std::move(shared->value);
        result.error = shared->error;
    } else {
        result.status = WaitStatus::timed_out;
    }
    return result;
}

} // namespace agentgate
