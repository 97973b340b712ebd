#pragma once
#include "cancellation.hpp"
#include "errors.hpp"
#include "output_event.hpp"
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

namespace agentgate {

struct Usage {
    int input_tokens = 0;       // estimated, 4 chars per token
    int output_tokens = 0;
};

struct Result {
    std::string correlation_id;
    std::string text;
    Usage usage;
    std::vector<std::string> warnings;
};

using StreamItem = std::variant<OutputEvent, Result, ClassifiedError>;

inline bool is_terminal_item(const StreamItem& item) {
    return !std::holds_alternative<OutputEvent>(item);
}

// Single-producer queue between an operation's worker and its stream.
class StreamChannel {
public:
    void push(StreamItem item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return;
            items_.push_back(std::move(item));
        }
        cv_.notify_all();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    // Blocks until an item is available; nullopt once closed and drained
    std::optional<StreamItem> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !items_.empty() || closed_; });
        if (items_.empty()) return std::nullopt;
        StreamItem item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<StreamItem> items_;
    bool closed_ = false;
};

// Lazy, ordered, finite stream for one operation. Exactly one terminal
// item (Result or ClassifiedError) ends it; next() returns nullopt after.
// Destroying an unfinished stream cancels the operation.
class EventStream {
public:
    EventStream(std::string correlation_id,
                std::shared_ptr<StreamChannel> channel,
                CancellationToken cancel,
                std::thread worker)
        : cid_(std::move(correlation_id))
        , channel_(std::move(channel))
        , cancel_(std::move(cancel))
        , worker_(std::move(worker)) {}

    // A moved-from stream keeps a fresh token of its own, so cancel() on it
    // is a no-op rather than a null dereference.
    EventStream(EventStream&& o)
        : cid_(std::move(o.cid_))
        , channel_(std::move(o.channel_))
        , cancel_(std::exchange(o.cancel_, CancellationToken()))
        , worker_(std::move(o.worker_))
        , finished_(o.finished_) {}
    EventStream& operator=(EventStream&& o) {
        if (this != &o) {
            shutdown();
            cid_ = std::move(o.cid_);
            channel_ = std::move(o.channel_);
            cancel_ = std::exchange(o.cancel_, CancellationToken());
            worker_ = std::move(o.worker_);
            finished_ = o.finished_;
        }
        return *this;
    }
    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    ~EventStream() { shutdown(); }

    std::optional<StreamItem> next() {
        if (finished_ || !channel_) return std::nullopt;
        auto item = channel_->pop();
        if (!item || is_terminal_item(*item)) finished_ = true;
        return item;
    }

    void cancel() { cancel_.cancel(); }

    bool finished() const { return finished_; }
    const std::string& correlation_id() const { return cid_; }

    // Drains the stream to its end
    std::vector<StreamItem> collect() {
        std::vector<StreamItem> items;
        while (auto item = next()) items.push_back(std::move(*item));
        return items;
    }

private:
    std::string cid_;
    std::shared_ptr<StreamChannel> channel_;
    CancellationToken cancel_;
    std::thread worker_;
    bool finished_ = false;

    void shutdown() {
        if (!worker_.joinable()) return;
        if (!finished_) cancel_.cancel();
        worker_.join();
    }
};

} // namespace agentgate
