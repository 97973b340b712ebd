#pragma once
#include "utils.hpp"
#include <atomic>
#include <chrono>
#include <string>

namespace agentgate {

enum class OperationState { queued, authenticating, running, completed, failed, cancelled };

inline const char* operation_state_name(OperationState s) {
    switch (s) {
    case OperationState::queued:         return "queued";
    case OperationState::authenticating: return "authenticating";
    case OperationState::running:        return "running";
    case OperationState::completed:      return "completed";
    case OperationState::failed:         return "failed";
    case OperationState::cancelled:      return "cancelled";
    }
    return "queued";
}

inline int operation_state_rank(OperationState s) {
    switch (s) {
    case OperationState::queued:         return 0;
    case OperationState::authenticating: return 1;
    case OperationState::running:        return 2;
    default:                             return 3;
    }
}

// One caller-initiated request. Lives from submission until its stream
// delivers the terminal item.
class Operation {
public:
    Operation(std::string id, std::string correlation_id, std::chrono::milliseconds budget)
        : id_(std::move(id))
        , correlation_id_(std::move(correlation_id))
        , started_at_(std::chrono::system_clock::now())
        , deadline_(Clock::now() + budget) {}

    const std::string& id() const { return id_; }
    const std::string& correlation_id() const { return correlation_id_; }
    std::chrono::system_clock::time_point started_at() const { return started_at_; }
    Deadline deadline() const { return deadline_; }
    OperationState state() const { return state_.load(); }

    bool is_terminal() const { return operation_state_rank(state()) == 3; }

    // Forward-only. Returns false (and leaves the state alone) for any
    // transition that would not strictly advance.
    bool advance(OperationState next) {
        OperationState cur = state_.load();
        while (operation_state_rank(next) > operation_state_rank(cur)) {
            if (state_.compare_exchange_weak(cur, next)) return true;
        }
        return false;
    }

private:
    std::string id_;
    std::string correlation_id_;
    std::chrono::system_clock::time_point started_at_;
    Deadline deadline_;
    std::atomic<OperationState> state_{OperationState::queued};
};

} // namespace agentgate
