#pragma once
#include "cancellation.hpp"
#include "correlation.hpp"
#include "output_event.hpp"
#include <chrono>
#include <functional>
#include <string>

namespace agentgate {

enum class Approval { approved, denied };

// Host capability: asked with the literal action text. Runs on a detached
// thread, so it must not hold references into the caller's stack.
using ApprovalFn = std::function<Approval(const std::string& action)>;

// Fail-closed gate in front of dangerous tool calls and agent prompts.
class ConfirmationArbiter {
public:
    ConfirmationArbiter(ApprovalFn approve, std::chrono::milliseconds approval_timeout)
        : approve_(std::move(approve)), timeout_(approval_timeout) {}

    // Non-dangerous events pass unchanged and get an "approved" verdict.
    // For a dangerous tool call the decision is attached to the event before
    // returning. Blocks for at most min(approval timeout, deadline).
    ConfirmationDecision review(OutputEvent& event,
                                Deadline deadline,
                                const CancellationToken& cancel,
                                const Logger& log) const;

    // A prompt the agent raised without an approved dangerous call before
    // it. Always asks, with the prompt text; the decision is attached.
    ConfirmationDecision review_prompt(OutputEvent& event,
                                       Deadline deadline,
                                       const CancellationToken& cancel,
                                       const Logger& log) const;

    bool has_capability() const { return static_cast<bool>(approve_); }

private:
    ApprovalFn approve_;
    std::chrono::milliseconds timeout_;

    ConfirmationDecision ask(const std::string& action, Deadline deadline,
                             const CancellationToken& cancel, const Logger& log) const;
};

} // namespace agentgate
