#include "confirmation_arbiter.hpp"
#include <algorithm>

namespace agentgate {

ConfirmationDecision ConfirmationArbiter::review(OutputEvent& event,
                                                 Deadline deadline,
                                                 const CancellationToken& cancel,
                                                 const Logger& log) const {
    auto* tc = event.as<ToolCallEvent>();
    if (!tc || !tc->dangerous) {
        return ConfirmationDecision{true, "not a dangerous action", ApprovalOutcome::approved};
    }

    ConfirmationDecision d = ask(tc->action, deadline, cancel, log);
    tc->decision = d;
    log.info(std::string("Approval ") + approval_outcome_name(d.outcome) +
             " for event #" + std::to_string(event.sequence) + ": " + tc->action,
             d.rationale);
    return d;
}

ConfirmationDecision ConfirmationArbiter::review_prompt(OutputEvent& event,
                                                        Deadline deadline,
                                                        const CancellationToken& cancel,
                                                        const Logger& log) const {
    auto* prompt = event.as<ConfirmationRequestEvent>();
    if (!prompt) {
        return ConfirmationDecision{true, "not a prompt", ApprovalOutcome::approved};
    }

    ConfirmationDecision d = ask(prompt->prompt, deadline, cancel, log);
    prompt->decision = d;
    log.info(std::string("Prompt ") + approval_outcome_name(d.outcome) +
             " for event #" + std::to_string(event.sequence) + ": " + prompt->prompt,
             d.rationale);
    return d;
}

ConfirmationDecision ConfirmationArbiter::ask(const std::string& action, Deadline deadline,
                                              const CancellationToken& cancel,
                                              const Logger& log) const {
    ConfirmationDecision d;
    if (cancel.is_cancelled()) {
        d.outcome = ApprovalOutcome::cancelled;
        d.rationale = "operation cancelled";
        return d;
    }
    if (!approve_) {
        d.outcome = ApprovalOutcome::denied;
        d.rationale = "no approval capability available";
        return d;
    }

    Deadline wait_until = std::min(deadline, Clock::now() + timeout_);
    log.info("Waiting for approval: " + action);

    ApprovalFn fn = approve_;
    auto result = await_with_deadline<Approval>(
        [fn, action] { return fn(action); }, wait_until, cancel);

    switch (result.status) {
    case WaitStatus::cancelled:
        d.outcome = ApprovalOutcome::cancelled;
        d.rationale = "operation cancelled while awaiting approval";
        return d;
    case WaitStatus::timed_out:
        d.outcome = ApprovalOutcome::timed_out;
        d.rationale = "no answer before the approval deadline";
        return d;
    case WaitStatus::ready:
        break;
    }

    if (result.error) {
        try {
            std::rethrow_exception(result.error);
        } catch (const std::exception& e) {
            d.rationale = std::string("approval capability failed: ") + e.what();
        } catch (...) {
            d.rationale = "approval capability failed";
        }
        d.outcome = ApprovalOutcome::denied;
        log.warn("Approval capability threw, treating as denial", d.rationale);
        return d;
    }

    if (result.value && *result.value == Approval::approved) {
        d.approved = true;
        d.outcome = ApprovalOutcome::approved;
        d.rationale = "approved by user";
    } else {
        d.outcome = ApprovalOutcome::denied;
        d.rationale = "denied by user";
    }
    return d;
}

} // namespace agentgate
