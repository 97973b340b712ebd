#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace agentgate {

enum class ApprovalOutcome { approved, denied, timed_out, cancelled };

inline const char* approval_outcome_name(ApprovalOutcome o) {
    switch (o) {
    case ApprovalOutcome::approved:  return "approved";
    case ApprovalOutcome::denied:    return "denied";
    case ApprovalOutcome::timed_out: return "timed_out";
    case ApprovalOutcome::cancelled: return "cancelled";
    }
    return "denied";
}

struct ConfirmationDecision {
    bool approved = false;
    std::string rationale;
    ApprovalOutcome outcome = ApprovalOutcome::denied;
};

// ── Event payloads ──────────────────────────────────────────────────

struct ReasoningEvent {
    std::string content;
};

struct ToolCallEvent {
    std::string action;                             // literal text after the marker
    bool dangerous = false;
    std::optional<ConfirmationDecision> decision;   // always set when dangerous
};

struct ConfirmationRequestEvent {
    std::string prompt;
    std::optional<ConfirmationDecision> decision;   // set before the agent is answered
};

struct StructuredEvent {
    nlohmann::json value;
};

struct TextEvent {
    std::string content;
    std::string warning;                            // e.g. unterminated structured output
};

using EventPayload = std::variant<ReasoningEvent, ToolCallEvent, ConfirmationRequestEvent,
                                  StructuredEvent, TextEvent>;

enum class EventKind { reasoning, tool_call, confirmation_request, structured, text };

inline const char* event_kind_name(EventKind k) {
    switch (k) {
    case EventKind::reasoning:            return "reasoning";
    case EventKind::tool_call:            return "tool_call";
    case EventKind::confirmation_request: return "confirmation_request";
    case EventKind::structured:           return "structured";
    case EventKind::text:                 return "text";
    }
    return "text";
}

struct OutputEvent {
    std::string correlation_id;
    uint64_t sequence = 0;      // strictly increasing within one operation
    std::string raw;            // exact source bytes, newline included
    EventPayload payload;

    EventKind kind() const { return static_cast<EventKind>(payload.index()); }

    template <typename T> const T* as() const { return std::get_if<T>(&payload); }
    template <typename T> T* as() { return std::get_if<T>(&payload); }

    bool is_dangerous_tool_call() const {
        auto* tc = as<ToolCallEvent>();
        return tc && tc->dangerous;
    }
};

} // namespace agentgate
