#include "errors.hpp"
#include "utils.hpp"
#include <algorithm>

namespace agentgate {

const char* category_name(ErrorCategory c) {
    switch (c) {
    case ErrorCategory::authentication:    return "AuthenticationError";
    case ErrorCategory::process_not_found: return "ProcessNotFound";
    case ErrorCategory::timeout:           return "Timeout";
    case ErrorCategory::malformed_output:  return "MalformedOutput";
    case ErrorCategory::user_denied:       return "UserDenied";
    case ErrorCategory::cancelled:         return "Cancelled";
    case ErrorCategory::upstream_service:  return "UpstreamServiceError";
    case ErrorCategory::rate_limited:      return "RateLimited";
    }
    return "UpstreamServiceError";
}

bool is_recoverable(ErrorCategory c) {
    return c == ErrorCategory::timeout ||
           c == ErrorCategory::malformed_output ||
           c == ErrorCategory::upstream_service ||
           c == ErrorCategory::rate_limited;
}

static const char* user_text(ErrorCategory c) {
    switch (c) {
    case ErrorCategory::authentication:
        return "Sign-in to the agent failed. Re-authenticate with your Google account or set an API key, then try again.";
    case ErrorCategory::process_not_found:
        return "The local agent program could not be started. Install it and make sure its path in the settings is correct.";
    case ErrorCategory::timeout:
        return "The agent took too long to respond. Try again with a smaller request.";
    case ErrorCategory::malformed_output:
        return "The agent's reply was incomplete. Review the partial answer or ask again.";
    case ErrorCategory::user_denied:
        return "The proposed action was not approved, so the request was stopped. Rephrase the request if you want a different approach.";
    case ErrorCategory::cancelled:
        return "The request was cancelled. Start it again when you are ready.";
    case ErrorCategory::upstream_service:
        return "The agent reported a service problem. Wait a moment and try again.";
    case ErrorCategory::rate_limited:
        return "The agent is receiving too many requests right now. Wait a minute before trying again.";
    }
    return "The request failed. Try again.";
}

ClassifiedError make_error(ErrorCategory category,
                           const std::string& correlation_id,
                           const std::string& technical_detail) {
    ClassifiedError e;
    e.category = category;
    e.recoverable = is_recoverable(category);
    e.correlation_id = correlation_id;
    e.technical_detail = technical_detail;

    switch (category) {
    case ErrorCategory::process_not_found:
        e.severity = ErrorSeverity::fatal;
        break;
    case ErrorCategory::malformed_output:
        e.severity = ErrorSeverity::warning;
        break;
    default:
        e.severity = ErrorSeverity::error;
        break;
    }

    e.user_message = user_text(category);
    if (!correlation_id.empty()) {
        e.user_message += " (ref: " + correlation_id + ")";
    }
    return e;
}

ErrorCategory classify_failure_text(const std::string& text) {
    std::string lower = to_lower(text);

    if (text_contains_any(lower, {"rate limit", "rate_limit", "too many requests", "429",
                                   "quota exceeded", "resource_exhausted", "usage limit"}))
        return ErrorCategory::rate_limited;

    if (text_contains_any(lower, {"401", "403", "unauthorized", "forbidden", "unauthenticated",
                                   "invalid api key", "invalid_api_key", "api key not valid",
                                   "authentication", "permission_denied", "login required"}))
        return ErrorCategory::authentication;

    if (text_contains_any(lower, {"timeout", "timed out", "deadline exceeded", "deadline_exceeded"}))
        return ErrorCategory::timeout;

    if (text_contains_any(lower, {"enoent", "command not found", "no such file or directory"}))
        return ErrorCategory::process_not_found;

    return ErrorCategory::upstream_service;
}

ClassifiedError classify_exception(const std::exception& e, const std::string& correlation_id) {
    if (auto* ae = dynamic_cast<const AgentError*>(&e)) {
        ClassifiedError err = ae->error();
        if (err.correlation_id.empty()) {
            err = make_error(err.category, correlation_id, err.technical_detail);
        }
        return err;
    }
    return make_error(classify_failure_text(e.what()), correlation_id, e.what());
}

// ── RecoveryPolicy ──────────────────────────────────────────────────

std::chrono::milliseconds RecoveryPolicy::backoff(ErrorCategory category, int attempt) const {
    int base = category == ErrorCategory::rate_limited ? cfg_.rate_limit_base_ms
                                                       : cfg_.upstream_base_ms;
    int64_t delay = static_cast<int64_t>(base) << std::min(attempt, 16);
    // Rate limits always wait longer than upstream failures, even when capped
    int64_t cap = cfg_.max_delay_ms;
    if (category == ErrorCategory::rate_limited) cap = cap * 2;
    return std::chrono::milliseconds(std::min(delay, cap));
}

RecoveryDecision RecoveryPolicy::decide(ErrorCategory category, int attempt) const {
    RecoveryDecision d;
    switch (category) {
    case ErrorCategory::authentication:
        d.retry = attempt < 1;
        d.refresh_credentials = d.retry;
        break;
    case ErrorCategory::timeout:
        d.retry = attempt < 1;
        break;
    case ErrorCategory::upstream_service:
        d.retry = attempt < cfg_.upstream_attempts;
        if (d.retry) d.delay = backoff(category, attempt);
        break;
    case ErrorCategory::rate_limited:
        d.retry = attempt < cfg_.rate_limit_attempts;
        if (d.retry) d.delay = backoff(category, attempt);
        break;
    case ErrorCategory::process_not_found:
    case ErrorCategory::malformed_output:
    case ErrorCategory::user_denied:
    case ErrorCategory::cancelled:
        break;
    }
    return d;
}

} // namespace agentgate
