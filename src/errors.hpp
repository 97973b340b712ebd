#pragma once
#include "config.hpp"
#include <chrono>
#include <stdexcept>
#include <string>

namespace agentgate {

// ── Failure taxonomy ────────────────────────────────────────────────
enum class ErrorCategory {
    authentication,
    process_not_found,
    timeout,
    malformed_output,
    user_denied,
    cancelled,
    upstream_service,
    rate_limited
};

enum class ErrorSeverity { warning, error, fatal };

const char* category_name(ErrorCategory c);

struct ClassifiedError {
    ErrorCategory category = ErrorCategory::upstream_service;
    ErrorSeverity severity = ErrorSeverity::error;
    bool recoverable = false;
    std::string correlation_id;
    std::string user_message;       // one actionable sentence + (ref: <cid>)
    std::string technical_detail;   // only ever written to the correlated log
};

// Carries a ClassifiedError through the engine's call stack.
class AgentError : public std::runtime_error {
public:
    explicit AgentError(ClassifiedError err)
        : std::runtime_error(std::string(category_name(err.category)) + ": " + err.technical_detail)
        , error_(std::move(err)) {}

    const ClassifiedError& error() const { return error_; }
    ErrorCategory category() const { return error_.category; }

private:
    ClassifiedError error_;
};

bool is_recoverable(ErrorCategory c);

// Builds the caller-facing value: severity, recoverability and a
// non-technical message tagged with the correlation id.
ClassifiedError make_error(ErrorCategory category,
                           const std::string& correlation_id,
                           const std::string& technical_detail);

// Maps free-form failure text (agent stderr, exception text) onto the
// taxonomy. Unknown text is an upstream failure.
ErrorCategory classify_failure_text(const std::string& text);

// Routes any exception through the classifier.
ClassifiedError classify_exception(const std::exception& e, const std::string& correlation_id);

// ── Recovery policy ─────────────────────────────────────────────────
struct RecoveryDecision {
    bool retry = false;
    bool refresh_credentials = false;   // force one gate re-resolution first
    std::chrono::milliseconds delay{0};
};

class RecoveryPolicy {
public:
    explicit RecoveryPolicy(const RetryConfig& cfg) : cfg_(cfg) {}

    // attempt = number of earlier retries already spent on this category
    RecoveryDecision decide(ErrorCategory category, int attempt) const;

    std::chrono::milliseconds backoff(ErrorCategory category, int attempt) const;

private:
    RetryConfig cfg_;
};

} // namespace agentgate
