#include "agent_engine.hpp"
#include <algorithm>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <thread>

namespace agentgate {

namespace {

// Raw stdout chunks between the reader thread and the driver. Unbounded:
// the reader never blocks while the driver waits on an approval.
class ChunkQueue {
public:
    void push(std::string chunk) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            chunks_.push_back(std::move(chunk));
        }
        cv_.notify_one();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    enum class Pop { chunk, idle, closed };

    // Waits up to `wait` for the next chunk
    Pop pop_for(std::string& chunk, std::chrono::milliseconds wait) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, wait, [this] { return !chunks_.empty() || closed_; })) {
            return Pop::idle;
        }
        if (chunks_.empty()) return Pop::closed;
        chunk = std::move(chunks_.front());
        chunks_.pop_front();
        return Pop::chunk;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> chunks_;
    bool closed_ = false;
};

// Stops the reader (unless it drained normally), joins it and drops the
// session from the registry on every exit path of an attempt.
struct AttemptScope {
    std::thread& reader;
    CancellationToken stop;
    ProcessSupervisor& supervisor;
    std::string operation_id;
    bool drained = false;

    ~AttemptScope() {
        if (!drained) stop.cancel();
        if (reader.joinable()) reader.join();
        supervisor.release(operation_id);
    }
};

// Keeps the agent's hard timeout from running while a human decides
struct ClockPause {
    CliSession& session;
    ClockPause(CliSession& s, Deadline limit) : session(s) { session.pause_clock(limit); }
    ~ClockPause() { session.resume_clock(); }
};

constexpr auto kIdleSlice = std::chrono::milliseconds(50);

void transition(Operation& op, OperationState next, const Logger& log) {
    OperationState prev = op.state();
    if (op.advance(next)) {
        log.debug(std::string("Operation ") + operation_state_name(prev) + " -> " +
                  operation_state_name(next));
    } else if (prev != next) {
        log.debug(std::string("Rejected operation transition ") + operation_state_name(prev) +
                  " -> " + operation_state_name(next));
    }
}

} // namespace

AgentEngine::Core::Core(Config c, std::shared_ptr<LogSink> s,
                        std::shared_ptr<CredentialGate> g, ApprovalFn a)
    : cfg(std::move(c))
    , sink(s ? std::move(s) : std::make_shared<LogSink>())
    , gate(g ? std::move(g) : CredentialGate::make_default(cfg.credentials, nullptr))
    , arbiter(std::move(a), std::chrono::milliseconds(cfg.engine.approval_timeout_ms))
    , policy(cfg.retry)
    , supervisor(cfg.agent, cfg.agent_arguments())
    , limiter(cfg.engine.max_concurrency) {}

AgentEngine::AgentEngine(Config cfg,
                         std::shared_ptr<LogSink> sink,
                         std::shared_ptr<CredentialGate> gate,
                         ApprovalFn approve)
    : core_(std::make_shared<Core>(std::move(cfg), std::move(sink), std::move(gate), std::move(approve))) {}

EventStream AgentEngine::submit(const std::vector<Message>& history,
                                const std::string& system_preamble,
                                const SubmitOptions& opts,
                                const std::string& correlation_id) {
    std::string cid = correlation_id.empty() ? new_correlation_id() : correlation_id;

    Config cfg = core_->cfg;
    if (opts.model) cfg.agent.model = *opts.model;
    if (opts.json_mode) cfg.agent.json_mode = *opts.json_mode;
    if (opts.confirm_actions) cfg.agent.confirm_actions = *opts.confirm_actions;
    if (opts.timeout_ms) cfg.agent.timeout_ms = *opts.timeout_ms;
    int budget_ms = opts.operation_timeout_ms.value_or(cfg.engine.operation_timeout_ms);

    Job job;
    job.op = std::make_shared<Operation>("op-" + std::to_string(core_->next_op++), cid,
                                         std::chrono::milliseconds(budget_ms));
    job.agent = cfg.agent;
    job.args = cfg.agent_arguments();
    job.conversation = format_conversation(system_preamble, history);
    job.channel = std::make_shared<StreamChannel>();

    Logger log(core_->sink, "engine", cid);
    log.info("Submitted " + job.op->id() + " with " + std::to_string(history.size()) + " message(s)",
             "budget " + std::to_string(budget_ms) + " ms, process timeout " +
             std::to_string(cfg.agent.timeout_ms) + " ms");

    auto channel = job.channel;
    auto cancel = job.cancel;
    std::thread worker(&AgentEngine::run_operation, core_, std::move(job));
    return EventStream(cid, std::move(channel), std::move(cancel), std::move(worker));
}

void AgentEngine::run_operation(const std::shared_ptr<Core>& core, Job job) {
    Operation& op = *job.op;
    const std::string cid = op.correlation_id();
    Logger log(core->sink, "engine", cid);
    core->active++;

    Permit permit;
    auto finish = [&](StreamItem item, OperationState state) {
        permit = Permit();
        transition(op, state, log);
        job.channel->push(std::move(item));
        job.channel->close();
        core->active--;
    };

    log.info("Waiting for a slot (" + std::to_string(core->limiter.active()) + "/" +
             std::to_string(core->limiter.capacity()) + " busy, " +
             std::to_string(core->limiter.queued()) + " queued)");
    if (!core->limiter.acquire(job.cancel)) {
        log.info("Cancelled while queued");
        finish(make_error(ErrorCategory::cancelled, cid, "cancelled while queued"),
               OperationState::cancelled);
        return;
    }
    permit = Permit(&core->limiter);
    transition(op, OperationState::authenticating, log);

    OutputClassifier classifier(core->cfg.classifier, log.with_component("classifier"));
    std::map<ErrorCategory, int> spent;

    while (true) {
        ClassifiedError err;
        try {
            Result result = run_attempt(*core, job, classifier, log);
            log.info("Completed: " + std::to_string(result.usage.input_tokens) + " input / " +
                     std::to_string(result.usage.output_tokens) + " output tokens (estimated)");
            finish(std::move(result), OperationState::completed);
            return;
        } catch (const AgentError& e) {
            err = e.error();
            if (err.correlation_id.empty()) err = make_error(err.category, cid, err.technical_detail);
        } catch (const std::exception& e) {
            err = classify_exception(e, cid);
        }

        if (job.cancel.is_cancelled() && err.category != ErrorCategory::cancelled) {
            err = make_error(ErrorCategory::cancelled, cid, "cancelled by caller");
        }

        RecoveryDecision decision = core->policy.decide(err.category, spent[err.category]);
        if (decision.retry && ms_until(op.deadline()) <= decision.delay.count()) {
            log.warn("No time left in the operation budget for a retry");
            decision.retry = false;
        }

        if (!decision.retry) {
            bool quiet = err.category == ErrorCategory::cancelled ||
                         err.category == ErrorCategory::user_denied;
            log.log(quiet ? Severity::info : Severity::error,
                    std::string(category_name(err.category)) + ": " + err.user_message,
                    err.technical_detail);
            OperationState end = err.category == ErrorCategory::cancelled ? OperationState::cancelled
                                                                         : OperationState::failed;
            finish(std::move(err), end);
            return;
        }

        int n = ++spent[err.category];
        log.warn(std::string("Retrying after ") + category_name(err.category) + " (retry " +
                 std::to_string(n) + ", delay " + std::to_string(decision.delay.count()) + " ms)",
                 err.technical_detail);
        if (decision.refresh_credentials) {
            log.info("Forcing credential re-resolution");
            core->gate->invalidate();
        }
        if (decision.delay.count() > 0 && !job.cancel.sleep_for(decision.delay)) {
            log.info("Cancelled during retry backoff");
            finish(make_error(ErrorCategory::cancelled, cid, "cancelled during retry backoff"),
                   OperationState::cancelled);
            return;
        }
        classifier.reset();
    }
}

Result AgentEngine::run_attempt(Core& core, Job& job, OutputClassifier& classifier, const Logger& log) {
    Operation& op = *job.op;
    const std::string& cid = op.correlation_id();

    Credential credential = core.gate->resolve(core.cfg.credentials.scopes, op.deadline(), job.cancel,
                                               log.with_component("credentials"));
    transition(op, OperationState::running, log);

    Logger slog = log.with_component("supervisor");
    auto session = core.supervisor.start(op, job.agent, job.args, credential, job.conversation, slog);
    Deadline process_deadline = std::min(op.deadline(),
                                         Clock::now() + std::chrono::milliseconds(job.agent.timeout_ms));

    CancellationToken stop;
    CancelScope link(job.cancel, [stop]() mutable { stop.cancel(); });

    ChunkQueue chunks;
    PumpOutcome outcome;
    std::exception_ptr pump_error;
    std::thread reader([&] {
        try {
            outcome = core.supervisor.pump(*session,
                                           [&chunks](const std::string& c) { chunks.push(c); },
                                           process_deadline, stop, slog);
        } catch (const std::exception&) {
            pump_error = std::current_exception();
        }
        chunks.close();
    });
    AttemptScope scope{reader, stop, core.supervisor, op.id()};

    Logger alog = log.with_component("arbiter");
    std::string text;
    std::vector<std::string> warnings;
    auto last_activity = Clock::now();
    bool stdin_closed = !job.agent.confirm_actions;
    // Dangerous call approved whose prompt has not been answered yet
    std::optional<uint64_t> approved_call;

    auto decide = [&](OutputEvent& ev, bool is_prompt) {
        ClockPause pause(*session, op.deadline());
        ConfirmationDecision d = is_prompt
            ? core.arbiter.review_prompt(ev, op.deadline(), job.cancel, alog)
            : core.arbiter.review(ev, op.deadline(), job.cancel, alog);
        if (d.outcome == ApprovalOutcome::cancelled) {
            throw AgentError(make_error(ErrorCategory::cancelled, cid, d.rationale));
        }
        return d;
    };
    auto deny = [&](OutputEvent& ev, const ConfirmationDecision& d, std::string what) {
        session->send(job.agent.deny_reply);
        job.channel->push(std::move(ev));
        throw AgentError(make_error(ErrorCategory::user_denied, cid, d.rationale + ": " + what));
    };

    auto forward = [&](OutputEvent& ev) {
        if (ev.kind() == EventKind::tool_call) {
            approved_call.reset();
            if (ev.is_dangerous_tool_call()) {
                ConfirmationDecision d = decide(ev, false);
                if (!d.approved) deny(ev, d, ev.as<ToolCallEvent>()->action);
                approved_call = ev.sequence;
            }
        } else if (auto* prompt = ev.as<ConfirmationRequestEvent>()) {
            if (approved_call) {
                prompt->decision = ConfirmationDecision{
                    true, "covered by approved event #" + std::to_string(*approved_call),
                    ApprovalOutcome::approved};
                approved_call.reset();
            } else {
                std::string prompt_text = prompt->prompt;
                ConfirmationDecision d = decide(ev, true);
                if (!d.approved) deny(ev, d, prompt_text);
            }
            if (session->send(job.agent.approve_reply)) {
                log.debug("Answered agent prompt #" + std::to_string(ev.sequence));
            }
        }
        if (auto* t = ev.as<TextEvent>(); t && !t->warning.empty()) {
            warnings.push_back(t->warning);
        }
        job.channel->push(std::move(ev));
        last_activity = Clock::now();
    };

    const auto prompt_idle = std::chrono::milliseconds(core.cfg.classifier.prompt_idle_ms);
    const auto stdin_idle = std::chrono::milliseconds(job.agent.stdin_idle_close_ms);
    std::string chunk;
    while (true) {
        auto got = chunks.pop_for(chunk, kIdleSlice);
        if (got == ChunkQueue::Pop::closed) break;
        if (got == ChunkQueue::Pop::chunk) {
            text += chunk;
            for (auto& ev : classifier.feed(chunk)) forward(ev);
            last_activity = Clock::now();
            continue;
        }

        auto quiet = Clock::now() - last_activity;
        if (classifier.prompt_pending()) {
            if (quiet >= prompt_idle) {
                for (auto& ev : classifier.flush_prompt()) forward(ev);
            }
        } else if (!stdin_closed && stdin_idle.count() > 0 && quiet >= stdin_idle) {
            session->close_stdin_when_drained();
            stdin_closed = true;
            log.debug("Agent quiet with no open prompt, closing its stdin");
        }
    }
    scope.drained = true;
    reader.join();
    for (auto& ev : classifier.finish()) forward(ev);

    if (pump_error) std::rethrow_exception(pump_error);
    if (outcome.cancelled || job.cancel.is_cancelled()) {
        throw AgentError(make_error(ErrorCategory::cancelled, cid, "cancelled while the agent was running"));
    }
    if (outcome.state == SessionState::timed_out) {
        throw AgentError(make_error(ErrorCategory::timeout, cid,
                                    "agent exceeded " + std::to_string(job.agent.timeout_ms) + " ms"));
    }
    if (outcome.state == SessionState::failed) {
        std::string stderr_text = trim(outcome.stderr_text);
        ErrorCategory cat = ErrorCategory::upstream_service;
        if (outcome.exit_code == 127) {
            cat = ErrorCategory::process_not_found;
        } else if (!stderr_text.empty()) {
            cat = classify_failure_text(stderr_text);
        }
        std::string detail = "agent exited with code " + std::to_string(outcome.exit_code);
        if (!stderr_text.empty()) detail += ": " + stderr_text;
        throw AgentError(make_error(cat, cid, detail));
    }

    Result result;
    result.correlation_id = cid;
    result.text = trim(text);
    result.usage.input_tokens = estimate_tokens(job.conversation);
    result.usage.output_tokens = estimate_tokens(result.text);
    result.warnings = std::move(warnings);
    if (result.text.empty()) {
        log.warn("Agent exited cleanly without output");
        result.warnings.push_back("agent produced no output");
    }
    return result;
}

} // namespace agentgate
