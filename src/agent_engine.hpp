#pragma once
#include "concurrency_limiter.hpp"
#include "config.hpp"
#include "confirmation_arbiter.hpp"
#include "correlation.hpp"
#include "credential_gate.hpp"
#include "errors.hpp"
#include "event_stream.hpp"
#include "message.hpp"
#include "operation.hpp"
#include "output_classifier.hpp"
#include "process_supervisor.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentgate {

// Per-submission overrides of the configured agent settings
struct SubmitOptions {
    std::optional<std::string> model;
    std::optional<bool> json_mode;
    std::optional<bool> confirm_actions;
    std::optional<int> timeout_ms;              // per agent process
    std::optional<int> operation_timeout_ms;    // whole operation
};

class AgentEngine {
public:
    AgentEngine(Config cfg,
                std::shared_ptr<LogSink> sink,
                std::shared_ptr<CredentialGate> gate,
                ApprovalFn approve);

    // Starts an operation and returns its stream. The work runs on a
    // dedicated thread; failures arrive as a ClassifiedError item, never
    // as an exception. An empty correlation id gets a fresh one.
    EventStream submit(const std::vector<Message>& history,
                       const std::string& system_preamble,
                       const SubmitOptions& opts = {},
                       const std::string& correlation_id = "");

    const Config& config() const { return core_->cfg; }
    ProcessSupervisor& supervisor() { return core_->supervisor; }
    ConcurrencyLimiter& limiter() { return core_->limiter; }
    int active_operations() const { return core_->active.load(); }

private:
    // Shared with worker threads so streams may outlive the engine
    struct Core {
        Config cfg;
        std::shared_ptr<LogSink> sink;
        std::shared_ptr<CredentialGate> gate;
        ConfirmationArbiter arbiter;
        RecoveryPolicy policy;
        ProcessSupervisor supervisor;
        ConcurrencyLimiter limiter;
        std::atomic<int> active{0};
        std::atomic<uint64_t> next_op{1};

        Core(Config c, std::shared_ptr<LogSink> s, std::shared_ptr<CredentialGate> g, ApprovalFn a);
    };

    struct Job {
        std::shared_ptr<Operation> op;
        AgentConfig agent;
        std::vector<std::string> args;
        std::string conversation;
        std::shared_ptr<StreamChannel> channel;
        CancellationToken cancel;
    };

    std::shared_ptr<Core> core_;

    static void run_operation(const std::shared_ptr<Core>& core, Job job);
    static Result run_attempt(Core& core, Job& job, OutputClassifier& classifier, const Logger& log);
};

} // namespace agentgate
