#pragma once
#include "cancellation.hpp"
#include "config.hpp"
#include "correlation.hpp"
#include "credential_gate.hpp"
#include "operation.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <sys/types.h>

namespace agentgate {

enum class SessionState { idle, starting, running, completed, failed, timed_out, terminated };

const char* session_state_name(SessionState s);

// One spawned agent process with its three pipes. Owned by the
// supervisor's registry; the pump thread is the only reader.
class CliSession {
public:
    explicit CliSession(std::string operation_id) : operation_id_(std::move(operation_id)) {}
    ~CliSession();

    CliSession(const CliSession&) = delete;
    CliSession& operator=(const CliSession&) = delete;

    const std::string& operation_id() const { return operation_id_; }
    SessionState state() const;
    pid_t pid() const { return pid_; }
    int exit_code() const { return exit_code_; }

    // Forward-only; completed/failed/timed_out are peers.
    bool advance(SessionState next);

    // Queued for the pump loop; false once stdin is closed
    bool send(const std::string& line);
    void close_stdin_when_drained();

    // Signals the process group; the pump thread reaps it
    void signal_group(int sig);

    // Stops the hard-timeout clock while a human decides. The pump still
    // gives up at limit.
    void pause_clock(Deadline limit);
    void resume_clock();

    // base shifted by the time spent paused, never past the pause limit
    Deadline effective_deadline(Deadline base) const;

private:
    friend class ProcessSupervisor;

    std::string operation_id_;
    mutable std::mutex mutex_;
    SessionState state_ = SessionState::idle;
    pid_t pid_ = -1;
    bool reaped_ = false;
    int exit_code_ = -1;
    int term_signal_ = 0;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    std::string pending_stdin_;
    bool keep_stdin_open_ = false;
    bool stdin_closing_ = false;
    bool clock_paused_ = false;
    Clock::time_point paused_at_{};
    Clock::duration paused_total_{};
    Deadline clock_limit_ = Deadline::max();

    void close_fds();
    void reap_blocking();
    bool try_reap();
};

struct PumpOutcome {
    SessionState state = SessionState::failed;
    int exit_code = -1;
    int term_signal = 0;
    bool cancelled = false;
    std::string stderr_text;
    size_t stdout_bytes = 0;
};

using ChunkHandler = std::function<void(const std::string& chunk)>;

class ProcessSupervisor {
public:
    explicit ProcessSupervisor(const AgentConfig& cfg, std::vector<std::string> agent_args);

    // Spawns the agent for op, injecting credential and correlation id via
    // the environment, and queues the conversation on stdin. Throws
    // AgentError(process_not_found) when the executable cannot be run.
    std::shared_ptr<CliSession> start(const Operation& op,
                                      const Credential& credential,
                                      const std::string& conversation,
                                      const Logger& log);

    // Same, with per-operation agent settings and arguments
    std::shared_ptr<CliSession> start(const Operation& op,
                                      const AgentConfig& agent,
                                      const std::vector<std::string>& args,
                                      const Credential& credential,
                                      const std::string& conversation,
                                      const Logger& log);

    // Reads until EOF, cancellation or the hard deadline, delivering stdout
    // chunks in arrival order. Kills the process on deadline/cancel.
    PumpOutcome pump(CliSession& session,
                     const ChunkHandler& on_stdout,
                     Deadline deadline,
                     const CancellationToken& cancel,
                     const Logger& log);

    // Kills the live session of an operation, if any
    void terminate(const std::string& operation_id);

    // Drops the session from the registry (state → terminated)
    void release(const std::string& operation_id);

    std::shared_ptr<CliSession> find(const std::string& operation_id) const;
    size_t live_sessions() const;

private:
    AgentConfig cfg_;
    std::vector<std::string> args_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<CliSession>> registry_;

    void kill_session(CliSession& session, const Logger& log);
};

} // namespace agentgate
