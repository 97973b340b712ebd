#include "process_supervisor.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <set>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace agentgate {

namespace {

constexpr size_t kReadChunk = 4096;
constexpr size_t kMaxStderr = 64 * 1024;
constexpr int kPollSliceMs = 50;
constexpr int kTermGraceMs = 1000;

int session_state_rank(SessionState s) {
    switch (s) {
    case SessionState::idle:       return 0;
    case SessionState::starting:   return 1;
    case SessionState::running:    return 2;
    case SessionState::completed:
    case SessionState::failed:
    case SessionState::timed_out:  return 3;
    case SessionState::terminated: return 4;
    }
    return 0;
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

// Writing to a dead agent's stdin must surface as EPIPE, not kill us
void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
}

} // namespace

const char* session_state_name(SessionState s) {
    switch (s) {
    case SessionState::idle:       return "idle";
    case SessionState::starting:   return "starting";
    case SessionState::running:    return "running";
    case SessionState::completed:  return "completed";
    case SessionState::failed:     return "failed";
    case SessionState::timed_out:  return "timed_out";
    case SessionState::terminated: return "terminated";
    }
    return "idle";
}

// ── CliSession ──────────────────────────────────────────────────────

CliSession::~CliSession() {
    if (pid_ > 0 && !reaped_) {
        signal_group(SIGKILL);
        reap_blocking();
    }
    close_fds();
}

SessionState CliSession::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool CliSession::advance(SessionState next) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session_state_rank(next) <= session_state_rank(state_)) return false;
    state_ = next;
    return true;
}

bool CliSession::send(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stdin_fd_ < 0 || stdin_closing_) return false;
    pending_stdin_ += line;
    if (line.empty() || line.back() != '\n') pending_stdin_ += '\n';
    return true;
}

void CliSession::close_stdin_when_drained() {
    std::lock_guard<std::mutex> lock(mutex_);
    stdin_closing_ = true;
}

void CliSession::signal_group(int sig) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ <= 0 || reaped_) return;
    if (kill(-pid_, sig) != 0) {
        kill(pid_, sig);
    }
}

void CliSession::pause_clock(Deadline limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    clock_limit_ = std::min(clock_limit_, limit);
    if (clock_paused_) return;
    clock_paused_ = true;
    paused_at_ = Clock::now();
}

void CliSession::resume_clock() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!clock_paused_) return;
    clock_paused_ = false;
    paused_total_ += Clock::now() - paused_at_;
}

Deadline CliSession::effective_deadline(Deadline base) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (clock_paused_) return clock_limit_;
    return std::min(base + paused_total_, clock_limit_);
}

void CliSession::close_fds() {
    std::lock_guard<std::mutex> lock(mutex_);
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

static void record_status(int status, int& exit_code, int& term_signal) {
    if (WIFEXITED(status)) {
        exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        term_signal = WTERMSIG(status);
        exit_code = 128 + term_signal;
    }
}

bool CliSession::try_reap() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reaped_ || pid_ <= 0) return true;
    int status = 0;
    pid_t r = waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
        record_status(status, exit_code_, term_signal_);
        reaped_ = true;
    } else if (r < 0 && errno == ECHILD) {
        reaped_ = true;
    }
    return reaped_;
}

void CliSession::reap_blocking() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reaped_ || pid_ <= 0) return;
    int status = 0;
    pid_t r;
    do {
        r = waitpid(pid_, &status, 0);
    } while (r < 0 && errno == EINTR);
    if (r == pid_) record_status(status, exit_code_, term_signal_);
    reaped_ = true;
}

// ── ProcessSupervisor ───────────────────────────────────────────────

ProcessSupervisor::ProcessSupervisor(const AgentConfig& cfg, std::vector<std::string> agent_args)
    : cfg_(cfg), args_(std::move(agent_args)) {
    ignore_sigpipe_once();
}

std::shared_ptr<CliSession> ProcessSupervisor::start(const Operation& op,
                                                      const Credential& credential,
                                                      const std::string& conversation,
                                                      const Logger& log) {
    return start(op, cfg_, args_, credential, conversation, log);
}

std::shared_ptr<CliSession> ProcessSupervisor::start(const Operation& op,
                                                      const AgentConfig& agent,
                                                      const std::vector<std::string>& args,
                                                      const Credential& credential,
                                                      const std::string& conversation,
                                                      const Logger& log) {
    const std::string& cid = op.correlation_id();

    if (auto previous = find(op.id())) {
        log.warn("Replacing live session for operation " + op.id());
        terminate(op.id());
        release(op.id());
    }

    auto session = std::make_shared<CliSession>(op.id());
    session->advance(SessionState::starting);

    // argv: executable + mode flags; secrets never go here
    std::vector<std::string> argv_strings;
    argv_strings.push_back(agent.executable);
    for (auto& a : args) argv_strings.push_back(a);
    std::vector<char*> argv;
    for (auto& s : argv_strings) argv.push_back(const_cast<char*>(s.c_str()));
    argv.push_back(nullptr);

    // envp: inherited environment with our variables overriding
    std::set<std::string> overridden = {agent.credential_env, agent.correlation_env, agent.mode_env};
    std::vector<std::string> env_strings;
    for (char** e = environ; e && *e; ++e) {
        std::string kv(*e);
        auto eq = kv.find('=');
        if (eq != std::string::npos && overridden.count(kv.substr(0, eq))) continue;
        env_strings.push_back(std::move(kv));
    }
    env_strings.push_back(agent.credential_env + "=" + credential.token);
    env_strings.push_back(agent.correlation_env + "=" + cid);
    env_strings.push_back(agent.mode_env + "=" + (agent.json_mode ? "json" : "interactive"));
    std::vector<char*> envp;
    for (auto& s : env_strings) envp.push_back(const_cast<char*>(s.c_str()));
    envp.push_back(nullptr);

    int pipe_in[2] = {-1, -1}, pipe_out[2] = {-1, -1}, pipe_err[2] = {-1, -1}, pipe_exec[2] = {-1, -1};
    int* pipes[] = {pipe_in, pipe_out, pipe_err, pipe_exec};
    auto close_pipes = [&pipes] {
        for (int* p : pipes) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };
    for (int* p : pipes) {
        if (pipe2(p, O_CLOEXEC) != 0) {
            int err = errno;
            close_pipes();
            throw AgentError(make_error(ErrorCategory::upstream_service, cid,
                                        std::string("pipe failed: ") + std::strerror(err)));
        }
    }

    // Restored in the child: exec keeps ignored dispositions
    struct sigaction dfl;
    std::memset(&dfl, 0, sizeof(dfl));
    dfl.sa_handler = SIG_DFL;

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close_pipes();
        throw AgentError(make_error(ErrorCategory::upstream_service, cid,
                                    std::string("fork failed: ") + std::strerror(err)));
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        setpgid(0, 0);
        sigaction(SIGPIPE, &dfl, nullptr);
        dup2(pipe_in[0], STDIN_FILENO);
        dup2(pipe_out[1], STDOUT_FILENO);
        dup2(pipe_err[1], STDERR_FILENO);
        environ = envp.data();
        execvp(argv[0], argv.data());
        int err = errno;
        ssize_t ignored = write(pipe_exec[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    setpgid(pid, pid);
    close(pipe_in[0]);
    close(pipe_out[1]);
    close(pipe_err[1]);
    close(pipe_exec[1]);

    // exec succeeded iff the close-on-exec pipe reports EOF
    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(pipe_exec[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close(pipe_exec[0]);

    session->pid_ = pid;
    session->stdin_fd_ = pipe_in[1];
    session->stdout_fd_ = pipe_out[0];
    session->stderr_fd_ = pipe_err[0];

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        session->reap_blocking();
        session->close_fds();
        session->advance(SessionState::failed);
        std::string detail = "exec '" + agent.executable + "' failed: " + std::strerror(exec_errno);
        log.error("Agent executable could not be started", detail);
        ErrorCategory cat = (exec_errno == ENOENT || exec_errno == EACCES || exec_errno == ENOTDIR)
                                ? ErrorCategory::process_not_found
                                : ErrorCategory::upstream_service;
        throw AgentError(make_error(cat, cid, detail));
    }

    set_nonblocking(session->stdin_fd_);
    set_nonblocking(session->stdout_fd_);
    set_nonblocking(session->stderr_fd_);

    session->pending_stdin_ = conversation + "\n";
    session->keep_stdin_open_ = agent.confirm_actions;
    session->advance(SessionState::running);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        registry_[op.id()] = session;
    }

    std::string cmdline = agent.executable;
    for (auto& a : args) cmdline += " " + a;
    log.info("Spawned agent pid " + std::to_string(pid) + ": " + cmdline);
    return session;
}

void ProcessSupervisor::kill_session(CliSession& session, const Logger& log) {
    session.signal_group(SIGTERM);
    for (int waited = 0; waited < kTermGraceMs; waited += 20) {
        if (session.try_reap()) return;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    log.warn("Agent ignored SIGTERM, sending SIGKILL");
    session.signal_group(SIGKILL);
    session.reap_blocking();
}

PumpOutcome ProcessSupervisor::pump(CliSession& session,
                                    const ChunkHandler& on_stdout,
                                    Deadline deadline,
                                    const CancellationToken& cancel,
                                    const Logger& log) {
    PumpOutcome out;
    bool timed_out = false;
    bool killed = false;
    char buf[kReadChunk];

    auto read_stream = [&](int& fd, bool is_stdout) {
        ssize_t r = read(fd, buf, sizeof(buf));
        if (r > 0) {
            std::string chunk(buf, static_cast<size_t>(r));
            if (is_stdout) {
                out.stdout_bytes += chunk.size();
                on_stdout(chunk);
            } else {
                if (out.stderr_text.size() < kMaxStderr) out.stderr_text += chunk;
                log.debug("Agent stderr", chunk);
            }
        } else if (r == 0 || (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)) {
            std::lock_guard<std::mutex> lock(session.mutex_);
            close_fd(fd);
        }
    };

    while (true) {
        int out_fd, err_fd, in_fd;
        bool want_write = false;
        {
            std::lock_guard<std::mutex> lock(session.mutex_);
            if (session.stdin_fd_ >= 0 && session.pending_stdin_.empty() &&
                (!session.keep_stdin_open_ || session.stdin_closing_)) {
                close_fd(session.stdin_fd_);
            }
            out_fd = session.stdout_fd_;
            err_fd = session.stderr_fd_;
            in_fd = session.stdin_fd_;
            want_write = in_fd >= 0 && !session.pending_stdin_.empty();
        }
        if (out_fd < 0 && err_fd < 0) break;

        if (cancel.is_cancelled()) {
            out.cancelled = true;
            log.info("Cancellation requested, terminating agent");
            kill_session(session, log);
            killed = true;
            break;
        }
        Deadline limit = session.effective_deadline(deadline);
        if (Clock::now() >= limit) {
            timed_out = true;
            log.warn("Agent exceeded hard timeout, terminating");
            kill_session(session, log);
            killed = true;
            break;
        }

        struct pollfd pfds[3];
        int n = 0, idx_out = -1, idx_err = -1, idx_in = -1;
        if (out_fd >= 0) { pfds[n] = {out_fd, POLLIN, 0}; idx_out = n++; }
        if (err_fd >= 0) { pfds[n] = {err_fd, POLLIN, 0}; idx_err = n++; }
        if (want_write)  { pfds[n] = {in_fd, POLLOUT, 0}; idx_in = n++; }

        int wait_ms = static_cast<int>(std::min<int64_t>(kPollSliceMs, ms_until(limit)));
        int rc = poll(pfds, static_cast<nfds_t>(n), wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            log.error("poll on agent pipes failed", std::strerror(errno));
            kill_session(session, log);
            killed = true;
            break;
        }
        if (rc == 0) continue;

        if (idx_in >= 0 && (pfds[idx_in].revents & (POLLOUT | POLLERR | POLLHUP))) {
            std::lock_guard<std::mutex> lock(session.mutex_);
            ssize_t w = write(session.stdin_fd_, session.pending_stdin_.data(), session.pending_stdin_.size());
            if (w > 0) {
                session.pending_stdin_.erase(0, static_cast<size_t>(w));
            } else if (w < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                // Agent stopped reading (EPIPE); drop what is left
                session.pending_stdin_.clear();
                close_fd(session.stdin_fd_);
            }
        }
        if (idx_out >= 0 && (pfds[idx_out].revents & (POLLIN | POLLHUP | POLLERR))) {
            read_stream(session.stdout_fd_, true);
        }
        if (idx_err >= 0 && (pfds[idx_err].revents & (POLLIN | POLLHUP | POLLERR))) {
            read_stream(session.stderr_fd_, false);
        }
    }

    // Output closed: wait for the exit status within the same budget
    while (!killed && !session.try_reap()) {
        if (cancel.is_cancelled()) {
            out.cancelled = true;
            kill_session(session, log);
            break;
        }
        if (Clock::now() >= session.effective_deadline(deadline)) {
            timed_out = true;
            log.warn("Agent closed its output but did not exit before the hard timeout");
            kill_session(session, log);
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    session.close_fds();
    out.exit_code = session.exit_code_;
    out.term_signal = session.term_signal_;

    if (timed_out) {
        out.state = SessionState::timed_out;
    } else if (!out.cancelled && out.exit_code == 0) {
        out.state = SessionState::completed;
    } else {
        out.state = SessionState::failed;
    }
    session.advance(out.state);

    log.info("Agent pid " + std::to_string(session.pid()) + " ended: " +
             session_state_name(out.state) + ", exit code " + std::to_string(out.exit_code));
    return out;
}

void ProcessSupervisor::terminate(const std::string& operation_id) {
    auto session = find(operation_id);
    if (session) session->signal_group(SIGKILL);
}

void ProcessSupervisor::release(const std::string& operation_id) {
    std::shared_ptr<CliSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = registry_.find(operation_id);
        if (it == registry_.end()) return;
        session = it->second;
        registry_.erase(it);
    }
    session->advance(SessionState::terminated);
}

std::shared_ptr<CliSession> ProcessSupervisor::find(const std::string& operation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = registry_.find(operation_id);
    return it == registry_.end() ? nullptr : it->second;
}

size_t ProcessSupervisor::live_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.size();
}

} // namespace agentgate
