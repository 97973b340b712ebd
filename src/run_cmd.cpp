#include "run_cmd.hpp"
#include "agent_engine.hpp"
#include <atomic>
#include <condition_variable>
#include <csignal>
#include <deque>
#include <iostream>
#include <mutex>
#include <thread>

namespace agentgate {

static std::atomic<bool> g_interrupted{false};

static void signal_handler(int) {
    g_interrupted = true;
}

// Terminal approvals. One reader thread owns std::cin and hands lines to
// whichever question is current; a question abandoned by the engine gives
// up after its own timeout and never takes a later answer.
class TerminalApprover {
public:
    explicit TerminalApprover(std::chrono::milliseconds timeout) : timeout_(timeout) {}

    // Anything but y/yes, EOF or silence is a denial
    Approval ask(const std::string& action) {
        std::unique_lock<std::mutex> lock(shared_->mutex);
        if (!shared_->reader_started) {
            shared_->reader_started = true;
            std::thread(read_lines, shared_).detach();
        }
        uint64_t ticket = ++shared_->current;
        shared_->lines.clear();
        std::cerr << "\n[approval] The agent wants to run: " << action << "\n"
                  << "[approval] Allow? [y/N] " << std::flush;

        bool answered = shared_->cv.wait_for(lock, timeout_, [&] {
            return shared_->current != ticket || !shared_->lines.empty() || shared_->eof;
        });
        if (!answered || shared_->current != ticket || shared_->lines.empty()) {
            if (shared_->current == ticket) std::cerr << "\n[approval] No answer, denied\n";
            return Approval::denied;
        }
        std::string answer = to_lower(trim(shared_->lines.front()));
        shared_->lines.pop_front();
        return (answer == "y" || answer == "yes") ? Approval::approved : Approval::denied;
    }

private:
    struct Shared {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<std::string> lines;
        uint64_t current = 0;
        bool reader_started = false;
        bool eof = false;
    };

    static void read_lines(std::shared_ptr<Shared> shared) {
        std::string line;
        while (std::getline(std::cin, line)) {
            {
                std::lock_guard<std::mutex> lock(shared->mutex);
                shared->lines.push_back(line);
            }
            shared->cv.notify_all();
        }
        {
            std::lock_guard<std::mutex> lock(shared->mutex);
            shared->eof = true;
        }
        shared->cv.notify_all();
    }

    std::shared_ptr<Shared> shared_ = std::make_shared<Shared>();
    std::chrono::milliseconds timeout_;
};

static void print_event(const OutputEvent& ev) {
    switch (ev.kind()) {
    case EventKind::reasoning:
        std::cout << "[reasoning] " << ev.as<ReasoningEvent>()->content << "\n";
        break;
    case EventKind::tool_call: {
        auto* tc = ev.as<ToolCallEvent>();
        std::cout << "[tool] " << tc->action;
        if (tc->decision) std::cout << " (" << approval_outcome_name(tc->decision->outcome) << ")";
        std::cout << "\n";
        break;
    }
    case EventKind::confirmation_request: {
        auto* cr = ev.as<ConfirmationRequestEvent>();
        std::cout << "[prompt] " << cr->prompt;
        if (cr->decision) std::cout << " (" << approval_outcome_name(cr->decision->outcome) << ")";
        std::cout << "\n";
        break;
    }
    case EventKind::structured:
        std::cout << ev.as<StructuredEvent>()->value.dump(2) << "\n";
        break;
    case EventKind::text: {
        auto* t = ev.as<TextEvent>();
        std::cout << t->content << "\n";
        if (!t->warning.empty()) std::cerr << "[warn] " << t->warning << "\n";
        break;
    }
    }
    std::cout << std::flush;
}

int cmd_run(const RunOptions& opts) {
    if (opts.message.empty()) {
        std::cerr << "Usage: agentgate run -m MESSAGE [--system TEXT] [--model ID] [--json]\n"
                  << "                     [--no-confirm] [--timeout MS] [--config PATH]\n";
        return 1;
    }

    Config cfg = Config::load(opts.config_path.empty() ? default_config_path() : opts.config_path);
    if (opts.no_confirm) cfg.agent.confirm_actions = false;

    bool echo = cfg.logging.echo_level != "off";
    auto sink = std::make_shared<LogSink>(cfg.log_file_path(), parse_severity(cfg.logging.echo_level), echo,
                                          cfg.logging.memory_records);

    // No browser consent in the terminal host
    auto gate = CredentialGate::make_default(cfg.credentials, nullptr);
    auto approver = std::make_shared<TerminalApprover>(
        std::chrono::milliseconds(cfg.engine.approval_timeout_ms));
    AgentEngine engine(cfg, sink, gate, [approver](const std::string& action) {
        return approver->ask(action);
    });

    SubmitOptions submit_opts;
    if (!opts.model.empty()) submit_opts.model = opts.model;
    if (opts.json_mode) submit_opts.json_mode = true;
    if (opts.timeout_ms > 0) submit_opts.timeout_ms = opts.timeout_ms;

    std::vector<Message> history = {{"user", opts.message}};
    EventStream stream = engine.submit(history, opts.system, submit_opts);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::atomic<bool> done{false};
    std::thread watcher([&] {
        while (!done) {
            if (g_interrupted) {
                std::cerr << "\n[run] Interrupted, cancelling\n";
                stream.cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    int rc = 1;
    while (auto item = stream.next()) {
        if (auto* ev = std::get_if<OutputEvent>(&*item)) {
            print_event(*ev);
        } else if (auto* result = std::get_if<Result>(&*item)) {
            for (auto& w : result->warnings) std::cerr << "[warn] " << w << "\n";
            std::cerr << "[run] Done (~" << result->usage.input_tokens << " in / ~"
                      << result->usage.output_tokens << " out tokens, ref: "
                      << result->correlation_id << ")\n";
            rc = 0;
        } else if (auto* err = std::get_if<ClassifiedError>(&*item)) {
            std::cerr << "[error] " << err->user_message << "\n";
            rc = err->category == ErrorCategory::cancelled ? 130 : 1;
        }
    }

    done = true;
    watcher.join();
    return rc;
}

} // namespace agentgate
