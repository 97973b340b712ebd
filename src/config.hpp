#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "utils.hpp"

namespace agentgate {

struct AgentConfig {
    std::string executable = "gemini";
    std::string model;                  // empty = let the agent pick
    bool json_mode = false;             // --json (structured output)
    bool interactive_mode = true;       // --interactive when not in json mode
    bool confirm_actions = true;        // --confirm-actions, keeps stdin open for replies
    int timeout_ms = 60000;             // hard wall-clock limit per process, paused during approvals
    int stdin_idle_close_ms = 5000;     // quiet stdout with no open prompt closes stdin; 0 = never
    std::string credential_env = "GEMINI_API_KEY";
    std::string correlation_env = "AGENTGATE_CORRELATION_ID";
    std::string mode_env = "AGENTGATE_MODE";
    std::string approve_reply = "y";
    std::string deny_reply = "n";
};

struct EngineConfig {
    int max_concurrency = 2;
    int approval_timeout_ms = 120000;
    int operation_timeout_ms = 600000;  // whole operation incl. queueing and retries
};

struct ClassifierConfig {
    std::vector<std::string> deny_list = {
        "delete", "remove", "rm ", "drop", "truncate",
        "format", "sudo", "chmod 777", "> /dev/null"
    };
    size_t max_json_bytes = 1 << 20;
    int prompt_idle_ms = 250;           // quiet time before a newline-less prompt is classified
};

struct CredentialConfig {
    std::vector<std::string> scopes = {
        "https://www.googleapis.com/auth/generative-language",
        "https://www.googleapis.com/auth/cloud-platform"
    };
    std::vector<std::string> api_key_env = {"GEMINI_API_KEY", "GOOGLE_API_KEY"};
    int api_key_lifetime_s = 3600;
    int tier_timeout_ms = 5000;
    int consent_timeout_ms = 300000;    // 5 minutes for the browser round trip
    std::string session_file = "~/.agentgate/session.json";
    std::string adc_file;               // empty = GOOGLE_APPLICATION_CREDENTIALS or gcloud default
};

struct RetryConfig {
    int upstream_base_ms = 1000;
    int rate_limit_base_ms = 4000;
    int max_delay_ms = 30000;
    int upstream_attempts = 2;          // retries after the first failure
    int rate_limit_attempts = 2;
};

struct LoggingConfig {
    std::string file;                   // JSON lines; empty = memory + stderr only
    std::string echo_level = "warn";    // debug, info, warn, error, off
    size_t memory_records = 10000;      // in-memory ring; the file keeps everything
};

struct Config {
    AgentConfig agent;
    EngineConfig engine;
    ClassifierConfig classifier;
    CredentialConfig credentials;
    RetryConfig retry;
    LoggingConfig logging;

    // Derived helpers
    std::string session_file_path() const { return expand_path(credentials.session_file); }
    std::string log_file_path() const { return expand_path(logging.file); }

    // Arguments for the agent process (argv[1..]); never carries secrets
    std::vector<std::string> agent_arguments() const;

    static Config make_default();
    static Config load(const std::string& path);
    void save(const std::string& path) const;
    nlohmann::json to_json() const;
    static Config from_json(const nlohmann::json& j);
};

} // namespace agentgate
