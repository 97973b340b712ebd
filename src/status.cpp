#include "status.hpp"
#include "credential_gate.hpp"
#include <iostream>
#include <sstream>
#include <unistd.h>

namespace agentgate {

// PATH lookup the way execvp does it
static std::string find_on_path(const std::string& exe) {
    if (exe.find('/') != std::string::npos) {
        return access(exe.c_str(), X_OK) == 0 ? exe : "";
    }
    std::stringstream path(env_or("PATH", "/usr/local/bin:/usr/bin:/bin"));
    std::string dir;
    while (std::getline(path, dir, ':')) {
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + exe;
        if (access(candidate.c_str(), X_OK) == 0) return candidate;
    }
    return "";
}

int cmd_status(const std::string& config_path) {
    std::string cfg_path = config_path.empty() ? default_config_path() : config_path;
    Config cfg = Config::load(cfg_path);
    int issues = 0;

    std::cout << "=== agentgate status ===\n";
    std::cout << "Config path  : " << cfg_path << (fs::exists(cfg_path) ? "" : " (defaults)") << "\n";
    std::cout << "Agent        : " << cfg.agent.executable;
    for (auto& a : cfg.agent_arguments()) std::cout << " " << a;
    std::cout << "\n";
    std::cout << "Model        : " << (cfg.agent.model.empty() ? "(agent default)" : cfg.agent.model) << "\n";
    std::cout << "Timeout      : " << cfg.agent.timeout_ms << " ms per process, "
              << cfg.engine.operation_timeout_ms << " ms per operation\n";
    std::cout << "Concurrency  : " << cfg.engine.max_concurrency << "\n";
    std::cout << "Approvals    : " << cfg.engine.approval_timeout_ms << " ms timeout, "
              << cfg.classifier.deny_list.size() << " deny-list entries\n";
    std::cout << "Log file     : " << (cfg.logging.file.empty() ? "(none)" : cfg.log_file_path())
              << ", echo " << cfg.logging.echo_level << "\n";

    std::cout << "\n";
    std::string exe = find_on_path(cfg.agent.executable);
    if (!exe.empty()) {
        std::cout << "[OK]   Agent executable: " << exe << "\n";
    } else {
        std::cout << "[FAIL] Agent executable not found: " << cfg.agent.executable << "\n";
        std::cout << "       Install it or set agent.executable in " << cfg_path << "\n";
        issues++;
    }

    // Credential tiers, in resolution order. Tokens are never printed.
    int available = 0;
    SessionStore session(cfg.session_file_path());
    if (session.current()) {
        std::cout << "[OK]   Session token: " << cfg.session_file_path() << "\n";
        available++;
    } else {
        std::cout << "[--]   Session token: none\n";
    }

    std::string key_env;
    for (auto& name : cfg.credentials.api_key_env) {
        if (!env_or(name.c_str()).empty()) { key_env = name; break; }
    }
    if (!key_env.empty()) {
        std::cout << "[OK]   API key: $" << key_env << "\n";
        available++;
    } else {
        std::cout << "[--]   API key: none of";
        for (auto& name : cfg.credentials.api_key_env) std::cout << " $" << name;
        std::cout << " set\n";
    }

    AdcResolver adc(cfg.credentials.adc_file);
    std::string adc_path = adc.credentials_path();
    if (!adc_path.empty() && fs::exists(adc_path)) {
        std::cout << "[OK]   Application default credentials: " << adc_path << "\n";
        available++;
    } else {
        std::cout << "[--]   Application default credentials: not found\n";
    }

    std::cout << "[--]   Interactive consent: not available in the terminal host\n";

    if (available == 0) {
        std::cout << "[FAIL] No credential source available\n";
        std::cout << "       Set $" << (cfg.credentials.api_key_env.empty() ? "GEMINI_API_KEY"
                                                                          : cfg.credentials.api_key_env.front())
                  << " or run 'gcloud auth application-default login'\n";
        issues++;
    }

    std::cout << "\n";
    if (issues == 0) {
        std::cout << "All checks passed.\n";
    } else {
        std::cout << issues << " issue(s) found.\n";
    }
    return issues > 0 ? 1 : 0;
}

} // namespace agentgate
