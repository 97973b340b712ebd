#include "config.hpp"
#include <fstream>
#include <iostream>

namespace agentgate {

std::vector<std::string> Config::agent_arguments() const {
    std::vector<std::string> args;
    if (agent.json_mode) {
        args.push_back("--json");
    } else if (agent.interactive_mode) {
        args.push_back("--interactive");
    }
    if (!agent.model.empty()) {
        args.push_back("--model");
        args.push_back(agent.model);
    }
    if (agent.confirm_actions) {
        args.push_back("--confirm-actions");
    }
    return args;
}

Config Config::make_default() {
    return Config{};
}

nlohmann::json Config::to_json() const {
    nlohmann::json j;

    auto& a = j["agent"];
    a["executable"] = agent.executable;
    if (!agent.model.empty()) a["model"] = agent.model;
    a["json_mode"] = agent.json_mode;
    a["interactive_mode"] = agent.interactive_mode;
    a["confirm_actions"] = agent.confirm_actions;
    a["timeout_ms"] = agent.timeout_ms;
    a["stdin_idle_close_ms"] = agent.stdin_idle_close_ms;
    a["credential_env"] = agent.credential_env;
    a["approve_reply"] = agent.approve_reply;
    a["deny_reply"] = agent.deny_reply;

    auto& e = j["engine"];
    e["max_concurrency"] = engine.max_concurrency;
    e["approval_timeout_ms"] = engine.approval_timeout_ms;
    e["operation_timeout_ms"] = engine.operation_timeout_ms;

    auto& c = j["classifier"];
    c["deny_list"] = classifier.deny_list;
    c["max_json_bytes"] = classifier.max_json_bytes;
    c["prompt_idle_ms"] = classifier.prompt_idle_ms;

    auto& cr = j["credentials"];
    cr["scopes"] = credentials.scopes;
    cr["api_key_env"] = credentials.api_key_env;
    cr["api_key_lifetime_s"] = credentials.api_key_lifetime_s;
    cr["tier_timeout_ms"] = credentials.tier_timeout_ms;
    cr["consent_timeout_ms"] = credentials.consent_timeout_ms;
    cr["session_file"] = credentials.session_file;
    if (!credentials.adc_file.empty()) cr["adc_file"] = credentials.adc_file;

    auto& r = j["retry"];
    r["upstream_base_ms"] = retry.upstream_base_ms;
    r["rate_limit_base_ms"] = retry.rate_limit_base_ms;
    r["max_delay_ms"] = retry.max_delay_ms;
    r["upstream_attempts"] = retry.upstream_attempts;
    r["rate_limit_attempts"] = retry.rate_limit_attempts;

    auto& l = j["logging"];
    if (!logging.file.empty()) l["file"] = logging.file;
    l["echo_level"] = logging.echo_level;
    l["memory_records"] = logging.memory_records;

    return j;
}

static std::vector<std::string> parse_string_array(const nlohmann::json& arr) {
    std::vector<std::string> result;
    if (arr.is_array()) {
        for (auto& item : arr) {
            if (item.is_string()) result.push_back(item.get<std::string>());
        }
    }
    return result;
}

Config Config::from_json(const nlohmann::json& j) {
    Config c;

    if (j.contains("agent")) {
        auto& a = j["agent"];
        c.agent.executable = a.value("executable", c.agent.executable);
        c.agent.model = a.value("model", c.agent.model);
        c.agent.json_mode = a.value("json_mode", c.agent.json_mode);
        c.agent.interactive_mode = a.value("interactive_mode", c.agent.interactive_mode);
        c.agent.confirm_actions = a.value("confirm_actions", c.agent.confirm_actions);
        c.agent.timeout_ms = a.value("timeout_ms", c.agent.timeout_ms);
        c.agent.stdin_idle_close_ms = a.value("stdin_idle_close_ms", c.agent.stdin_idle_close_ms);
        c.agent.credential_env = a.value("credential_env", c.agent.credential_env);
        c.agent.approve_reply = a.value("approve_reply", c.agent.approve_reply);
        c.agent.deny_reply = a.value("deny_reply", c.agent.deny_reply);
    }

    if (j.contains("engine")) {
        auto& e = j["engine"];
        c.engine.max_concurrency = e.value("max_concurrency", c.engine.max_concurrency);
        c.engine.approval_timeout_ms = e.value("approval_timeout_ms", c.engine.approval_timeout_ms);
        c.engine.operation_timeout_ms = e.value("operation_timeout_ms", c.engine.operation_timeout_ms);
    }
    if (c.engine.max_concurrency < 1) c.engine.max_concurrency = 1;
    if (c.engine.operation_timeout_ms < 1) c.engine.operation_timeout_ms = 1;
    if (c.agent.stdin_idle_close_ms < 0) c.agent.stdin_idle_close_ms = 0;

    if (j.contains("classifier")) {
        auto& cl = j["classifier"];
        if (cl.contains("deny_list")) c.classifier.deny_list = parse_string_array(cl["deny_list"]);
        c.classifier.max_json_bytes = cl.value("max_json_bytes", c.classifier.max_json_bytes);
        c.classifier.prompt_idle_ms = cl.value("prompt_idle_ms", c.classifier.prompt_idle_ms);
    }

    if (j.contains("credentials")) {
        auto& cr = j["credentials"];
        if (cr.contains("scopes")) c.credentials.scopes = parse_string_array(cr["scopes"]);
        if (cr.contains("api_key_env")) c.credentials.api_key_env = parse_string_array(cr["api_key_env"]);
        c.credentials.api_key_lifetime_s = cr.value("api_key_lifetime_s", c.credentials.api_key_lifetime_s);
        c.credentials.tier_timeout_ms = cr.value("tier_timeout_ms", c.credentials.tier_timeout_ms);
        c.credentials.consent_timeout_ms = cr.value("consent_timeout_ms", c.credentials.consent_timeout_ms);
        c.credentials.session_file = cr.value("session_file", c.credentials.session_file);
        c.credentials.adc_file = cr.value("adc_file", c.credentials.adc_file);
    }

    if (j.contains("retry")) {
        auto& r = j["retry"];
        c.retry.upstream_base_ms = r.value("upstream_base_ms", c.retry.upstream_base_ms);
        c.retry.rate_limit_base_ms = r.value("rate_limit_base_ms", c.retry.rate_limit_base_ms);
        c.retry.max_delay_ms = r.value("max_delay_ms", c.retry.max_delay_ms);
        c.retry.upstream_attempts = r.value("upstream_attempts", c.retry.upstream_attempts);
        c.retry.rate_limit_attempts = r.value("rate_limit_attempts", c.retry.rate_limit_attempts);
    }

    if (j.contains("logging")) {
        auto& l = j["logging"];
        c.logging.file = l.value("file", c.logging.file);
        c.logging.echo_level = l.value("echo_level", c.logging.echo_level);
        c.logging.memory_records = l.value("memory_records", c.logging.memory_records);
    }

    return c;
}

Config Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[warn] Config not found at " << path << ", using defaults\n";
        return make_default();
    }
    try {
        nlohmann::json j = nlohmann::json::parse(f);
        return from_json(j);
    } catch (const std::exception& e) {
        std::cerr << "[warn] Failed to parse config: " << e.what() << ", using defaults\n";
        return make_default();
    }
}

void Config::save(const std::string& path) const {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream f(path);
    f << to_json().dump(2) << std::endl;
}

} // namespace agentgate
