#pragma once
#include "agent_engine.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <thread>
#include <sys/stat.h>

namespace agentgate_test {

using namespace agentgate;
using namespace std::chrono_literals;

class TempDir {
public:
    TempDir() {
        char tmpl[] = "/tmp/agentgate-test-XXXXXX";
        char* p = mkdtemp(tmpl);
        if (!p) throw std::runtime_error("mkdtemp failed");
        path_ = p;
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }
    std::string file(const std::string& name) const { return path_ + "/" + name; }

private:
    std::string path_;
};

inline void write_text(const std::string& path, const std::string& text) {
    std::ofstream f(path);
    f << text;
}

// Mock agent: a /bin/sh script standing in for the real CLI
inline std::string write_script(const TempDir& dir, const std::string& name, const std::string& body) {
    std::string path = dir.file(name);
    write_text(path, "#!/bin/sh\n" + body);
    chmod(path.c_str(), 0755);
    return path;
}

inline int count_lines(const std::string& path) {
    std::ifstream f(path);
    std::string line;
    int n = 0;
    while (std::getline(f, line)) n++;
    return n;
}

// Always hands out the same token
class StaticResolver : public CredentialResolver {
public:
    explicit StaticResolver(std::string token, std::string name = "static")
        : token_(std::move(token)), name_(std::move(name)) {}

    std::string name() const override { return name_; }
    std::optional<Credential> resolve(const CredentialRequest&) override {
        calls++;
        Credential c;
        c.source = CredentialSource::apikey;
        c.token = token_;
        c.expiry = std::chrono::system_clock::now() + std::chrono::hours(1);
        return c;
    }

    std::atomic<int> calls{0};

private:
    std::string token_;
    std::string name_;
};

// Never answers before the gate gives up on it
class SlowResolver : public CredentialResolver {
public:
    explicit SlowResolver(std::chrono::milliseconds delay) : delay_(delay) {}
    std::string name() const override { return "slow"; }
    std::optional<Credential> resolve(const CredentialRequest&) override {
        std::this_thread::sleep_for(delay_);
        return std::nullopt;
    }
private:
    std::chrono::milliseconds delay_;
};

class ThrowingResolver : public CredentialResolver {
public:
    std::string name() const override { return "broken"; }
    std::optional<Credential> resolve(const CredentialRequest&) override {
        throw std::runtime_error("credential helper crashed");
    }
};

inline std::shared_ptr<CredentialGate> static_gate(std::shared_ptr<StaticResolver> resolver) {
    std::vector<CredentialGate::Tier> tiers = {{resolver, 1000ms}};
    return std::make_shared<CredentialGate>(std::move(tiers), std::make_shared<SessionStore>());
}

inline std::shared_ptr<CredentialGate> static_gate(const std::string& token) {
    return static_gate(std::make_shared<StaticResolver>(token));
}

// Short timeouts and fast backoff for mock agents
inline Config mock_config(const std::string& executable) {
    Config cfg;
    cfg.agent.executable = executable;
    cfg.agent.timeout_ms = 5000;
    cfg.agent.credential_env = "AGENTGATE_TEST_TOKEN";
    cfg.engine.max_concurrency = 2;
    cfg.engine.approval_timeout_ms = 2000;
    cfg.engine.operation_timeout_ms = 30000;
    cfg.retry.upstream_base_ms = 10;
    cfg.retry.rate_limit_base_ms = 20;
    cfg.retry.max_delay_ms = 100;
    cfg.credentials.tier_timeout_ms = 1000;
    return cfg;
}

struct Collected {
    std::vector<OutputEvent> events;
    std::optional<Result> result;
    std::optional<ClassifiedError> error;
    int terminal_items = 0;
};

inline Collected drain(EventStream& stream) {
    Collected c;
    while (auto item = stream.next()) {
        if (auto* ev = std::get_if<OutputEvent>(&*item)) {
            c.events.push_back(*ev);
        } else if (auto* r = std::get_if<Result>(&*item)) {
            c.result = *r;
            c.terminal_items++;
        } else if (auto* e = std::get_if<ClassifiedError>(&*item)) {
            c.error = *e;
            c.terminal_items++;
        }
    }
    return c;
}

inline std::vector<Message> ask(const std::string& text) {
    return {Message{"user", text}};
}

} // namespace agentgate_test
