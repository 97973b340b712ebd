#pragma once
#include "cancellation.hpp"
#include "config.hpp"
#include "correlation.hpp"
#include "https_client.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentgate {

enum class CredentialSource { session, apikey, adc, oauth };

const char* credential_source_name(CredentialSource s);

struct Credential {
    CredentialSource source = CredentialSource::session;
    std::string token;                                  // never logged
    std::chrono::system_clock::time_point expiry;

    bool valid_at(std::chrono::system_clock::time_point now) const {
        return !token.empty() && now < expiry;
    }
    bool valid() const { return valid_at(std::chrono::system_clock::now()); }
};

struct CredentialRequest {
    std::vector<std::string> scopes;
    Deadline deadline;
    CancellationToken cancel;
};

// One tier of the resolution hierarchy. Returning nullopt means "this tier
// has nothing"; throwing means the tier failed. Either way the gate moves on.
class CredentialResolver {
public:
    virtual ~CredentialResolver() = default;
    virtual std::string name() const = 0;
    virtual std::optional<Credential> resolve(const CredentialRequest& req) = 0;
};

// In-memory active session, optionally seeded from a session file
// ({"token": "...", "expiry": <epoch seconds>}).
class SessionStore {
public:
    explicit SessionStore(std::string session_file = "") : session_file_(std::move(session_file)) {}

    std::optional<Credential> current();
    void store(const Credential& c);
    void clear();

private:
    std::mutex mutex_;
    std::optional<Credential> cached_;
    std::string session_file_;
    bool file_consumed_ = false;
};

class SessionTokenResolver : public CredentialResolver {
public:
    explicit SessionTokenResolver(std::shared_ptr<SessionStore> store) : store_(std::move(store)) {}
    std::string name() const override { return "session"; }
    std::optional<Credential> resolve(const CredentialRequest& req) override;
private:
    std::shared_ptr<SessionStore> store_;
};

class ApiKeyResolver : public CredentialResolver {
public:
    ApiKeyResolver(std::vector<std::string> env_names, int lifetime_s)
        : env_names_(std::move(env_names)), lifetime_s_(lifetime_s) {}
    std::string name() const override { return "apikey"; }
    std::optional<Credential> resolve(const CredentialRequest& req) override;
private:
    std::vector<std::string> env_names_;
    int lifetime_s_;
};

// Google Application Default Credentials (authorized_user files).
class AdcResolver : public CredentialResolver {
public:
    using HttpsPost = std::function<HttpsResponse(const std::string& host, const std::string& path,
                                                  const std::string& body, const std::string& content_type,
                                                  int timeout_ms)>;

    explicit AdcResolver(std::string adc_file = "", HttpsPost post = nullptr);
    std::string name() const override { return "adc"; }
    std::optional<Credential> resolve(const CredentialRequest& req) override;

    // Configured file, then GOOGLE_APPLICATION_CREDENTIALS, then the gcloud default
    std::string credentials_path() const;

private:
    std::string adc_file_;
    HttpsPost post_;
};

// Host-provided interactive consent (browser OAuth flow)
using ConsentFlow = std::function<std::optional<Credential>(const std::vector<std::string>& scopes)>;

class ConsentResolver : public CredentialResolver {
public:
    explicit ConsentResolver(ConsentFlow flow) : flow_(std::move(flow)) {}
    std::string name() const override { return "oauth"; }
    std::optional<Credential> resolve(const CredentialRequest& req) override;
private:
    ConsentFlow flow_;
};

class CredentialGate {
public:
    struct Tier {
        std::shared_ptr<CredentialResolver> resolver;
        std::chrono::milliseconds timeout;
    };

    CredentialGate(std::vector<Tier> tiers, std::shared_ptr<SessionStore> session);

    // session → apikey → adc → oauth, timeouts from config
    static std::shared_ptr<CredentialGate> make_default(const CredentialConfig& cfg, ConsentFlow consent);

    // Throws AgentError(authentication) when every tier fails, or
    // AgentError(cancelled) when the token trips.
    Credential resolve(const std::vector<std::string>& scopes,
                       Deadline deadline,
                       const CancellationToken& cancel,
                       const Logger& log);

    // Drops the active session so the next resolve walks the chain again
    void invalidate();

    size_t tier_count() const { return tiers_.size(); }

private:
    std::vector<Tier> tiers_;
    std::shared_ptr<SessionStore> session_;
};

} // namespace agentgate
