#include "credential_gate.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace agentgate {

const char* credential_source_name(CredentialSource s) {
    switch (s) {
    case CredentialSource::session: return "session";
    case CredentialSource::apikey:  return "apikey";
    case CredentialSource::adc:     return "adc";
    case CredentialSource::oauth:   return "oauth";
    }
    return "session";
}

// ── SessionStore ────────────────────────────────────────────────────

std::optional<Credential> SessionStore::current() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!cached_ && !file_consumed_ && !session_file_.empty()) {
        file_consumed_ = true;
        std::string text = read_file(session_file_);
        if (!text.empty()) {
            auto j = nlohmann::json::parse(text, nullptr, false);
            if (j.is_object() && j.contains("token") && j["token"].is_string()) {
                Credential c;
                c.source = CredentialSource::session;
                c.token = j["token"].get<std::string>();
                c.expiry = std::chrono::system_clock::time_point(
                    std::chrono::seconds(j.value("expiry", int64_t{0})));
                cached_ = c;
            }
        }
    }

    if (!cached_) return std::nullopt;
    if (!cached_->valid()) {
        // Past expiry: never reuse, force the chain to run again
        cached_.reset();
        return std::nullopt;
    }
    return cached_;
}

void SessionStore::store(const Credential& c) {
    std::lock_guard<std::mutex> lock(mutex_);
    cached_ = c;
}

void SessionStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cached_.reset();
    file_consumed_ = true;
}

// ── Tiers ───────────────────────────────────────────────────────────

std::optional<Credential> SessionTokenResolver::resolve(const CredentialRequest&) {
    auto c = store_->current();
    if (!c) return std::nullopt;
    c->source = CredentialSource::session;
    return c;
}

std::optional<Credential> ApiKeyResolver::resolve(const CredentialRequest&) {
    for (auto& name : env_names_) {
        std::string key = env_or(name.c_str());
        if (key.empty()) continue;
        Credential c;
        c.source = CredentialSource::apikey;
        c.token = key;
        c.expiry = std::chrono::system_clock::now() + std::chrono::seconds(lifetime_s_);
        return c;
    }
    return std::nullopt;
}

AdcResolver::AdcResolver(std::string adc_file, HttpsPost post)
    : adc_file_(std::move(adc_file)), post_(std::move(post)) {
    if (!post_) post_ = https_post;
}

std::string AdcResolver::credentials_path() const {
    if (!adc_file_.empty()) return expand_path(adc_file_);
    std::string env = env_or("GOOGLE_APPLICATION_CREDENTIALS");
    if (!env.empty()) return env;
    std::string cfg = env_or("CLOUDSDK_CONFIG", home_dir() + "/.config/gcloud");
    return cfg + "/application_default_credentials.json";
}

std::optional<Credential> AdcResolver::resolve(const CredentialRequest& req) {
    std::string path = credentials_path();
    if (!fs::exists(path)) return std::nullopt;

    auto j = nlohmann::json::parse(read_file(path), nullptr, false);
    if (!j.is_object()) {
        throw std::runtime_error("ADC file is not valid JSON: " + path);
    }

    std::string type = j.value("type", "");
    if (type != "authorized_user") {
        throw std::runtime_error("Unsupported ADC credential type '" + type + "' in " + path);
    }

    std::string body = "grant_type=refresh_token"
                       "&client_id=" + form_encode(j.value("client_id", "")) +
                       "&client_secret=" + form_encode(j.value("client_secret", "")) +
                       "&refresh_token=" + form_encode(j.value("refresh_token", ""));

    int timeout_ms = static_cast<int>(ms_until(req.deadline));
    if (timeout_ms <= 0) return std::nullopt;

    auto resp = post_("oauth2.googleapis.com", "/token", body,
                      "application/x-www-form-urlencoded", timeout_ms);
    if (!resp.error.empty()) {
        throw std::runtime_error(resp.error);
    }
    if (!resp.ok()) {
        throw std::runtime_error("ADC token exchange returned HTTP " + std::to_string(resp.status));
    }

    auto tok = nlohmann::json::parse(resp.body, nullptr, false);
    if (!tok.is_object() || !tok.contains("access_token")) {
        throw std::runtime_error("ADC token exchange returned no access_token");
    }

    Credential c;
    c.source = CredentialSource::adc;
    c.token = tok["access_token"].get<std::string>();
    c.expiry = std::chrono::system_clock::now() +
               std::chrono::seconds(tok.value("expires_in", 3600));
    return c;
}

std::optional<Credential> ConsentResolver::resolve(const CredentialRequest& req) {
    if (!flow_) return std::nullopt;
    auto c = flow_(req.scopes);
    if (c) c->source = CredentialSource::oauth;
    return c;
}

// ── CredentialGate ──────────────────────────────────────────────────

CredentialGate::CredentialGate(std::vector<Tier> tiers, std::shared_ptr<SessionStore> session)
    : tiers_(std::move(tiers)), session_(std::move(session)) {}

std::shared_ptr<CredentialGate> CredentialGate::make_default(const CredentialConfig& cfg, ConsentFlow consent) {
    auto session = std::make_shared<SessionStore>(expand_path(cfg.session_file));
    auto tier_timeout = std::chrono::milliseconds(cfg.tier_timeout_ms);

    std::vector<Tier> tiers;
    tiers.push_back({std::make_shared<SessionTokenResolver>(session), tier_timeout});
    tiers.push_back({std::make_shared<ApiKeyResolver>(cfg.api_key_env, cfg.api_key_lifetime_s), tier_timeout});
    tiers.push_back({std::make_shared<AdcResolver>(cfg.adc_file), tier_timeout});
    tiers.push_back({std::make_shared<ConsentResolver>(std::move(consent)),
                     std::chrono::milliseconds(cfg.consent_timeout_ms)});
    return std::make_shared<CredentialGate>(std::move(tiers), session);
}

void CredentialGate::invalidate() {
    if (session_) session_->clear();
}

Credential CredentialGate::resolve(const std::vector<std::string>& scopes,
                                   Deadline deadline,
                                   const CancellationToken& cancel,
                                   const Logger& log) {
    const std::string& cid = log.correlation_id();
    std::string failures;

    for (auto& tier : tiers_) {
        const std::string tier_name = tier.resolver->name();

        if (cancel.is_cancelled()) {
            throw AgentError(make_error(ErrorCategory::cancelled, cid, "cancelled during credential resolution"));
        }
        if (Clock::now() >= deadline) {
            failures += tier_name + ": deadline reached; ";
            log.warn("Credential deadline reached before tier '" + tier_name + "'");
            break;
        }

        CredentialRequest req;
        req.scopes = scopes;
        req.deadline = std::min(deadline, Clock::now() + tier.timeout);
        req.cancel = cancel;

        log.debug("Trying credential tier '" + tier_name + "'");
        auto resolver = tier.resolver;
        auto result = await_with_deadline<std::optional<Credential>>(
            [resolver, req] { return resolver->resolve(req); }, req.deadline, cancel);

        if (result.status == WaitStatus::cancelled) {
            throw AgentError(make_error(ErrorCategory::cancelled, cid, "cancelled during credential tier " + tier_name));
        }
        if (result.status == WaitStatus::timed_out) {
            failures += tier_name + ": timed out; ";
            log.warn("Credential tier '" + tier_name + "' timed out");
            continue;
        }
        if (result.error) {
            std::string what = "unknown failure";
            try {
                std::rethrow_exception(result.error);
            } catch (const std::exception& e) {
                what = e.what();
            } catch (...) {
                what = "non-standard exception";
            }
            failures += tier_name + ": " + what + "; ";
            log.warn("Credential tier '" + tier_name + "' failed", what);
            continue;
        }

        const std::optional<Credential>& cred = *result.value;
        if (!cred || !cred->valid()) {
            failures += tier_name + ": unavailable; ";
            log.debug("Credential tier '" + tier_name + "' has no usable credential");
            continue;
        }

        if (log.sink()) log.sink()->add_secret(cred->token);
        if (session_) session_->store(*cred);
        log.info(std::string("Credential resolved via ") + credential_source_name(cred->source));
        return *cred;
    }

    log.error("All credential tiers failed", failures);
    throw AgentError(make_error(ErrorCategory::authentication, cid, "all credential tiers failed: " + failures));
}

} // namespace agentgate
