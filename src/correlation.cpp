#include "correlation.hpp"
#include "utils.hpp"
#include <openssl/rand.h>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace agentgate {

const char* severity_name(Severity s) {
    switch (s) {
    case Severity::debug: return "DEBUG";
    case Severity::info:  return "INFO";
    case Severity::warn:  return "WARN";
    case Severity::error: return "ERROR";
    }
    return "INFO";
}

Severity parse_severity(const std::string& s, Severity fallback) {
    std::string lower = to_lower(s);
    if (lower == "debug") return Severity::debug;
    if (lower == "info")  return Severity::info;
    if (lower == "warn" || lower == "warning") return Severity::warn;
    if (lower == "error") return Severity::error;
    return fallback;
}

std::string new_correlation_id() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed: no entropy for correlation id");
    }
    static const char* hex = "0123456789abcdef";
    std::string id;
    id.reserve(sizeof(bytes) * 2);
    for (unsigned char b : bytes) {
        id += hex[b >> 4];
        id += hex[b & 0x0f];
    }
    return id;
}

nlohmann::json LogRecord::to_json() const {
    nlohmann::json j;
    j["correlation_id"] = correlation_id;
    j["timestamp"] = timestamp;
    j["severity"] = severity_name(severity);
    j["component"] = component;
    j["message"] = message;
    if (!technical_detail.empty()) j["technical_detail"] = technical_detail;
    return j;
}

// ── LogSink ─────────────────────────────────────────────────────────

LogSink::LogSink(const std::string& file_path, Severity echo_level, bool echo_enabled,
                 size_t memory_records)
    : capacity_(memory_records), file_path_(file_path), echo_enabled_(echo_enabled), echo_level_(echo_level) {
    if (!file_path_.empty()) {
        auto parent = fs::path(file_path_).parent_path();
        if (!parent.empty()) fs::create_directories(parent);
    }
}

void LogSink::add_secret(const std::string& secret) {
    if (secret.size() < 4) return;  // too short to redact without mangling text
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& s : secrets_) {
        if (s == secret) return;
    }
    secrets_.push_back(secret);
}

std::string LogSink::redact(std::string text) const {
    for (auto& secret : secrets_) {
        size_t pos = 0;
        while ((pos = text.find(secret, pos)) != std::string::npos) {
            text.replace(pos, secret.size(), "[redacted]");
            pos += 10;
        }
    }
    return text;
}

void LogSink::append(LogRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (record.timestamp.empty()) record.timestamp = iso_timestamp_now();
    record.message = redact(std::move(record.message));
    record.technical_detail = redact(std::move(record.technical_detail));

    if (!file_path_.empty()) {
        std::ofstream f(file_path_, std::ios::app);
        if (f) {
            f << record.to_json().dump() << "\n";
        } else {
            std::cerr << "[log] Cannot append to " << file_path_ << "\n";
        }
    }

    if (echo_enabled_ && record.severity >= echo_level_) {
        std::string cid = record.correlation_id.substr(0, 8);
        std::cerr << "[" << record.component;
        if (!cid.empty()) std::cerr << ":" << cid;
        std::cerr << "] " << severity_name(record.severity) << ": " << record.message;
        if (!record.technical_detail.empty() && record.severity >= Severity::warn) {
            std::cerr << " (" << record.technical_detail << ")";
        }
        std::cerr << "\n";
    }

    if (capacity_ == 0) return;
    if (records_.size() >= capacity_) records_.pop_front();
    records_.push_back(std::move(record));
}

std::vector<LogRecord> LogSink::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<LogRecord>(records_.begin(), records_.end());
}

std::vector<LogRecord> LogSink::records_for(const std::string& correlation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<LogRecord> out;
    for (auto& r : records_) {
        if (r.correlation_id == correlation_id) out.push_back(r);
    }
    return out;
}

// ── Logger ──────────────────────────────────────────────────────────

void Logger::log(Severity s, const std::string& msg, const std::string& detail) const {
    if (!sink_) return;
    LogRecord r;
    r.correlation_id = cid_;
    r.severity = s;
    r.component = component_;
    r.message = msg;
    r.technical_detail = detail;
    sink_->append(std::move(r));
}

} // namespace agentgate
