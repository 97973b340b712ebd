#pragma once
#include <nlohmann/json.hpp>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace agentgate {

enum class Severity { debug, info, warn, error };

const char* severity_name(Severity s);
Severity parse_severity(const std::string& s, Severity fallback = Severity::warn);

// 16 bytes from the OpenSSL CSPRNG, hex encoded (32 chars).
std::string new_correlation_id();

struct LogRecord {
    std::string correlation_id;
    std::string timestamp;
    Severity severity = Severity::info;
    std::string component;
    std::string message;
    std::string technical_detail;   // optional, never shown to users

    nlohmann::json to_json() const;
};

// Append-only structured sink shared by every operation. The newest
// records are kept in a bounded in-memory ring; the optional JSON-lines
// file keeps all of them. Records may also be echoed to stderr.
// Registered secrets are replaced by "[redacted]" before anything is stored.
class LogSink {
public:
    static constexpr size_t kDefaultMemoryRecords = 10000;

    LogSink() = default;
    LogSink(const std::string& file_path, Severity echo_level, bool echo_enabled = true,
            size_t memory_records = kDefaultMemoryRecords);

    void append(LogRecord record);

    // Token material that must never appear in a record
    void add_secret(const std::string& secret);

    std::vector<LogRecord> records() const;
    std::vector<LogRecord> records_for(const std::string& correlation_id) const;

private:
    mutable std::mutex mutex_;
    std::deque<LogRecord> records_;
    size_t capacity_ = kDefaultMemoryRecords;
    std::vector<std::string> secrets_;
    std::string file_path_;
    bool echo_enabled_ = false;
    Severity echo_level_ = Severity::warn;

    std::string redact(std::string text) const;
};

// Handle binding a sink to one component and one correlation id.
class Logger {
public:
    Logger(std::shared_ptr<LogSink> sink, std::string component, std::string correlation_id = "")
        : sink_(std::move(sink)), component_(std::move(component)), cid_(std::move(correlation_id)) {}

    Logger with_component(const std::string& component) const { return Logger(sink_, component, cid_); }

    void debug(const std::string& msg, const std::string& detail = "") const { log(Severity::debug, msg, detail); }
    void info(const std::string& msg, const std::string& detail = "") const { log(Severity::info, msg, detail); }
    void warn(const std::string& msg, const std::string& detail = "") const { log(Severity::warn, msg, detail); }
    void error(const std::string& msg, const std::string& detail = "") const { log(Severity::error, msg, detail); }

    void log(Severity s, const std::string& msg, const std::string& detail = "") const;

    const std::string& correlation_id() const { return cid_; }
    const std::shared_ptr<LogSink>& sink() const { return sink_; }

private:
    std::shared_ptr<LogSink> sink_;
    std::string component_;
    std::string cid_;
};

} // namespace agentgate
