#pragma once
#include "config.hpp"
#include "correlation.hpp"
#include "output_event.hpp"
#include <string>
#include <vector>

namespace agentgate {

// Incremental classifier for agent stdout. Feed chunks in arrival order;
// each complete line (or complete JSON object) becomes one event as soon
// as it is seen. Never throws on malformed input.
class OutputClassifier {
public:
    OutputClassifier(const ClassifierConfig& cfg, Logger log);

    std::vector<OutputEvent> feed(const std::string& chunk);

    // Prompts end without a newline. Once stdout has gone quiet, a partial
    // line carrying only a confirmation marker is classified on its own.
    bool prompt_pending() const;
    std::vector<OutputEvent> flush_prompt();

    bool has_partial_line() const { return !line_buf_.empty() || mode_ == Mode::json; }

    // End of stream: flushes the partial line and degrades an unclosed
    // JSON candidate to text with a warning.
    std::vector<OutputEvent> finish();

    // Drops buffered input for a fresh attempt; sequence numbers keep going.
    void reset();

    bool saw_malformed_output() const { return malformed_; }

    static bool is_dangerous(const std::string& action, const std::vector<std::string>& deny_list);

private:
    enum class Mode { line, json };

    ClassifierConfig cfg_;
    Logger log_;
    uint64_t next_seq_ = 1;
    bool malformed_ = false;

    Mode mode_ = Mode::line;
    std::string line_buf_;
    std::string json_buf_;
    int json_depth_ = 0;
    bool json_in_string_ = false;
    bool json_escape_ = false;
    bool json_closed_ = false;      // depth hit zero; waiting for end of line

    void consume(char c, std::vector<OutputEvent>& out);
    void end_line(std::vector<OutputEvent>& out);
    void scan_json(char c);
    void json_line_boundary(std::vector<OutputEvent>& out);
    void flush_json_as_text(std::vector<OutputEvent>& out, const std::string& warning);
    void emit_structured_candidate(std::vector<OutputEvent>& out);
    void reset_json();

    // Marker rules (1-3), then the given JSON value (4), then text (5)
    void classify_unit(const std::string& raw, const nlohmann::json* parsed,
                       std::vector<OutputEvent>& out, const std::string& warning = "");
    OutputEvent make_event(const std::string& raw, EventPayload payload);
};

} // namespace agentgate
