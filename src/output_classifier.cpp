#include "output_classifier.hpp"
#include "utils.hpp"
#include <cctype>

namespace agentgate {

namespace {

const char* const kReasoningMarkers[] = {"Thinking:", "Reasoning:"};
const char* const kActionMarkers[] = {"Tool:", "Action:"};
const char* const kConfirmMarkers[] = {"Confirm:", "Proceed?", "[Y/n]"};

template <size_t N>
bool has_marker(const std::string& text, const char* const (&markers)[N]) {
    for (auto m : markers) {
        if (text.find(m) != std::string::npos) return true;
    }
    return false;
}

// Earliest action marker; returns npos when absent
size_t action_marker_end(const std::string& text) {
    size_t best = std::string::npos;
    size_t best_end = std::string::npos;
    for (auto m : kActionMarkers) {
        size_t pos = text.find(m);
        if (pos != std::string::npos && (best == std::string::npos || pos < best)) {
            best = pos;
            best_end = pos + std::char_traits<char>::length(m);
        }
    }
    return best_end;
}

// SAX consumer that only records whether the input broke off early or is
// actually invalid.
class JsonProbe : public nlohmann::json_sax<nlohmann::json> {
public:
    bool failed = false;
    bool truncated = false;

    bool null() override { return true; }
    bool boolean(bool) override { return true; }
    bool number_integer(number_integer_t) override { return true; }
    bool number_unsigned(number_unsigned_t) override { return true; }
    bool number_float(number_float_t, const string_t&) override { return true; }
    bool string(string_t&) override { return true; }
    bool binary(binary_t&) override { return true; }
    bool start_object(std::size_t) override { return true; }
    bool key(string_t&) override { return true; }
    bool end_object() override { return true; }
    bool start_array(std::size_t) override { return true; }
    bool end_array() override { return true; }

    bool parse_error(std::size_t, const std::string&, const nlohmann::detail::exception& ex) override {
        failed = true;
        truncated = std::string(ex.what()).find("unexpected end of input") != std::string::npos;
        return false;
    }
};

} // namespace

OutputClassifier::OutputClassifier(const ClassifierConfig& cfg, Logger log)
    : cfg_(cfg), log_(std::move(log)) {}

bool OutputClassifier::is_dangerous(const std::string& action, const std::vector<std::string>& deny_list) {
    std::string lower = to_lower(action);
    for (auto& entry : deny_list) {
        if (entry.empty()) continue;
        if (lower.find(to_lower(entry)) != std::string::npos) return true;
    }
    return false;
}

void OutputClassifier::reset() {
    mode_ = Mode::line;
    line_buf_.clear();
    reset_json();
}

void OutputClassifier::reset_json() {
    json_buf_.clear();
    json_depth_ = 0;
    json_in_string_ = false;
    json_escape_ = false;
    json_closed_ = false;
}

std::vector<OutputEvent> OutputClassifier::feed(const std::string& chunk) {
    std::vector<OutputEvent> out;
    for (char c : chunk) consume(c, out);

    // A closed object at the end of a chunk is complete; don't wait for '\n'
    if (mode_ == Mode::json && json_closed_) {
        emit_structured_candidate(out);
        reset_json();
        mode_ = Mode::line;
    }

    return out;
}

bool OutputClassifier::prompt_pending() const {
    return mode_ == Mode::line && !line_buf_.empty() &&
           has_marker(line_buf_, kConfirmMarkers) &&
           !has_marker(line_buf_, kReasoningMarkers) &&
           action_marker_end(line_buf_) == std::string::npos;
}

std::vector<OutputEvent> OutputClassifier::flush_prompt() {
    std::vector<OutputEvent> out;
    if (!prompt_pending()) return out;
    std::string pending;
    pending.swap(line_buf_);
    classify_unit(pending, nullptr, out);
    return out;
}

std::vector<OutputEvent> OutputClassifier::finish() {
    std::vector<OutputEvent> out;
    if (mode_ == Mode::json) {
        if (json_closed_) {
            emit_structured_candidate(out);
        } else {
            malformed_ = true;
            log_.warn("MalformedOutput: unterminated structured output at end of stream",
                      std::to_string(json_buf_.size()) + " bytes buffered");
            flush_json_as_text(out, "unterminated structured output");
        }
        reset_json();
        mode_ = Mode::line;
    }
    if (!line_buf_.empty()) end_line(out);
    return out;
}

void OutputClassifier::consume(char c, std::vector<OutputEvent>& out) {
    if (mode_ == Mode::line) {
        if (c == '\n') {
            line_buf_ += c;
            end_line(out);
            return;
        }
        if (c == '{' && trim(line_buf_).empty()) {
            mode_ = Mode::json;
            json_buf_.swap(line_buf_);
            line_buf_.clear();
            json_buf_ += c;
            json_depth_ = 1;
            return;
        }
        line_buf_ += c;
        return;
    }

    json_buf_ += c;

    if (json_closed_) {
        if (c == '\n') {
            emit_structured_candidate(out);
            reset_json();
            mode_ = Mode::line;
        } else if (!std::isspace(static_cast<unsigned char>(c))) {
            // Text after the closing brace: the line is not a lone object
            line_buf_ = json_buf_;
            reset_json();
            mode_ = Mode::line;
        }
        return;
    }

    scan_json(c);
    if (json_depth_ == 0) {
        json_closed_ = true;
    } else if (c == '\n') {
        json_line_boundary(out);
    } else if (json_buf_.size() > cfg_.max_json_bytes) {
        log_.warn("Structured output exceeded " + std::to_string(cfg_.max_json_bytes) + " bytes");
        flush_json_as_text(out, "structured output exceeded size limit");
        reset_json();
        mode_ = Mode::line;
    }
}

void OutputClassifier::scan_json(char c) {
    if (json_in_string_) {
        if (json_escape_) {
            json_escape_ = false;
        } else if (c == '\\') {
            json_escape_ = true;
        } else if (c == '"') {
            json_in_string_ = false;
        }
        return;
    }
    switch (c) {
    case '"': json_in_string_ = true; break;
    case '{':
    case '[': json_depth_++; break;
    case '}':
    case ']': json_depth_--; break;
    default: break;
    }
}

void OutputClassifier::json_line_boundary(std::vector<OutputEvent>& out) {
    // Raw newlines cannot sit inside a JSON token, so anything other than
    // "ran out of input" means this was never JSON.
    JsonProbe probe;
    nlohmann::json::sax_parse(json_buf_, &probe);
    if (probe.failed && !probe.truncated) {
        flush_json_as_text(out, "");
        reset_json();
        mode_ = Mode::line;
    }
}

void OutputClassifier::flush_json_as_text(std::vector<OutputEvent>& out, const std::string& warning) {
    if (!warning.empty()) {
        classify_unit(json_buf_, nullptr, out, warning);
        return;
    }
    size_t start = 0;
    while (start < json_buf_.size()) {
        size_t nl = json_buf_.find('\n', start);
        if (nl == std::string::npos) {
            line_buf_ += json_buf_.substr(start);
            break;
        }
        std::string line = json_buf_.substr(start, nl - start + 1);
        if (!trim(line).empty()) classify_unit(line, nullptr, out);
        start = nl + 1;
    }
}

void OutputClassifier::emit_structured_candidate(std::vector<OutputEvent>& out) {
    auto value = nlohmann::json::parse(json_buf_, nullptr, false);
    if (!value.is_discarded() && value.is_object()) {
        classify_unit(json_buf_, &value, out);
    } else {
        flush_json_as_text(out, "");
        if (!line_buf_.empty()) end_line(out);
    }
}

void OutputClassifier::end_line(std::vector<OutputEvent>& out) {
    std::string line;
    line.swap(line_buf_);
    if (trim(line).empty()) return;
    classify_unit(line, nullptr, out);
}

OutputEvent OutputClassifier::make_event(const std::string& raw, EventPayload payload) {
    OutputEvent ev;
    ev.correlation_id = log_.correlation_id();
    ev.sequence = next_seq_++;
    ev.raw = raw;
    ev.payload = std::move(payload);
    return ev;
}

void OutputClassifier::classify_unit(const std::string& raw, const nlohmann::json* parsed,
                                     std::vector<OutputEvent>& out, const std::string& warning) {
    std::string text = trim(raw);

    if (has_marker(text, kReasoningMarkers)) {
        out.push_back(make_event(raw, ReasoningEvent{text}));
    } else if (size_t end = action_marker_end(text); end != std::string::npos) {
        ToolCallEvent tc;
        tc.action = trim(text.substr(end));
        tc.dangerous = is_dangerous(tc.action, cfg_.deny_list);
        if (tc.dangerous) {
            log_.warn("Potentially dangerous tool call detected: " + tc.action);
        }
        out.push_back(make_event(raw, std::move(tc)));
    } else if (has_marker(text, kConfirmMarkers)) {
        out.push_back(make_event(raw, ConfirmationRequestEvent{text}));
    } else if (parsed && parsed->is_object()) {
        out.push_back(make_event(raw, StructuredEvent{*parsed}));
    } else {
        out.push_back(make_event(raw, TextEvent{text, warning}));
    }

    log_.debug(std::string("Classified ") + event_kind_name(out.back().kind()) +
               " #" + std::to_string(out.back().sequence));
}

} // namespace agentgate
