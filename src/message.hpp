#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "utils.hpp"

namespace agentgate {

struct Message {
    std::string role;       // "user", "assistant"
    std::string content;

    nlohmann::json to_json() const {
        return {{"role", role}, {"content", content}};
    }

    static Message from_json(const nlohmann::json& j) {
        Message m;
        m.role = j.value("role", "");
        if (j.contains("content")) {
            auto& c = j["content"];
            if (c.is_string()) {
                m.content = c.get<std::string>();
            } else if (c.is_array()) {
                // Content blocks: keep text, mark everything else
                for (auto& block : c) {
                    if (!m.content.empty()) m.content += " ";
                    if (block.value("type", "") == "text") {
                        m.content += block.value("text", "");
                    } else {
                        m.content += "[Non-text content]";
                    }
                }
            }
        }
        return m;
    }
};

// Plain-text transcript written to the agent's stdin:
//   System: <preamble>\n\nHuman: ...\n\nAssistant: ...
inline std::string format_conversation(const std::string& system_preamble,
                                       const std::vector<Message>& history) {
    std::string formatted;
    if (!system_preamble.empty()) {
        formatted += "System: " + system_preamble + "\n\n";
    }
    for (auto& m : history) {
        const char* role = m.role == "user" ? "Human" : "Assistant";
        formatted += std::string(role) + ": " + m.content + "\n\n";
    }
    return trim(formatted);
}

} // namespace agentgate
