#pragma once
#include <string>

namespace agentgate {

struct RunOptions {
    std::string message;
    std::string system;
    std::string model;
    std::string config_path;
    bool json_mode = false;
    bool no_confirm = false;
    int timeout_ms = 0;         // 0 = from config
};

int cmd_run(const RunOptions& opts);

} // namespace agentgate
