#pragma once
#include <string>

namespace agentgate {
int cmd_init(const std::string& config_path = "", bool force = false);
} // namespace agentgate
