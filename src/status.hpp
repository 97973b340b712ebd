#pragma once
#include "config.hpp"

namespace agentgate {
int cmd_status(const std::string& config_path = "");
} // namespace agentgate
