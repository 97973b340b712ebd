#include "onboard.hpp"
#include "config.hpp"
#include <iostream>

namespace agentgate {

int cmd_init(const std::string& config_path, bool force) {
    std::string path = config_path.empty() ? default_config_path() : config_path;

    if (fs::exists(path) && !force) {
        std::cout << "[init] Config already exists: " << path << "\n";
        std::cout << "[init] Use 'agentgate init --force' to overwrite it.\n";
        return 0;
    }

    Config cfg = Config::make_default();
    cfg.logging.file = "~/.agentgate/agentgate.log";
    try {
        cfg.save(path);
    } catch (const std::exception& e) {
        std::cerr << "[error] Could not write " << path << ": " << e.what() << "\n";
        return 1;
    }
    std::cout << "[init] Created config: " << path << "\n";

    std::cout << "\n";
    std::cout << "=== agentgate is ready ===\n";
    std::cout << "\n";
    std::cout << "  Config:   " << path << "\n";
    std::cout << "  Agent:    " << cfg.agent.executable << "\n";
    std::cout << "  Log file: " << cfg.log_file_path() << "\n";
    std::cout << "\n";
    std::cout << "  Next step: set $GEMINI_API_KEY (or run 'gcloud auth application-default login'),\n";
    std::cout << "  then 'agentgate status' to check the setup.\n";
    std::cout << "\n";
    return 0;
}

} // namespace agentgate
