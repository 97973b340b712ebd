#include <iostream>
#include <string>
#include <vector>
#include "onboard.hpp"
#include "run_cmd.hpp"
#include "status.hpp"

static void print_usage() {
    std::cout << "Usage: agentgate <command> [options]\n\n"
              << "Commands:\n"
              << "  init [--config PATH] [--force]\n"
              << "                              Write a default ~/.agentgate/config.json\n"
              << "  run -m MSG [--system TEXT] [--model ID] [--json]\n"
              << "        [--no-confirm] [--timeout MS] [--config PATH]\n"
              << "                              Send one message through the local agent\n"
              << "  status [--config PATH]      Show configuration and credential sources\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string cmd = argv[1];
    std::vector<std::string> args;
    for (int i = 2; i < argc; i++) {
        args.push_back(argv[i]);
    }

    std::string config_path;
    for (size_t i = 0; i + 1 < args.size(); i++) {
        if (args[i] == "--config") config_path = args[i + 1];
    }

    if (cmd == "init") {
        bool force = false;
        for (auto& a : args) {
            if (a == "--force") force = true;
        }
        return agentgate::cmd_init(config_path, force);
    }
    else if (cmd == "run") {
        agentgate::RunOptions opts;
        opts.config_path = config_path;
        for (size_t i = 0; i < args.size(); i++) {
            if ((args[i] == "-m" || args[i] == "--message") && i + 1 < args.size()) {
                opts.message = args[++i];
            } else if (args[i] == "--system" && i + 1 < args.size()) {
                opts.system = args[++i];
            } else if (args[i] == "--model" && i + 1 < args.size()) {
                opts.model = args[++i];
            } else if (args[i] == "--timeout" && i + 1 < args.size()) {
                try {
                    opts.timeout_ms = std::stoi(args[++i]);
                } catch (const std::exception&) {
                    std::cerr << "Invalid --timeout value: " << args[i] << "\n";
                    return 1;
                }
            } else if (args[i] == "--json") {
                opts.json_mode = true;
            } else if (args[i] == "--no-confirm") {
                opts.no_confirm = true;
            } else if (args[i] == "--config") {
                ++i;
            }
        }
        try {
            return agentgate::cmd_run(opts);
        } catch (const std::exception& e) {
            std::cerr << "[error] " << e.what() << "\n";
            return 1;
        }
    }
    else if (cmd == "status") {
        return agentgate::cmd_status(config_path);
    }
    else {
        std::cerr << "Unknown command: " << cmd << "\n";
        print_usage();
        return 1;
    }
}
