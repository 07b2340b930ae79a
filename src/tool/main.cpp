#include "common/config.hpp"
#include "common/log.hpp"
#include "tool/commands.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace novelforge;

int main(int argc, char* argv[]) {
    std::string config_file;
    std::string db_path;
    bool quiet = false;
    std::vector<std::string> cmd_args;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) config_file = argv[++i];
        } else if (arg == "--db") {
            if (i + 1 < argc) db_path = argv[++i];
        } else if (arg == "-q" || arg == "--quiet") {
            quiet = true;
        } else if ((arg == "-h" || arg == "--help") && cmd_args.empty()) {
            tool::DbCLI::print_help();
            return 0;
        } else {
            cmd_args.push_back(arg);
        }
    }

    if (cmd_args.empty()) {
        tool::DbCLI::print_help();
        return 1;
    }

    Config config;
    if (!config_file.empty()) {
        auto loaded = Config::load(config_file);
        if (!loaded) {
            std::cerr << "Error: Failed to load configuration from '" << config_file << "': "
                      << config_error_message(loaded.error()) << "\n";
            return 1;
        }
        config = std::move(*loaded);
    }

    if (auto env = config.apply_env(); !env) {
        std::cerr << "Error: Invalid environment configuration: "
                  << config_error_message(env.error()) << "\n";
        return 1;
    }

    if (!db_path.empty()) {
        config.database_path = db_path;
    }

    // Initialize logging
    log::LogConfig log_config;
    log_config.level = quiet ? log::Level::Off : log::parse_level(config.log_level);
    log_config.file_path = config.log_file;
    log::init(log_config);

    int rc = tool::DbCLI(std::move(config)).run(cmd_args);

    log::shutdown();
    return rc;
}
