#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>
#include <string>

#include "termbar/common/config.hpp"
#include "termbar/common/constants.hpp"
#include "termbar/common/logger.hpp"
#include "cli/config_command.hpp"
#include "cli/demo_command.hpp"
#include "cli/demo_error_codes.hpp"

std::string find_config_argument(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            return argv[i + 1];
        }
        const std::string prefix = "--config=";
        if (arg.compare(0, prefix.size(), prefix) == 0) {
            return arg.substr(prefix.size());
        }
    }
    return "";
}

bool wants_file_logging(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--log-file") {
            return true;
        }
    }
    return false;
}

int main(int argc, char** argv) {
    try {
        CLI::App app{"Terminal progress bar demo", "termbar-demo"};
        app.set_version_flag("--version,-v", termbar::constants::version::getFullVersion());
        app.require_subcommand(0, 1);
        
        std::string config_file;
        bool log_to_file = false;
        std::string log_level;
        app.add_option("-c,--config", config_file, "Configuration file path");
        app.add_flag("--log-file", log_to_file, "Write logs to the configured log file");
        app.add_option("--log-level", log_level, "Log level (error, warn, info, debug)")
           ->check(CLI::IsMember({"error", "warn", "info", "debug"}, CLI::ignore_case));
        
        auto& config = termbar::common::Config::instance();
        if (!config.load(find_config_argument(argc, argv))) {
            termbar::common::ErrorContext ctx;
            ctx.component = "Config";
            std::cerr << "Warning: "
                      << termbar::common::describeError(termbar::cli::DemoErrorCode::CONFIG_LOAD_FAILED, ctx)
                      << ", using defaults\n";
        }
        
        auto effective_level = config.global().log_level;
        termbar::common::Logger::instance().initialize(
            wants_file_logging(argc, argv) ? termbar::common::LogMode::FILE_ONLY
                                           : termbar::common::LogMode::CONSOLE_ONLY,
            config.global().log_file,
            effective_level,
            config.global().logging
        );
        
        auto demo_cmd = std::make_unique<termbar::cli::DemoCommand>();
        auto config_cmd = std::make_unique<termbar::cli::ConfigCommand>();
        
        demo_cmd->setup(app.add_subcommand("run", "Drive a progress bar from a parallel workload"));
        config_cmd->setup(app.add_subcommand("config", "Manage configuration"));
        
        CLI11_PARSE(app, argc, argv);
        
        if (!log_level.empty()) {
            if (auto level = termbar::common::parseLogLevel(log_level)) {
                termbar::common::Logger::instance().setLevel(*level);
            }
        }
        
        int rc = 0;
        if (demo_cmd->wasCalled()) {
            rc = demo_cmd->execute();
        } else if (config_cmd->wasCalled()) {
            rc = config_cmd->execute();
        } else {
            std::cout << app.help() << std::endl;
        }
        
        termbar::common::Logger::instance().shutdown();
        return rc;
        
    } catch (const CLI::ParseError& e) {
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
