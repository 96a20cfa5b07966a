#include "config_command.hpp"
#include "demo_error_codes.hpp"
#include "termbar/common/config.hpp"
#include "termbar/common/logger.hpp"
#include <array>
#include <filesystem>
#include <iostream>

namespace termbar {
namespace cli {

namespace {

constexpr std::array<const char*, 13> KNOWN_KEYS = {
    "global.log_level",
    "global.log_file",
    "progress.hidden",
    "progress.bytes",
    "progress.colors",
    "progress.fps",
    "progress.word",
    "logging.format",
    "logging.rotation_size_mb",
    "logging.max_files",
    "demo.default_threads",
    "demo.default_items",
    "demo.work_delay_us"
};

}

ConfigCommand::ConfigCommand() : was_called_(false) {}

void ConfigCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    
    init_cmd_ = subcommand->add_subcommand("init", "Write a configuration file with default values");
    init_cmd_->add_flag("-f,--force", init_force_, "Overwrite an existing file");
    init_cmd_->callback([this]() { was_called_ = true; });
    
    set_cmd_ = subcommand->add_subcommand("set", "Set configuration value");
    set_cmd_->add_option("key", set_key_, "Configuration key (section.name)")->required();
    set_cmd_->add_option("value", set_value_, "Configuration value")->required();
    set_cmd_->callback([this]() { was_called_ = true; });
    
    get_cmd_ = subcommand->add_subcommand("get", "Get configuration value");
    get_cmd_->add_option("key", get_key_, "Configuration key (optional)");
    get_cmd_->callback([this]() { was_called_ = true; });
    
    show_cmd_ = subcommand->add_subcommand("show", "Show configuration file");
    show_cmd_->callback([this]() { was_called_ = true; });
    
    subcommand->callback([this]() { was_called_ = true; });
}

bool ConfigCommand::wasCalled() const {
    return was_called_;
}

int ConfigCommand::execute() {
    if (init_cmd_->parsed()) {
        return executeInit();
    } else if (set_cmd_->parsed()) {
        return executeSet();
    } else if (get_cmd_->parsed()) {
        return executeGet();
    } else if (show_cmd_->parsed()) {
        return executeShow();
    }
    
    std::cout << subcommand_->help() << std::endl;
    return 0;
}

int ConfigCommand::executeInit() {
    auto& config = common::Config::instance();
    std::string path = config.getConfigPath().empty()
        ? common::Config::getDefaultConfigFile()
        : config.getConfigPath();
    
    if (std::filesystem::exists(path) && !init_force_) {
        std::cerr << "Configuration already exists: " << path << "\n";
        std::cerr << "Use --force to overwrite.\n";
        return 1;
    }
    
    config.reset();
    config.global().log_file = common::Config::getDefaultLogFile();
    
    if (!config.save(path)) {
        common::ErrorContext ctx;
        ctx.component = "Config";
        ctx.details["path"] = path;
        std::cerr << "Error: " << common::describeError(DemoErrorCode::CONFIG_SAVE_FAILED, ctx) << "\n";
        return 1;
    }
    
    std::cout << "Configuration written: " << path << "\n";
    return 0;
}

int ConfigCommand::executeSet() {
    auto& config = common::Config::instance();
    
    if (!config.setValue(set_key_, set_value_)) {
        common::ErrorContext ctx;
        ctx.component = "Config";
        ctx.details["key"] = set_key_;
        ctx.details["value"] = set_value_;
        std::cerr << "Error: " << common::describeError(DemoErrorCode::CONFIG_INVALID_VALUE, ctx) << "\n";
        return 1;
    }
    
    if (!config.save()) {
        std::cerr << "Failed to save configuration.\n";
        return 1;
    }
    
    std::cout << set_key_ << " = " << set_value_ << "\n";
    return 0;
}

int ConfigCommand::executeGet() {
    auto& config = common::Config::instance();
    
    if (!get_key_.empty()) {
        auto value = config.getValue(get_key_);
        if (!value) {
            std::cerr << "Unknown key: " << get_key_ << "\n";
            return 1;
        }
        std::cout << *value << "\n";
        return 0;
    }
    
    for (const char* key : KNOWN_KEYS) {
        auto value = config.getValue(key);
        if (value) {
            std::cout << key << " = " << *value << "\n";
        }
    }
    return 0;
}

int ConfigCommand::executeShow() {
    auto& config = common::Config::instance();
    std::string path = config.getConfigPath();
    
    std::cout << "Configuration file: " << (path.empty() ? "(none)" : path);
    if (!path.empty() && !std::filesystem::exists(path)) {
        std::cout << " (not found, using defaults)";
    }
    std::cout << "\n\n";
    
    return executeGet();
}

}}
