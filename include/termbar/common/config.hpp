#pragma once

#include "termbar/progress/progress_bar.hpp"
#include <string>
#include <map>
#include <optional>
#include <cstdint>

namespace termbar {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

enum class LogFormat {
    TEXT,
    JSON
};

struct ProgressConfig {
    bool hidden;
    bool bytes;
    bool colors;
    int fps;
    std::string word;
};

struct LoggingConfig {
    size_t rotation_size_mb;
    size_t max_files;
    LogFormat format;
};

struct DemoConfig {
    int default_threads;
    int64_t default_items;
    int work_delay_us;
};

struct GlobalConfig {
    std::string log_file;
    LogLevel log_level;
    ProgressConfig progress;
    LoggingConfig logging;
    DemoConfig demo;
};

std::optional<LogLevel> parseLogLevel(const std::string& value);
const char* toString(LogLevel level);

class Config {
public:
    static Config& instance();
    
    bool load(const std::string& config_file = "");
    bool save(const std::string& config_file = "");
    void reset();
    
    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }
    
    bool setValue(const std::string& key, const std::string& value);
    std::optional<std::string> getValue(const std::string& key) const;
    
    progress::ProgressOptions progressOptions() const;
    
    std::optional<std::string> findBestConfig() const;
    std::string getConfigPath() const { return current_config_path_; }
    
    static std::string getDefaultConfigFile();
    static std::string getDefaultLogFile();

private:
    Config();
    GlobalConfig global_;
    std::string current_config_path_;
    
    static GlobalConfig createDefaultConfig();
    bool tryLoadTomlFile(const std::string& path);
};

}}
