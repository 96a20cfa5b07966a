#include "termbar/common/config.hpp"
#include "termbar/common/constants.hpp"
#include "termbar/common/logger.hpp"
#include <toml.hpp>
#include <fstream>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <vector>
#include <limits>
#include <unistd.h>

namespace termbar {
namespace common {

namespace {

std::string getXdgConfigHome() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && strlen(xdg) > 0) {
        return xdg;
    }
    const char* home = std::getenv("HOME");
    return home ? std::string(home) + "/.config" : "";
}

std::string getXdgStateHome() {
    const char* xdg = std::getenv("XDG_STATE_HOME");
    if (xdg && strlen(xdg) > 0) {
        return xdg;
    }
    const char* home = std::getenv("HOME");
    return home ? std::string(home) + "/.local/state" : "";
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::optional<bool> parseBool(const std::string& value) {
    auto lower = toLower(value);
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return false;
    return std::nullopt;
}

const toml::value* findSection(const toml::value& data, const char* name) {
    if (!data.is_table() || !data.contains(name)) {
        return nullptr;
    }
    const auto& section = data.at(name);
    if (!section.is_table()) {
        Logger::instance().warn("[Config] Section is not a table, skipped | section={}", name);
        return nullptr;
    }
    return &section;
}

// A value of the wrong type is logged and skipped; the remaining keys still load.
template<typename T, typename Apply>
void readKey(const toml::value& section, const char* section_name, const char* key, Apply apply) {
    if (!section.contains(key)) {
        return;
    }
    try {
        apply(toml::find<T>(section, key));
    } catch (const std::exception& e) {
        Logger::instance().warn("[Config] Invalid value skipped | key={}.{} | error={}",
                               section_name, key, e.what());
    }
}

template<typename T>
std::optional<T> parseNumber(const std::string& value) {
    try {
        size_t pos = 0;
        long long parsed = std::stoll(value, &pos);
        if (pos != value.size()) {
            return std::nullopt;
        }
        if (parsed < static_cast<long long>(std::numeric_limits<T>::min()) ||
            parsed > static_cast<long long>(std::numeric_limits<T>::max())) {
            return std::nullopt;
        }
        return static_cast<T>(parsed);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}

std::optional<LogLevel> parseLogLevel(const std::string& value) {
    auto lower = toLower(value);
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "debug") return LogLevel::DEBUG;
    return std::nullopt;
}

const char* toString(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN: return "WARN";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
    }
    return "INFO";
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    global_ = createDefaultConfig();
}

GlobalConfig Config::createDefaultConfig() {
    using namespace constants::config_defaults;
    
    GlobalConfig config;
    
    config.log_level = LogLevel::INFO;
    config.log_file = "";
    
    config.progress.hidden = PROGRESS_HIDDEN;
    config.progress.bytes = PROGRESS_BYTES;
    config.progress.colors = PROGRESS_COLORS;
    config.progress.fps = PROGRESS_FPS;
    config.progress.word = constants::progress::DEFAULT_WORD;
    
    config.logging.rotation_size_mb = LOG_ROTATION_SIZE_MB;
    config.logging.max_files = LOG_MAX_FILES;
    config.logging.format = LogFormat::TEXT;
    
    config.demo.default_threads = DEMO_THREADS;
    config.demo.default_items = DEMO_ITEMS;
    config.demo.work_delay_us = DEMO_WORK_DELAY_US;
    
    return config;
}

void Config::reset() {
    global_ = createDefaultConfig();
    current_config_path_.clear();
}

std::string Config::getDefaultConfigFile() {
    std::string base = getXdgConfigHome();
    if (base.empty()) {
        return constants::system::CONFIG_FILE_NAME;
    }
    return base + "/" + constants::system::APPLICATION_NAME + "/" + constants::system::CONFIG_FILE_NAME;
}

std::string Config::getDefaultLogFile() {
    std::string base = getXdgStateHome();
    if (base.empty()) {
        return std::string(constants::system::APPLICATION_NAME) + ".log";
    }
    return base + "/" + constants::system::APPLICATION_NAME + "/" + constants::system::APPLICATION_NAME + ".log";
}

std::optional<std::string> Config::findBestConfig() const {
    std::vector<std::string> paths;
    if (const char* env = std::getenv(constants::system::CONFIG_ENV)) {
        paths.push_back(env);
    }
    paths.push_back(getDefaultConfigFile());
    
    for (const auto& path : paths) {
        if (std::filesystem::exists(path) && access(path.c_str(), R_OK) == 0) {
            return path;
        }
    }
    
    return std::nullopt;
}

bool Config::load(const std::string& config_file) {
    try {
        global_ = createDefaultConfig();
        global_.log_file = getDefaultLogFile();
        
        std::string effective_config_file = config_file;
        if (effective_config_file.empty()) {
            auto best = findBestConfig();
            effective_config_file = best ? *best : getDefaultConfigFile();
        }
        
        current_config_path_ = effective_config_file;
        
        bool loaded = tryLoadTomlFile(effective_config_file);
        
        Logger::instance().debug("[Config] Loaded | path={} | from_file={}", 
                                effective_config_file, loaded);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Load failed | error={}", e.what());
        return false;
    }
}

bool Config::tryLoadTomlFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        Logger::instance().debug("[Config] Config not found | path={}", path);
        return false;
    }
    
    if (access(path.c_str(), R_OK) != 0) {
        Logger::instance().debug("[Config] Config not readable | path={}", path);
        return false;
    }
    
    toml::value data;
    try {
        data = toml::parse(path);
    } catch (const std::exception& e) {
        Logger::instance().warn("[Config] Config parse failed | path={} | error={}", 
                               path, e.what());
        return false;
    }
    
    if (auto global_section = findSection(data, "global")) {
        readKey<std::string>(*global_section, "global", "log_file",
                             [this](const std::string& v) { global_.log_file = v; });
        readKey<std::string>(*global_section, "global", "log_level", [this](const std::string& v) {
            if (auto parsed = parseLogLevel(v)) {
                global_.log_level = *parsed;
            } else {
                Logger::instance().warn("[Config] Unknown log level | value={}", v);
            }
        });
    }
    
    if (auto progress_section = findSection(data, "progress")) {
        readKey<bool>(*progress_section, "progress", "hidden",
                      [this](bool v) { global_.progress.hidden = v; });
        readKey<bool>(*progress_section, "progress", "bytes",
                      [this](bool v) { global_.progress.bytes = v; });
        readKey<bool>(*progress_section, "progress", "colors",
                      [this](bool v) { global_.progress.colors = v; });
        readKey<int>(*progress_section, "progress", "fps",
                     [this](int v) { global_.progress.fps = v; });
        readKey<std::string>(*progress_section, "progress", "word",
                             [this](const std::string& v) { global_.progress.word = v; });
    }
    
    if (auto logging_section = findSection(data, "logging")) {
        readKey<size_t>(*logging_section, "logging", "rotation_size_mb",
                        [this](size_t v) { global_.logging.rotation_size_mb = v; });
        readKey<size_t>(*logging_section, "logging", "max_files",
                        [this](size_t v) { global_.logging.max_files = v; });
        readKey<std::string>(*logging_section, "logging", "format", [this](const std::string& v) {
            global_.logging.format = toLower(v) == "json" ? LogFormat::JSON : LogFormat::TEXT;
        });
    }
    
    if (auto demo_section = findSection(data, "demo")) {
        readKey<int>(*demo_section, "demo", "default_threads",
                     [this](int v) { global_.demo.default_threads = v; });
        readKey<int64_t>(*demo_section, "demo", "default_items",
                         [this](int64_t v) { global_.demo.default_items = v; });
        readKey<int>(*demo_section, "demo", "work_delay_us",
                     [this](int v) { global_.demo.work_delay_us = v; });
    }
    
    Logger::instance().info("[Config] Config loaded | path={}", path);
    return true;
}

bool Config::save(const std::string& config_file) {
    try {
        std::string effective_config_file = config_file;
        if (effective_config_file.empty()) {
            effective_config_file = current_config_path_.empty() 
                ? getDefaultConfigFile() 
                : current_config_path_;
        }
        
        toml::value data = toml::table{
            {"global", toml::table{
                {"log_file", global_.log_file},
                {"log_level", toString(global_.log_level)}
            }},
            {"progress", toml::table{
                {"hidden", global_.progress.hidden},
                {"bytes", global_.progress.bytes},
                {"colors", global_.progress.colors},
                {"fps", global_.progress.fps},
                {"word", global_.progress.word}
            }},
            {"logging", toml::table{
                {"rotation_size_mb", global_.logging.rotation_size_mb},
                {"max_files", global_.logging.max_files},
                {"format", global_.logging.format == LogFormat::JSON ? "json" : "text"}
            }},
            {"demo", toml::table{
                {"default_threads", global_.demo.default_threads},
                {"default_items", global_.demo.default_items},
                {"work_delay_us", global_.demo.work_delay_us}
            }}
        };
        
        std::filesystem::path parent = std::filesystem::path(effective_config_file).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
        }
        
        std::ofstream file(effective_config_file);
        if (!file) {
            Logger::instance().error("[Config] File open failed | path={}", effective_config_file);
            return false;
        }
        
        file << toml::format(data);
        file.close();
        
        current_config_path_ = effective_config_file;
        
        Logger::instance().info("[Config] Saved | path={}", effective_config_file);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Save failed | error={}", e.what());
        return false;
    }
}

bool Config::setValue(const std::string& key, const std::string& value) {
    if (key == "global.log_file") {
        global_.log_file = value;
        return true;
    }
    if (key == "global.log_level") {
        if (auto level = parseLogLevel(value)) {
            global_.log_level = *level;
            return true;
        }
        return false;
    }
    if (key == "progress.hidden" || key == "progress.bytes" || key == "progress.colors") {
        auto parsed = parseBool(value);
        if (!parsed) return false;
        if (key == "progress.hidden") global_.progress.hidden = *parsed;
        else if (key == "progress.bytes") global_.progress.bytes = *parsed;
        else global_.progress.colors = *parsed;
        return true;
    }
    if (key == "progress.fps") {
        auto parsed = parseNumber<int>(value);
        if (!parsed || *parsed <= 0) return false;
        global_.progress.fps = *parsed;
        return true;
    }
    if (key == "progress.word") {
        if (value.size() != constants::progress::WORD_LENGTH) return false;
        global_.progress.word = value;
        return true;
    }
    if (key == "logging.rotation_size_mb" || key == "logging.max_files") {
        auto parsed = parseNumber<int64_t>(value);
        if (!parsed || *parsed <= 0) return false;
        if (key == "logging.rotation_size_mb") global_.logging.rotation_size_mb = static_cast<size_t>(*parsed);
        else global_.logging.max_files = static_cast<size_t>(*parsed);
        return true;
    }
    if (key == "logging.format") {
        auto lower = toLower(value);
        if (lower != "json" && lower != "text") return false;
        global_.logging.format = lower == "json" ? LogFormat::JSON : LogFormat::TEXT;
        return true;
    }
    if (key == "demo.default_threads") {
        auto parsed = parseNumber<int>(value);
        if (!parsed || *parsed <= 0) return false;
        global_.demo.default_threads = *parsed;
        return true;
    }
    if (key == "demo.default_items") {
        auto parsed = parseNumber<int64_t>(value);
        if (!parsed || *parsed < 0) return false;
        global_.demo.default_items = *parsed;
        return true;
    }
    if (key == "demo.work_delay_us") {
        auto parsed = parseNumber<int>(value);
        if (!parsed || *parsed < 0) return false;
        global_.demo.work_delay_us = *parsed;
        return true;
    }
    
    Logger::instance().debug("[Config] Unknown key | key={}", key);
    return false;
}

std::optional<std::string> Config::getValue(const std::string& key) const {
    auto boolString = [](bool v) { return std::string(v ? "true" : "false"); };
    
    if (key == "global.log_file") return global_.log_file;
    if (key == "global.log_level") return std::string(toString(global_.log_level));
    if (key == "progress.hidden") return boolString(global_.progress.hidden);
    if (key == "progress.bytes") return boolString(global_.progress.bytes);
    if (key == "progress.colors") return boolString(global_.progress.colors);
    if (key == "progress.fps") return std::to_string(global_.progress.fps);
    if (key == "progress.word") return global_.progress.word;
    if (key == "logging.format") return std::string(global_.logging.format == LogFormat::JSON ? "json" : "text");
    if (key == "logging.rotation_size_mb") return std::to_string(global_.logging.rotation_size_mb);
    if (key == "logging.max_files") return std::to_string(global_.logging.max_files);
    if (key == "demo.default_threads") return std::to_string(global_.demo.default_threads);
    if (key == "demo.default_items") return std::to_string(global_.demo.default_items);
    if (key == "demo.work_delay_us") return std::to_string(global_.demo.work_delay_us);
    
    return std::nullopt;
}

progress::ProgressOptions Config::progressOptions() const {
    progress::ProgressOptions options;
    options.hidden = global_.progress.hidden;
    options.bytes = global_.progress.bytes;
    options.colors = global_.progress.colors;
    options.fps = global_.progress.fps > 0 ? global_.progress.fps : constants::progress::DEFAULT_FPS;
    options.word = global_.progress.word;
    return options;
}

}}
