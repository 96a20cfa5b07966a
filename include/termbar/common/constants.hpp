#pragma once

#include <string>
#include <cstddef>
#include <cstdint>

namespace termbar {
namespace constants {

namespace version {
    constexpr const char* LIB_VERSION = "1.0.0";
    
    inline std::string getFullVersion() {
        return std::string("termbar v") + LIB_VERSION;
    }
}

namespace system {
    constexpr const char* APPLICATION_NAME = "termbar";
    constexpr const char* CONFIG_FILE_NAME = "termbar.toml";
    constexpr const char* CONFIG_ENV = "TERMBAR_CONFIG";
}

namespace terminal {
    constexpr const char* CLEAR_LINE = "\033[2K\r";
    constexpr int DEFAULT_WIDTH = 80;
}

namespace progress {
    constexpr int DEFAULT_FPS = 25;
    constexpr int MIN_BAR_SPACE = 11;
    constexpr int MIN_FILL = 2;
    constexpr int DECORATION_WIDTH = 5;
    constexpr size_t PERCENT_WIDTH = 7;
    constexpr size_t WORD_LENGTH = 6;
    constexpr const char* DEFAULT_WORD = "Termio";
}

namespace limits {
    constexpr int DEFAULT_DEMO_THREADS = 4;
    constexpr int MAX_DEMO_THREADS = 64;
    constexpr int64_t DEFAULT_DEMO_ITEMS = 2000;
    constexpr int DEFAULT_WORK_DELAY_US = 500;
    constexpr int64_t DEMO_BYTES_PER_ITEM = 4096;
    
    constexpr size_t DEFAULT_LOG_ROTATION_SIZE_MB = 10;
    constexpr size_t DEFAULT_LOG_MAX_FILES = 3;
}

namespace config_defaults {
    constexpr bool PROGRESS_HIDDEN = false;
    constexpr bool PROGRESS_BYTES = false;
    constexpr bool PROGRESS_COLORS = true;
    constexpr int PROGRESS_FPS = progress::DEFAULT_FPS;
    
    constexpr int DEMO_THREADS = limits::DEFAULT_DEMO_THREADS;
    constexpr int64_t DEMO_ITEMS = limits::DEFAULT_DEMO_ITEMS;
    constexpr int DEMO_WORK_DELAY_US = limits::DEFAULT_WORK_DELAY_US;
    
    constexpr size_t LOG_ROTATION_SIZE_MB = limits::DEFAULT_LOG_ROTATION_SIZE_MB;
    constexpr size_t LOG_MAX_FILES = limits::DEFAULT_LOG_MAX_FILES;
}

}
}
