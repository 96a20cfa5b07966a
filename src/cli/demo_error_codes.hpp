#pragma once

#include "termbar/common/error_framework.hpp"
#include <unordered_map>

namespace termbar {
namespace cli {

enum class DemoErrorCode {
    CONFIG_LOAD_FAILED = 100,
    CONFIG_INVALID_VALUE = 101,
    CONFIG_SAVE_FAILED = 102,
    
    INVALID_ITEM_COUNT = 200,
    INVALID_THREAD_COUNT = 201,
    INVALID_FPS = 202,
    
    WORKLOAD_FAILED = 300
};

using DemoErrorCodeHelper = common::ErrorRegistry<DemoErrorCode>;

}
}

namespace termbar {
namespace common {

template<>
inline const std::unordered_map<cli::DemoErrorCode, ErrorInfo<cli::DemoErrorCode>>& 
ErrorRegistry<cli::DemoErrorCode>::getInfoMap() {
    static const std::unordered_map<cli::DemoErrorCode, ErrorInfo<cli::DemoErrorCode>> map = {
        {cli::DemoErrorCode::CONFIG_LOAD_FAILED, {
            cli::DemoErrorCode::CONFIG_LOAD_FAILED,
            "CONFIG_LOAD_FAILED",
            "Configuration could not be loaded"
        }},
        {cli::DemoErrorCode::CONFIG_INVALID_VALUE, {
            cli::DemoErrorCode::CONFIG_INVALID_VALUE,
            "CONFIG_INVALID_VALUE",
            "Configuration value is invalid"
        }},
        {cli::DemoErrorCode::CONFIG_SAVE_FAILED, {
            cli::DemoErrorCode::CONFIG_SAVE_FAILED,
            "CONFIG_SAVE_FAILED",
            "Configuration could not be saved"
        }},
        {cli::DemoErrorCode::INVALID_ITEM_COUNT, {
            cli::DemoErrorCode::INVALID_ITEM_COUNT,
            "INVALID_ITEM_COUNT",
            "Item count must not be negative"
        }},
        {cli::DemoErrorCode::INVALID_THREAD_COUNT, {
            cli::DemoErrorCode::INVALID_THREAD_COUNT,
            "INVALID_THREAD_COUNT",
            "Thread count is out of range"
        }},
        {cli::DemoErrorCode::INVALID_FPS, {
            cli::DemoErrorCode::INVALID_FPS,
            "INVALID_FPS",
            "Frame rate must be positive"
        }},
        {cli::DemoErrorCode::WORKLOAD_FAILED, {
            cli::DemoErrorCode::WORKLOAD_FAILED,
            "WORKLOAD_FAILED",
            "Workload aborted"
        }}
    };
    return map;
}

}
}
