#pragma once

#include <string>
#include <map>
#include <unordered_map>

namespace termbar {
namespace common {

template<typename EnumType>
struct ErrorInfo {
    EnumType code;
    const char* code_str;
    const char* default_message;
};

struct ErrorContext {
    std::string component;
    std::map<std::string, std::string> details;
};

template<typename EnumType>
class ErrorRegistry {
public:
    static ErrorInfo<EnumType> getInfo(EnumType code) {
        const auto& map = getInfoMap();
        auto it = map.find(code);
        if (it != map.end()) {
            return it->second;
        }
        return ErrorInfo<EnumType>{code, "UNKNOWN_ERROR", "Unknown error"};
    }
    
    static const char* toString(EnumType code) {
        return getInfo(code).code_str;
    }
    
    static const char* getMessage(EnumType code) {
        return getInfo(code).default_message;
    }
    
protected:
    static const std::unordered_map<EnumType, ErrorInfo<EnumType>>& getInfoMap();
};

inline std::string formatContext(const ErrorContext& ctx) {
    std::string result;
    for (const auto& [key, value] : ctx.details) {
        if (!result.empty()) {
            result += " | ";
        }
        result += key + "=" + value;
    }
    return result;
}

// "[component] CODE: message | k=v | ..."
template<typename EnumType>
std::string describeError(EnumType code, const ErrorContext& ctx = {}) {
    const auto info = ErrorRegistry<EnumType>::getInfo(code);
    std::string result;
    if (!ctx.component.empty()) {
        result += "[" + ctx.component + "] ";
    }
    result += std::string(info.code_str) + ": " + info.default_message;
    auto details = formatContext(ctx);
    if (!details.empty()) {
        result += " | " + details;
    }
    return result;
}

}}
