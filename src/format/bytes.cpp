#include "termbar/format/bytes.hpp"
#include <fmt/format.h>
#include <array>
#include <cmath>

namespace termbar {
namespace format {

namespace {

constexpr std::array<const char*, 7> SI_UNITS = {"B", "kB", "MB", "GB", "TB", "PB", "EB"};
constexpr uint64_t SI_BASE = 1000;

}

std::string formatBytes(uint64_t bytes) {
    if (bytes < 10) {
        return fmt::format("{} B", bytes);
    }
    
    size_t exponent = 0;
    uint64_t scaled = bytes;
    double divisor = 1.0;
    while (scaled >= SI_BASE && exponent + 1 < SI_UNITS.size()) {
        scaled /= SI_BASE;
        divisor *= static_cast<double>(SI_BASE);
        ++exponent;
    }
    
    double value = std::floor(static_cast<double>(bytes) / divisor * 10.0 + 0.5) / 10.0;
    if (value < 10.0) {
        return fmt::format("{:.1f} {}", value, SI_UNITS[exponent]);
    }
    return fmt::format("{:.0f} {}", value, SI_UNITS[exponent]);
}

}
}
