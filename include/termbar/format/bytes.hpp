#pragma once

#include <string>
#include <cstdint>

namespace termbar {
namespace format {

// SI (base 1000) units: "9 B", "1.0 kB", "12 kB", "2.0 MB".
std::string formatBytes(uint64_t bytes);

}
}
