#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace termbar {
namespace progress {

using Clock = std::function<std::chrono::steady_clock::time_point()>;

Clock steadyClock();

// Not synchronized; only the holder of the print gate may call shouldRender.
class ThrottleClock {
public:
    explicit ThrottleClock(int fps, Clock clock = steadyClock());
    
    bool shouldRender(int64_t current, int64_t total);
    
    std::chrono::nanoseconds interval() const { return interval_; }
    std::chrono::steady_clock::time_point lastRender() const { return last_render_; }

private:
    Clock clock_;
    std::chrono::nanoseconds interval_;
    std::chrono::steady_clock::time_point last_render_;
    bool has_rendered_;
};

}}
