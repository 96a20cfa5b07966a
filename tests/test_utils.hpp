#pragma once

#include "termbar/progress/throttle_clock.hpp"
#include <chrono>
#include <memory>

// Manually advanced time source shared with the code under test.
class FakeClock {
public:
    FakeClock() : now_(std::make_shared<std::chrono::steady_clock::time_point>(std::chrono::hours(1))) {}
    
    termbar::progress::Clock source() const {
        auto now = now_;
        return [now] { return *now; };
    }
    
    void advance(std::chrono::nanoseconds d) { *now_ += d; }

private:
    std::shared_ptr<std::chrono::steady_clock::time_point> now_;
};
