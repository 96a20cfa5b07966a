#include "termbar/progress/throttle_clock.hpp"
#include "termbar/common/constants.hpp"

namespace termbar {
namespace progress {

Clock steadyClock() {
    return [] { return std::chrono::steady_clock::now(); };
}

ThrottleClock::ThrottleClock(int fps, Clock clock)
    : clock_(clock ? std::move(clock) : steadyClock()),
      last_render_(),
      has_rendered_(false) {
    if (fps <= 0) {
        fps = constants::progress::DEFAULT_FPS;
    }
    interval_ = std::chrono::nanoseconds(std::chrono::seconds(1)) / fps;
}

bool ThrottleClock::shouldRender(int64_t current, int64_t total) {
    auto now = clock_();
    
    bool first_frame = current == 0;
    bool final_frame = current >= total - 1;
    bool interval_elapsed = !has_rendered_ || (now - last_render_) > interval_;
    
    if (first_frame || final_frame || interval_elapsed) {
        last_render_ = now;
        has_rendered_ = true;
        return true;
    }
    return false;
}

}}
