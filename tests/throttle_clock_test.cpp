#include <gtest/gtest.h>
#include "termbar/progress/throttle_clock.hpp"
#include "test_utils.hpp"

using termbar::progress::ThrottleClock;
using namespace std::chrono_literals;

TEST(ThrottleClock, interval_follows_fps) {
    ThrottleClock throttle(25);
    EXPECT_EQ(std::chrono::nanoseconds(40ms), throttle.interval());
}

TEST(ThrottleClock, non_positive_fps_uses_default) {
    ThrottleClock zero(0);
    ThrottleClock negative(-3);
    EXPECT_EQ(std::chrono::nanoseconds(40ms), zero.interval());
    EXPECT_EQ(std::chrono::nanoseconds(40ms), negative.interval());
}

TEST(ThrottleClock, first_frame_always_renders) {
    FakeClock clock;
    ThrottleClock throttle(25, clock.source());
    EXPECT_TRUE(throttle.shouldRender(10, 100));
}

TEST(ThrottleClock, skips_within_interval) {
    FakeClock clock;
    ThrottleClock throttle(25, clock.source());
    ASSERT_TRUE(throttle.shouldRender(10, 100));
    
    clock.advance(10ms);
    EXPECT_FALSE(throttle.shouldRender(11, 100));
    
    clock.advance(30ms);
    EXPECT_FALSE(throttle.shouldRender(12, 100));
    
    clock.advance(1ms);
    EXPECT_TRUE(throttle.shouldRender(13, 100));
}

TEST(ThrottleClock, zero_progress_renders_immediately) {
    FakeClock clock;
    ThrottleClock throttle(25, clock.source());
    ASSERT_TRUE(throttle.shouldRender(10, 100));
    EXPECT_TRUE(throttle.shouldRender(0, 100));
}

TEST(ThrottleClock, near_completion_renders_immediately) {
    FakeClock clock;
    ThrottleClock throttle(25, clock.source());
    ASSERT_TRUE(throttle.shouldRender(10, 100));
    EXPECT_FALSE(throttle.shouldRender(98, 100));
    EXPECT_TRUE(throttle.shouldRender(99, 100));
    EXPECT_TRUE(throttle.shouldRender(100, 100));
}

TEST(ThrottleClock, render_resets_the_interval) {
    FakeClock clock;
    ThrottleClock throttle(25, clock.source());
    ASSERT_TRUE(throttle.shouldRender(10, 100));
    clock.advance(20ms);
    ASSERT_TRUE(throttle.shouldRender(99, 100));
    EXPECT_EQ(throttle.lastRender(), clock.source()());
    
    clock.advance(30ms);
    EXPECT_FALSE(throttle.shouldRender(50, 100));
}

TEST(ThrottleClock, redraws_are_bounded_by_fps) {
    FakeClock clock;
    ThrottleClock throttle(25, clock.source());
    
    int renders = 0;
    for (int64_t i = 1; i <= 1000; ++i) {
        if (throttle.shouldRender(i, 1000000)) {
            ++renders;
        }
        clock.advance(1ms);
    }
    
    EXPECT_LE(renders, 25 + 2);
    EXPECT_GE(renders, 20);
}
