#include <gtest/gtest.h>
#include "termbar/progress/print_gate.hpp"
#include <atomic>
#include <thread>
#include <vector>

using termbar::progress::PrintGate;

TEST(PrintGate, first_acquire_succeeds) {
    PrintGate gate;
    auto ticket = gate.tryAcquire();
    EXPECT_TRUE(static_cast<bool>(ticket));
    EXPECT_TRUE(gate.isBusy());
}

TEST(PrintGate, second_acquire_is_refused_without_blocking) {
    PrintGate gate;
    auto held = gate.tryAcquire();
    auto refused = gate.tryAcquire();
    EXPECT_TRUE(static_cast<bool>(held));
    EXPECT_FALSE(static_cast<bool>(refused));
}

TEST(PrintGate, ticket_releases_on_scope_exit) {
    PrintGate gate;
    {
        auto ticket = gate.tryAcquire();
        ASSERT_TRUE(static_cast<bool>(ticket));
    }
    EXPECT_FALSE(gate.isBusy());
    EXPECT_TRUE(static_cast<bool>(gate.tryAcquire()));
}

TEST(PrintGate, refused_ticket_does_not_release_the_holder) {
    PrintGate gate;
    auto held = gate.tryAcquire();
    {
        auto refused = gate.tryAcquire();
    }
    EXPECT_TRUE(gate.isBusy());
}

TEST(PrintGate, moved_ticket_keeps_ownership) {
    PrintGate gate;
    auto first = gate.tryAcquire();
    PrintGate::Ticket second = std::move(first);
    EXPECT_FALSE(static_cast<bool>(first));
    EXPECT_TRUE(static_cast<bool>(second));
    EXPECT_TRUE(gate.isBusy());
    
    second.release();
    EXPECT_FALSE(gate.isBusy());
}

TEST(PrintGate, releases_when_the_holder_throws) {
    PrintGate gate;
    try {
        auto ticket = gate.tryAcquire();
        throw std::runtime_error("render failed");
    } catch (const std::runtime_error&) {
    }
    EXPECT_FALSE(gate.isBusy());
}

TEST(PrintGate, at_most_one_holder_under_contention) {
    PrintGate gate;
    std::atomic<int> inside{0};
    std::atomic<int> max_inside{0};
    std::atomic<int> admitted{0};
    
    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < 2000; ++i) {
                auto ticket = gate.tryAcquire();
                if (!ticket) {
                    continue;
                }
                int now = inside.fetch_add(1) + 1;
                int seen = max_inside.load();
                while (now > seen && !max_inside.compare_exchange_weak(seen, now)) {
                }
                admitted.fetch_add(1);
                inside.fetch_sub(1);
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }
    
    EXPECT_EQ(1, max_inside.load());
    EXPECT_GT(admitted.load(), 0);
    EXPECT_FALSE(gate.isBusy());
}
