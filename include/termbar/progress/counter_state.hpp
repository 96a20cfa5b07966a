#pragma once

#include <atomic>
#include <cstdint>

namespace termbar {
namespace progress {

struct CounterSnapshot {
    int64_t current;
    int64_t total;
};

// Ratio of current to total clamped to [0, 1]. A total below 1 reads as
// complete while nothing has been counted and as empty afterwards.
double computePercent(int64_t current, int64_t total);

class CounterState {
public:
    explicit CounterState(int64_t total = 0);
    
    int64_t add(int64_t delta);
    int64_t increment();
    int64_t set(int64_t value);
    
    int64_t current() const { return current_.load(std::memory_order_acquire); }
    int64_t total() const { return total_.load(std::memory_order_acquire); }
    
    CounterSnapshot snapshot() const;
    double percent() const;

private:
    std::atomic<int64_t> current_;
    std::atomic<int64_t> total_;
    
    void raiseTotal(int64_t value);
};

}}
