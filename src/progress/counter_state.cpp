#include "termbar/progress/counter_state.hpp"
#include <algorithm>

namespace termbar {
namespace progress {

double computePercent(int64_t current, int64_t total) {
    double pct;
    if (total < 1) {
        pct = current < 1 ? 1.0 : 0.0;
    } else {
        pct = static_cast<double>(current) / static_cast<double>(total);
    }
    return std::min(1.0, std::max(0.0, pct));
}

CounterState::CounterState(int64_t total)
    : current_(0),
      total_(std::max<int64_t>(0, total)) {
}

int64_t CounterState::add(int64_t delta) {
    int64_t cur = current_.fetch_add(delta, std::memory_order_acq_rel) + delta;
    raiseTotal(cur);
    return cur;
}

int64_t CounterState::increment() {
    return add(1);
}

int64_t CounterState::set(int64_t value) {
    current_.store(value, std::memory_order_release);
    raiseTotal(value);
    return value;
}

CounterSnapshot CounterState::snapshot() const {
    CounterSnapshot snap;
    snap.current = current();
    snap.total = total();
    return snap;
}

double CounterState::percent() const {
    auto snap = snapshot();
    return computePercent(snap.current, snap.total);
}

void CounterState::raiseTotal(int64_t value) {
    int64_t seen = total_.load(std::memory_order_acquire);
    while (value > seen &&
           !total_.compare_exchange_weak(seen, value,
                                         std::memory_order_acq_rel,
                                         std::memory_order_acquire)) {
    }
}

}}
