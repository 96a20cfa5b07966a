#include "termbar/progress/print_gate.hpp"

namespace termbar {
namespace progress {

PrintGate::Ticket::~Ticket() {
    release();
}

PrintGate::Ticket::Ticket(Ticket&& other) noexcept : gate_(other.gate_) {
    other.gate_ = nullptr;
}

PrintGate::Ticket& PrintGate::Ticket::operator=(Ticket&& other) noexcept {
    if (this != &other) {
        release();
        gate_ = other.gate_;
        other.gate_ = nullptr;
    }
    return *this;
}

void PrintGate::Ticket::release() {
    if (gate_) {
        gate_->unlock();
        gate_ = nullptr;
    }
}

PrintGate::Ticket PrintGate::tryAcquire() {
    if (busy_.exchange(true, std::memory_order_acq_rel)) {
        return Ticket();
    }
    return Ticket(this);
}

}}
