#pragma once

#include <atomic>

namespace termbar {
namespace progress {

// Single-slot admission for the render path. tryAcquire() never waits: a
// caller that finds the slot taken gets an empty ticket and skips its frame.
class PrintGate {
public:
    class Ticket {
    public:
        Ticket() = default;
        ~Ticket();
        
        Ticket(Ticket&& other) noexcept;
        Ticket& operator=(Ticket&& other) noexcept;
        Ticket(const Ticket&) = delete;
        Ticket& operator=(const Ticket&) = delete;
        
        explicit operator bool() const { return gate_ != nullptr; }
        void release();
        
    private:
        friend class PrintGate;
        explicit Ticket(PrintGate* gate) : gate_(gate) {}
        
        PrintGate* gate_ = nullptr;
    };
    
    PrintGate() = default;
    PrintGate(const PrintGate&) = delete;
    PrintGate& operator=(const PrintGate&) = delete;
    
    Ticket tryAcquire();
    bool isBusy() const { return busy_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> busy_{false};
    
    void unlock() { busy_.store(false, std::memory_order_release); }
};

}}
