#pragma once

#include "termbar/common/constants.hpp"
#include "termbar/progress/throttle_clock.hpp"
#include "termbar/progress/bar_renderer.hpp"
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>

namespace termbar {
namespace progress {

struct ProgressOptions {
    bool hidden = false;
    bool bytes = false;
    bool colors = true;
    int fps = constants::progress::DEFAULT_FPS;
    std::string word = constants::progress::DEFAULT_WORD;
};

// Terminal progress bar that can be updated from any number of threads.
//
// Updates never block: the counters are atomic and a redraw is only attempted
// when the render slot is free and the frame interval has passed. A default
// constructed (or moved-from) bar is disabled and every call on it is a no-op.
class ProgressBar {
public:
    ProgressBar();
    explicit ProgressBar(int64_t total, ProgressOptions options = {});
    ProgressBar(int64_t total,
                ProgressOptions options,
                std::ostream& out,
                Clock clock = steadyClock(),
                TerminalWidth width = stdinTerminalWidth());
    ~ProgressBar();
    
    ProgressBar(ProgressBar&& other) noexcept;
    ProgressBar& operator=(ProgressBar&& other) noexcept;
    ProgressBar(const ProgressBar&) = delete;
    ProgressBar& operator=(const ProgressBar&) = delete;
    
    static ProgressBar disabled();
    
    void add(int64_t delta);
    void increment();
    void set(int64_t value);
    
    // Ends the display with a newline unless hidden.
    void done();
    // Erases the current line, hidden or not.
    void clear();
    
    void setHidden(bool hidden);
    void setBytes(bool bytes);
    
    bool isEnabled() const { return impl_ != nullptr; }
    bool isHidden() const;
    bool isBytes() const;
    
    int64_t current() const;
    int64_t total() const;
    double percent() const;
    uint64_t framesRendered() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    
    void print();
};

}}
