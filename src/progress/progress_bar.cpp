#include "termbar/progress/progress_bar.hpp"
#include "termbar/progress/counter_state.hpp"
#include "termbar/progress/print_gate.hpp"
#include "termbar/common/logger.hpp"
#include <atomic>
#include <iostream>

namespace termbar {
namespace progress {

struct ProgressBar::Impl {
    Impl(int64_t total, const ProgressOptions& options, std::ostream& sink,
         Clock clock, TerminalWidth width)
        : counter(total),
          throttle(options.fps, std::move(clock)),
          renderer(std::move(width), options.colors, options.word),
          out(&sink),
          hidden(options.hidden),
          bytes(options.bytes),
          frames(0) {}
    
    CounterState counter;
    PrintGate gate;
    ThrottleClock throttle;
    BarRenderer renderer;
    std::ostream* out;
    std::atomic<bool> hidden;
    std::atomic<bool> bytes;
    std::atomic<uint64_t> frames;
};

ProgressBar::ProgressBar() = default;

ProgressBar::ProgressBar(int64_t total, ProgressOptions options)
    : ProgressBar(total, std::move(options), std::cerr) {
}

ProgressBar::ProgressBar(int64_t total,
                         ProgressOptions options,
                         std::ostream& out,
                         Clock clock,
                         TerminalWidth width)
    : impl_(std::make_unique<Impl>(total, options, out, std::move(clock), std::move(width))) {
    if (options.word.size() != constants::progress::WORD_LENGTH) {
        common::Logger::instance().debug("[ProgressBar] Unsupported word, using default | word={}",
                                        options.word);
    }
    common::Logger::instance().debug("[ProgressBar] Created | total={} | bytes={} | hidden={} | fps={}",
                                    impl_->counter.total(), options.bytes, options.hidden,
                                    options.fps);
}

ProgressBar::~ProgressBar() = default;

ProgressBar::ProgressBar(ProgressBar&& other) noexcept = default;
ProgressBar& ProgressBar::operator=(ProgressBar&& other) noexcept = default;

ProgressBar ProgressBar::disabled() {
    return ProgressBar();
}

void ProgressBar::add(int64_t delta) {
    if (!impl_) return;
    
    impl_->counter.add(delta);
    print();
}

void ProgressBar::increment() {
    if (!impl_) return;
    
    impl_->counter.increment();
    print();
}

void ProgressBar::set(int64_t value) {
    if (!impl_) return;
    
    impl_->counter.set(value);
    print();
}

void ProgressBar::done() {
    if (!impl_) return;
    
    common::Logger::instance().debug("[ProgressBar] Done | current={} | total={} | frames={}",
                                    impl_->counter.current(), impl_->counter.total(),
                                    impl_->frames.load());
    
    if (impl_->hidden.load(std::memory_order_acquire)) {
        return;
    }
    
    *impl_->out << "\n" << std::flush;
}

void ProgressBar::clear() {
    if (!impl_) return;
    
    *impl_->out << constants::terminal::CLEAR_LINE << std::flush;
}

void ProgressBar::setHidden(bool hidden) {
    if (!impl_) return;
    impl_->hidden.store(hidden, std::memory_order_release);
}

void ProgressBar::setBytes(bool bytes) {
    if (!impl_) return;
    impl_->bytes.store(bytes, std::memory_order_release);
}

bool ProgressBar::isHidden() const {
    return impl_ ? impl_->hidden.load(std::memory_order_acquire) : true;
}

bool ProgressBar::isBytes() const {
    return impl_ ? impl_->bytes.load(std::memory_order_acquire) : false;
}

int64_t ProgressBar::current() const {
    return impl_ ? impl_->counter.current() : 0;
}

int64_t ProgressBar::total() const {
    return impl_ ? impl_->counter.total() : 0;
}

double ProgressBar::percent() const {
    return impl_ ? impl_->counter.percent() : 1.0;
}

uint64_t ProgressBar::framesRendered() const {
    return impl_ ? impl_->frames.load(std::memory_order_acquire) : 0;
}

void ProgressBar::print() {
    if (impl_->hidden.load(std::memory_order_acquire)) {
        return;
    }
    
    auto ticket = impl_->gate.tryAcquire();
    if (!ticket) {
        return;
    }
    
    auto snap = impl_->counter.snapshot();
    if (!impl_->throttle.shouldRender(snap.current, snap.total)) {
        return;
    }
    
    try {
        std::string frame = impl_->renderer.renderFrame(
            snap.current, snap.total, impl_->bytes.load(std::memory_order_acquire));
        *impl_->out << frame << std::flush;
        impl_->frames.fetch_add(1, std::memory_order_acq_rel);
    } catch (const std::exception& e) {
        common::Logger::instance().debug("[ProgressBar] Render failed | error={}", e.what());
    }
}

}}
