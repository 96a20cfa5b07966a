#include "demo_command.hpp"
#include "demo_error_codes.hpp"
#include "termbar/common/config.hpp"
#include "termbar/common/constants.hpp"
#include "termbar/common/logger.hpp"
#include "termbar/format/bytes.hpp"
#include <nlohmann/json.hpp>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
#include <iostream>
#include <thread>
#include <unistd.h>

namespace termbar {
namespace cli {

DemoCommand::DemoCommand() : was_called_(false) {}

void DemoCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    
    subcommand->add_option("-n,--items", items_,
                          "Number of work items (default: from config)");
    subcommand->add_option("-t,--threads", threads_,
                          "Number of worker threads (default: from config)")
                          ->check(CLI::Range(1, constants::limits::MAX_DEMO_THREADS));
    subcommand->add_option("--fps", fps_,
                          "Maximum redraws per second (default: from config)");
    subcommand->add_option("-d,--delay-us", delay_us_,
                          "Simulated work per item in microseconds (default: from config)");
    subcommand->add_flag("-b,--bytes", bytes_,
                        "Report progress as transferred bytes");
    subcommand->add_flag("--hidden", hidden_,
                        "Track progress without drawing the bar");
    subcommand->add_flag("--no-color", no_color_,
                        "Draw the bar without ANSI colors");
    subcommand->add_flag("--json", json_output_,
                        "Print the summary as JSON");
    subcommand->add_flag("--clear", clear_on_finish_,
                        "Erase the bar instead of leaving the final frame");
    
    subcommand->callback([this]() { was_called_ = true; });
}

bool DemoCommand::wasCalled() const {
    return was_called_;
}

void DemoCommand::applyConfigDefaults() {
    const auto& config = common::Config::instance().global();
    
    if (items_ < 0) {
        items_ = config.demo.default_items;
    }
    if (threads_ <= 0) {
        threads_ = config.demo.default_threads;
    }
    if (delay_us_ < 0) {
        delay_us_ = config.demo.work_delay_us;
    }
}

bool DemoCommand::validateArguments() const {
    common::ErrorContext ctx;
    ctx.component = "Demo";
    
    if (items_ < 0) {
        ctx.details["items"] = std::to_string(items_);
        std::cerr << "Error: " << common::describeError(DemoErrorCode::INVALID_ITEM_COUNT, ctx) << "\n";
        return false;
    }
    if (threads_ < 1 || threads_ > constants::limits::MAX_DEMO_THREADS) {
        ctx.details["threads"] = std::to_string(threads_);
        std::cerr << "Error: " << common::describeError(DemoErrorCode::INVALID_THREAD_COUNT, ctx) << "\n";
        return false;
    }
    if (fps_ < 0) {
        ctx.details["fps"] = std::to_string(fps_);
        std::cerr << "Error: " << common::describeError(DemoErrorCode::INVALID_FPS, ctx) << "\n";
        return false;
    }
    return true;
}

progress::ProgressOptions DemoCommand::buildOptions() const {
    auto options = common::Config::instance().progressOptions();
    
    if (bytes_) options.bytes = true;
    if (hidden_) options.hidden = true;
    if (no_color_ || !isatty(STDERR_FILENO)) options.colors = false;
    if (fps_ > 0) options.fps = fps_;
    
    return options;
}

DemoSummary DemoCommand::runWorkload(progress::ProgressBar& bar,
                                     const progress::ProgressOptions& options) const {
    const auto delay = std::chrono::microseconds(delay_us_);
    const bool bytes = options.bytes;
    
    auto start = std::chrono::steady_clock::now();
    
    tbb::task_arena arena(threads_);
    arena.execute([&] {
        tbb::parallel_for(tbb::blocked_range<int64_t>(0, items_),
            [&](const tbb::blocked_range<int64_t>& range) {
                for (int64_t i = range.begin(); i != range.end(); ++i) {
                    if (delay.count() > 0) {
                        std::this_thread::sleep_for(delay);
                    }
                    if (bytes) {
                        bar.add(constants::limits::DEMO_BYTES_PER_ITEM);
                    } else {
                        bar.increment();
                    }
                }
            });
    });
    
    DemoSummary summary;
    summary.items = items_;
    summary.current = bar.current();
    summary.total = bar.total();
    summary.percent = bar.percent();
    summary.frames = bar.framesRendered();
    summary.threads = threads_;
    summary.bytes = bytes;
    summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    return summary;
}

void DemoCommand::printSummary(const DemoSummary& summary) const {
    if (json_output_) {
        nlohmann::json j;
        j["items"] = summary.items;
        j["current"] = summary.current;
        j["total"] = summary.total;
        j["percent"] = summary.percent;
        j["frames_rendered"] = summary.frames;
        j["threads"] = summary.threads;
        j["bytes"] = summary.bytes;
        j["elapsed_ms"] = summary.elapsed.count();
        std::cout << j.dump(2) << std::endl;
        return;
    }
    
    std::cout << "Processed " << summary.items << " items on " << summary.threads
              << " threads in " << common::formatDuration(summary.elapsed) << "\n";
    if (summary.bytes) {
        std::cout << "Transferred " << format::formatBytes(static_cast<uint64_t>(summary.current))
                  << " of " << format::formatBytes(static_cast<uint64_t>(summary.total)) << "\n";
    }
    std::cout << "Frames rendered: " << summary.frames << "\n";
}

int DemoCommand::execute() {
    applyConfigDefaults();
    
    if (!validateArguments()) {
        return 1;
    }
    
    auto options = buildOptions();
    int64_t total = options.bytes ? items_ * constants::limits::DEMO_BYTES_PER_ITEM : items_;
    
    common::Logger::instance().info("[Demo] Starting | items={} | threads={} | fps={} | bytes={}",
                                   items_, threads_, options.fps, options.bytes);
    
    progress::ProgressBar bar(total, options);
    
    DemoSummary summary;
    try {
        summary = runWorkload(bar, options);
    } catch (const std::exception& e) {
        bar.clear();
        common::ErrorContext ctx;
        ctx.component = "Demo";
        ctx.details["error"] = e.what();
        std::cerr << "Error: " << common::describeError(DemoErrorCode::WORKLOAD_FAILED, ctx) << std::endl;
        common::Logger::instance().error("[Demo] Workload failed | error={}", e.what());
        return 1;
    }
    
    if (clear_on_finish_) {
        bar.clear();
    } else {
        bar.done();
    }
    
    common::Logger::instance().info("[Demo] Finished | current={} | total={} | frames={} | elapsed={}",
                                   summary.current, summary.total, summary.frames,
                                   common::formatDuration(summary.elapsed));
    
    printSummary(summary);
    return 0;
}

}}
