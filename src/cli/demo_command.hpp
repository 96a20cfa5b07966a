#pragma once

#include "main_command.hpp"
#include "termbar/progress/progress_bar.hpp"
#include <CLI/CLI.hpp>
#include <chrono>
#include <cstdint>
#include <string>

namespace termbar {
namespace cli {

struct DemoSummary {
    int64_t items = 0;
    int64_t current = 0;
    int64_t total = 0;
    double percent = 0.0;
    uint64_t frames = 0;
    int threads = 0;
    bool bytes = false;
    std::chrono::milliseconds elapsed{0};
};

class DemoCommand : public MainCommand {
public:
    DemoCommand();
    
    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    int execute();
    
    bool validateArguments() const override;

private:
    bool was_called_;
    int64_t items_ = -1;
    int threads_ = 0;
    int fps_ = 0;
    int delay_us_ = -1;
    bool bytes_ = false;
    bool hidden_ = false;
    bool no_color_ = false;
    bool json_output_ = false;
    bool clear_on_finish_ = false;
    
    void applyConfigDefaults();
    progress::ProgressOptions buildOptions() const;
    DemoSummary runWorkload(progress::ProgressBar& bar, const progress::ProgressOptions& options) const;
    void printSummary(const DemoSummary& summary) const;
};

}}
