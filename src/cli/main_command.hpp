#pragma once

#include <CLI/CLI.hpp>
#include <string>

namespace termbar {
namespace cli {

class MainCommand {
public:
    MainCommand();
    virtual ~MainCommand();
    
    virtual bool validateArguments() const;

protected:
    CLI::App* subcommand_ = nullptr;
};

}}
