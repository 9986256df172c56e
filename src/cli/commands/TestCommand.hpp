#pragma once

#include "cli/ICommand.hpp"

namespace hookgate {

class TestCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "test"; }
    const char* description() const override { return "Run the configured test command"; }
    const char* helpNameLine() const override { return "test -  Run tests"; }
    const char* helpSynopsis() const override { return "hookgate test [--fast]"; }
    const char* helpDescription() const override { return "Run commands.test, or commands.test_fast with --fast."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return { {"--fast", "Run only the fast unit tests."} };
    }
};

}
