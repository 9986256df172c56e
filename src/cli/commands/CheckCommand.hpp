#pragma once

#include "cli/ICommand.hpp"

namespace hookgate {

class CheckCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "check"; }
    const char* description() const override { return "Run quality checks manually"; }
    const char* helpNameLine() const override { return "check -  Run the quality pipeline without committing"; }
    const char* helpSynopsis() const override { return "hookgate check [--fast] [--profile <name>] [--stop-on-failure]"; }
    const char* helpDescription() const override {
        return "Run formatting, lint, tests, documentation and benchmarks (when benches/ exists) "
               "and print a summary. All steps run even if one fails unless --stop-on-failure "
               "is given. Exits non-zero if any step failed.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return { {"--fast", "Format in place, lint and run fast tests only."},
                 {"--profile <name>", "One of full, fast, commit, tests, fast-tests."},
                 {"--stop-on-failure", "Stop at the first failing step."} };
    }
};

}
