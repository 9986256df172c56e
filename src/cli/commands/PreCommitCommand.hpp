#pragma once

#include "cli/ICommand.hpp"

namespace hookgate {

class PreCommitCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "pre-commit"; }
    const char* description() const override { return "Run fast quality checks (pre-commit hook)"; }
    const char* helpNameLine() const override { return "pre-commit -  Gate a commit on format, lint and fast tests"; }
    const char* helpSynopsis() const override { return "hookgate pre-commit"; }
    const char* helpDescription() const override {
        return "Run commands.format_check, commands.lint and commands.test_fast in order. "
               "The first failing step aborts the commit. Unconfigured steps are skipped.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}
