#pragma once

#include "cli/ICommand.hpp"

namespace hookgate {

class InstallCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "install"; }
    const char* description() const override { return "Install git hooks into this repository"; }
    const char* helpNameLine() const override { return "install -  Install hookgate git hooks"; }
    const char* helpSynopsis() const override { return "hookgate install [--force] [--exec <path>]"; }
    const char* helpDescription() const override {
        return "Write pre-commit, commit-msg, pre-push and post-commit hooks into .git/hooks. "
               "Each hook runs the matching hookgate command. A default hookgate.yaml is "
               "created next to them if none exists.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return { {"--force", "Replace existing hooks and the config file."},
                 {"--exec <path>", "Executable the hooks call (default: hookgate on PATH)."} };
    }
};

}
