#pragma once

#include "cli/ICommand.hpp"

namespace hookgate {

class PostCommitCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "post-commit"; }
    const char* description() const override { return "Regenerate docs after a commit (post-commit hook)"; }
    const char* helpNameLine() const override { return "post-commit -  Housekeeping after a commit"; }
    const char* helpSynopsis() const override { return "hookgate post-commit"; }
    const char* helpDescription() const override {
        return "Run commands.docs and remind about CHANGELOG.md on main or master. "
               "Never fails: the commit already exists.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}
