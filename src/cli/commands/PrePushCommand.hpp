#pragma once

#include "cli/ICommand.hpp"

namespace hookgate {

class PrePushCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "pre-push"; }
    const char* description() const override { return "Release checks before pushing (pre-push hook)"; }
    const char* helpNameLine() const override { return "pre-push -  Extra checks when pushing the protected branch"; }
    const char* helpSynopsis() const override { return "hookgate pre-push [<remote> <url>]"; }
    const char* helpDescription() const override {
        return "When the current branch is push.protected_branch: run commands.release_test "
               "(failure aborts the push), then warn on coverage below quality_gates.min_coverage, "
               "likely secrets in the scanned sources and an oversized binary. Other branches pass.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}
