#pragma once

#include "cli/ICommand.hpp"

namespace hookgate {

class CommitMsgCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "commit-msg"; }
    const char* description() const override { return "Validate a commit message (commit-msg hook)"; }
    const char* helpNameLine() const override { return "commit-msg -  Check a message against the conventional commit format"; }
    const char* helpSynopsis() const override { return "hookgate commit-msg <file>\nhookgate commit-msg -m <msg> [-m <msg>...]"; }
    const char* helpDescription() const override {
        return "Accept the message if its subject line is 'type(scope): description' with a known "
               "type and a 1-50 character description; otherwise print the rules and exit non-zero. "
               "Git passes the path of the message file.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return { {"-m <msg>", "Validate <msg> instead of a file; multiple -m concatenate paragraphs."} };
    }
};

}
