#include "cli/CommandFactory.hpp"

#include <algorithm>

#include "cli/commands/CheckCommand.hpp"
#include "cli/commands/CommitMsgCommand.hpp"
#include "cli/commands/ConfigCommand.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/InstallCommand.hpp"
#include "cli/commands/PostCommitCommand.hpp"
#include "cli/commands/PreCommitCommand.hpp"
#include "cli/commands/PrePushCommand.hpp"
#include "cli/commands/TestCommand.hpp"

namespace hookgate {

CommandFactory& CommandFactory::instance() {
    static CommandFactory f;
    return f;
}

void CommandFactory::registerCreator(const std::string& name, Creator creator) {
    creators[name] = std::move(creator);
}

std::unique_ptr<ICommand> CommandFactory::create(const std::string& name) const {
    auto it = creators.find(name);
    if (it == creators.end()) return nullptr;
    return it->second();
}

void CommandFactory::listCommands(std::vector<std::unique_ptr<ICommand>>& out) const {
    out.clear();
    out.reserve(creators.size());
    for (const auto& kv : creators) {
        out.emplace_back(kv.second());
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return std::string(a->name()) < std::string(b->name());
    });
}

void registerBuiltinCommands() {
    auto& f = CommandFactory::instance();
    f.registerCreator("help", [] { return std::make_unique<HelpCommand>(); });
    f.registerCreator("install", [] { return std::make_unique<InstallCommand>(); });
    f.registerCreator("commit-msg", [] { return std::make_unique<CommitMsgCommand>(); });
    f.registerCreator("pre-commit", [] { return std::make_unique<PreCommitCommand>(); });
    f.registerCreator("pre-push", [] { return std::make_unique<PrePushCommand>(); });
    f.registerCreator("post-commit", [] { return std::make_unique<PostCommitCommand>(); });
    f.registerCreator("check", [] { return std::make_unique<CheckCommand>(); });
    f.registerCreator("test", [] { return std::make_unique<TestCommand>(); });
    f.registerCreator("config", [] { return std::make_unique<ConfigCommand>(); });
}

}
