#include "cli/commands/PostCommitCommand.hpp"

#include <iostream>

#include "cli/HookEnvironment.hpp"
#include "core/GitRepository.hpp"
#include "util/Logger.hpp"

namespace hookgate {

Expected<void> PostCommitCommand::execute(const AppContext& ctx, const std::vector<std::string>&) {
    auto envRes = loadHookEnvironment(ctx);
    if (!envRes) {
        Logger::instance().warn("post-commit: " + envRes.error().message);
        return {};
    }
    const HookEnvironment& env = envRes.value();

    std::cout << "Post-commit: updating documentation...\n";
    const std::string& docs = env.config.commands.docs;
    if (docs.empty()) {
        Logger::instance().info("docs: no command configured, skipped");
    } else {
        auto res = env.runner->run(docs, env.root);
        if (res && res.value().ok()) {
            std::cout << "Documentation updated\n";
        } else {
            Logger::instance().warn(res ? "Documentation generation had issues" : res.error().message);
        }
    }

    auto branch = GitRepository::currentBranch(env.root);
    if (!branch) {
        Logger::instance().debug(branch.error().message);
    } else if (branch.value() == "master" || branch.value() == "main") {
        std::cout << "Consider updating CHANGELOG.md for this commit\n";
    }

    std::cout << "Post-commit tasks completed\n";
    return {};
}

}
