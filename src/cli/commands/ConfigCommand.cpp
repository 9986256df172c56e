#include "cli/commands/ConfigCommand.hpp"

#include <iostream>

#include "cli/HookEnvironment.hpp"

namespace hookgate {

Expected<void> ConfigCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    bool pathOnly = false;
    for (const auto& a : args) {
        if (a == "--path") pathOnly = true;
        else return Error{ErrorCode::InvalidArgs, "config: unexpected argument '" + a + "'"};
    }

    auto envRes = loadHookEnvironment(ctx, false);
    if (!envRes) return envRes.error();
    const HookEnvironment& env = envRes.value();
    auto path = HookConfig::resolvePath(ctx.configPath, env.root);

    if (pathOnly) {
        std::cout << path.string() << "\n";
        return {};
    }
    std::cout << "# source: " << (path.empty() ? std::string("built-in defaults") : path.string()) << "\n";
    std::cout << env.config.toYaml();
    return {};
}

}
