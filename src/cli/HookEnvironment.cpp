#include "cli/HookEnvironment.hpp"

#include "core/GitRepository.hpp"

namespace hookgate {

Expected<HookEnvironment> loadHookEnvironment(const AppContext& ctx, bool requireRepo) {
    HookEnvironment env;
    auto rootRes = GitRepository::discoverRoot(std::filesystem::current_path());
    if (rootRes) {
        env.root = rootRes.value();
    } else if (requireRepo || rootRes.error().code != ErrorCode::NotARepository) {
        return rootRes.error();
    }

    auto cfgRes = HookConfig::loadFor(ctx.configPath, env.root);
    if (!cfgRes) return cfgRes.error();
    env.config = cfgRes.value();

    env.runner = ctx.runner ? ctx.runner : &ProcessRunnerFactory::shared();
    return env;
}

}
