#pragma once

#include <filesystem>

#include "cli/ICommand.hpp"
#include "core/HookConfig.hpp"
#include "util/IProcessRunner.hpp"

namespace hookgate {

/// What a hook needs to act on the current repository.
struct HookEnvironment {
    std::filesystem::path root;
    HookConfig config;
    IProcessRunner* runner{nullptr};
};

/**
 * @brief Locate the repository from the working directory and load its config
 * @param requireRepo When false, running outside a repository yields an
 *        empty root and config from --config / $HOOKGATE_CONFIG / defaults
 */
Expected<HookEnvironment> loadHookEnvironment(const AppContext& ctx, bool requireRepo = true);

}
