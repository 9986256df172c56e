#include "cli/CommandInvoker.hpp"

#include "util/Logger.hpp"

namespace hookgate {

Expected<void> CommandInvoker::invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args) {
    Logger::instance().debug(std::string("Executing command: ") + cmd.name());
    auto res = cmd.execute(ctx, args);
    if (!res) {
        // Rejected commit messages already printed their diagnostic
        if (res.error().code != ErrorCode::InvalidCommitMessage) {
            Logger::instance().error(std::string(cmd.name()) + ": " + res.error().message);
        }
        return res;
    }
    return {};
}

}
