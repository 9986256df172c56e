// Git hook entry point using Command Pattern.

#include <iostream>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/ICommand.hpp"
#include "util/Logger.hpp"

using namespace hookgate;

int main(int argc, char** argv) {
    registerBuiltinCommands();
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    AppContext ctx{};
    // Global options come before the command name
    while (!args.empty() && args.front().rfind("-", 0) == 0) {
        if (args.front() == "--config" && args.size() > 1) {
            ctx.configPath = args[1];
            args.erase(args.begin(), args.begin() + 2);
        } else if (args.front() == "--verbose" || args.front() == "-v") {
            Logger::instance().setLevel(LogLevel::Debug);
            args.erase(args.begin());
        } else if (args.front() == "--quiet" || args.front() == "-q") {
            Logger::instance().setLevel(LogLevel::Warn);
            args.erase(args.begin());
        } else {
            std::cerr << "Unknown option: " << args.front() << "\n";
            return 2;
        }
    }

    CommandInvoker invoker;
    if (args.empty()) {
        auto cmd = CommandFactory::instance().create("help");
        invoker.invoke(*cmd, ctx, {});
        return 0;
    }
    std::string cmdName = args.front();
    args.erase(args.begin());
    auto cmd = CommandFactory::instance().create(cmdName);
    if (!cmd) {
        std::cerr << "Unknown command: " << cmdName << "\n";
        auto help = CommandFactory::instance().create("help");
        invoker.invoke(*help, ctx, {});
        return 1;
    }
    auto res = invoker.invoke(*cmd, ctx, args);
    return res ? 0 : 1;
}
