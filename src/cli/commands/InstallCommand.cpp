#include "cli/commands/InstallCommand.hpp"

#include <filesystem>
#include <iostream>

#include "core/GitRepository.hpp"
#include "core/HookInstaller.hpp"

namespace hookgate {

Expected<void> InstallCommand::execute(const AppContext&, const std::vector<std::string>& args) {
    InstallOptions options;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--force" || args[i] == "-f") {
            options.force = true;
        } else if (args[i] == "--exec" && i + 1 < args.size()) {
            options.executable = args[i + 1];
            ++i;
        } else {
            return Error{ErrorCode::InvalidArgs, "install: unexpected argument '" + args[i] + "'"};
        }
    }

    auto rootRes = GitRepository::discoverRoot(std::filesystem::current_path());
    if (!rootRes) {
        return Error{rootRes.error().code, rootRes.error().message + " (run this from the project root)"};
    }

    std::cout << "Installing git hooks...\n";
    auto res = HookInstaller::install(rootRes.value(), options);
    if (!res) return res.error();
    const InstallReport& report = res.value();

    std::cout << "\nInstalled hooks:\n";
    for (const auto& hook : report.installed) {
        std::cout << "  " << hook << "\n";
    }
    if (!report.skipped.empty()) {
        std::cout << "Skipped (existing hooks):\n";
        for (const auto& hook : report.skipped) {
            std::cout << "  " << hook << "\n";
        }
    }
    std::cout << "\nConfiguration:\n  " << report.configPath.string()
              << (report.configWritten ? " (created)" : " (kept)") << "\n";
    std::cout << "\nRun 'hookgate check' for a manual quality check.\n";
    return {};
}

}
