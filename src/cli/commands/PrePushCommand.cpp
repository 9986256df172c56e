#include "cli/commands/PrePushCommand.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

#include "cli/HookEnvironment.hpp"
#include "core/Constants.hpp"
#include "core/GitRepository.hpp"
#include "core/QualityGates.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace hookgate {

namespace {

void printSection(const std::string& title) {
    std::cout << "\n==================================\n"
              << title << "\n"
              << "==================================\n";
}

std::string percent(double v) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << v << "%";
    return out.str();
}

Expected<void> checkCoverage(const HookEnvironment& env) {
    const std::string& cmd = env.config.commands.coverage;
    if (cmd.empty()) return {};
    std::cout << "Checking test coverage...\n";

    std::string tool = commandTool(cmd);
    if (!env.runner->commandAvailable(tool)) {
        Logger::instance().info("coverage tool '" + tool + "' not installed, skipped");
        return {};
    }
    auto res = env.runner->run(cmd, env.root);
    if (!res) return res.error();

    auto pct = parseCoveragePercent(res.value().output);
    if (!pct) {
        Logger::instance().warn("Could not read a coverage percentage from '" + cmd + "'");
        return {};
    }
    double min = env.config.qualityGates.minCoverage;
    if (*pct < min) {
        Logger::instance().warn("Test coverage " + percent(*pct) + " is below " + percent(min));
        std::cout << "Consider adding more tests\n";
    } else {
        std::cout << "Coverage " << percent(*pct) << "\n";
    }
    return {};
}

Expected<void> runBenchmarks(const HookEnvironment& env) {
    const std::string& cmd = env.config.commands.bench;
    if (!env.config.performance.runBenchmarksOnPush || cmd.empty()) return {};
    std::cout << "Running benchmarks...\n";
    auto res = env.runner->run(cmd, env.root);
    if (!res) return res.error();
    if (!res.value().ok()) {
        Logger::instance().warn("Benchmarks failed (exit " + std::to_string(res.value().exitCode) + ")");
    }
    return {};
}

void checkSecrets(const HookEnvironment& env) {
    const SecurityRules& sec = env.config.security;
    if (!sec.checkSecrets) return;
    std::cout << "Final security check...\n";
    auto hits = scanForSecrets(env.root, sec.scanDirs, sec.scanExtensions, Constants::MAX_SECRET_HITS);
    if (hits.empty()) return;
    for (const auto& h : hits) {
        std::cout << h.path.generic_string() << ":" << h.line << ": " << h.text << "\n";
    }
    Logger::instance().warn("Potential secrets detected in source code");
    std::cout << "Ensure no sensitive data is committed\n";
}

void checkBinarySize(const HookEnvironment& env) {
    const PerformanceRules& perf = env.config.performance;
    if (!perf.checkBinarySize || perf.binaryPath.empty()) return;
    fs::path binary = env.root / perf.binaryPath;
    std::error_code ec;
    if (!fs::is_regular_file(binary, ec)) {
        Logger::instance().debug("binary " + binary.string() + " not built, size check skipped");
        return;
    }
    auto size = fileSizeMb(binary);
    if (!size) {
        Logger::instance().warn(size.error().message);
        return;
    }
    if (size.value() > perf.maxBinarySizeMb) {
        std::ostringstream msg;
        msg << std::fixed << std::setprecision(1) << "Binary " << perf.binaryPath << " is "
            << size.value() << " MB, limit is " << perf.maxBinarySizeMb << " MB";
        Logger::instance().warn(msg.str());
    }
}

}

/**
 * @brief Execute 'hookgate pre-push'
 *
 * Git calls pre-push with the remote name and url; the refs being pushed
 * arrive on stdin and are not needed here. Only the release tests can
 * abort the push; the remaining gates report warnings.
 */
Expected<void> PrePushCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    auto envRes = loadHookEnvironment(ctx);
    if (!envRes) return envRes.error();
    const HookEnvironment& env = envRes.value();

    if (!args.empty()) {
        Logger::instance().debug("pushing to " + args.front());
    }
    std::cout << "Running pre-push checks...\n";

    auto branch = GitRepository::currentBranch(env.root);
    if (!branch) return branch.error();

    if (branch.value() == env.config.push.protectedBranch) {
        printSection("Pushing to protected branch: " + branch.value());

        std::cout << "Running comprehensive test suite...\n";
        const std::string& releaseCmd = env.config.commands.releaseTest;
        if (releaseCmd.empty()) {
            Logger::instance().info("release_test: no command configured, skipped");
        } else {
            auto res = env.runner->run(releaseCmd, env.root);
            if (!res) return res.error();
            if (!res.value().ok()) {
                std::cout << "Release tests failed!\n";
                return Error{ErrorCode::CommandFailed, "release tests failed, push aborted"};
            }
        }

        auto cov = checkCoverage(env);
        if (!cov) return cov;
        auto bench = runBenchmarks(env);
        if (!bench) return bench;
        checkSecrets(env);
        checkBinarySize(env);
    }

    printSection("Pre-push checks completed");
    std::cout << "Ready to push!\n";
    return {};
}

}
