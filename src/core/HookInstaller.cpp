#include "core/HookInstaller.hpp"

#include <fstream>
#include <sstream>

#include "core/Constants.hpp"
#include "core/GitRepository.hpp"
#include "core/HookConfig.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace hookgate {

namespace {

Expected<void> writeFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) return Error{ErrorCode::IoError, "Failed to write " + path.string()};
    out << content;
    if (!out) return Error{ErrorCode::IoError, "Failed to write " + path.string()};
    return {};
}

std::string shellQuote(const std::string& s) {
    if (s.find_first_of(" \t'\"$`\\") == std::string::npos) return s;
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

}

const std::vector<std::string>& HookInstaller::hookNames() {
    static const std::vector<std::string> names{"pre-commit", "commit-msg", "pre-push", "post-commit"};
    return names;
}

std::string HookInstaller::shimScript(const std::string& hook, const std::string& executable) {
    std::ostringstream out;
    out << "#!/bin/sh\n"
        << Constants::SHIM_MARKER << ": " << hook << "\n"
        << "exec " << shellQuote(executable) << " " << hook << " \"$@\"\n";
    return out.str();
}

bool HookInstaller::isShim(const fs::path& path) {
    std::ifstream in(path);
    std::string line;
    for (int i = 0; i < 3 && std::getline(in, line); ++i) {
        if (line.rfind(Constants::SHIM_MARKER, 0) == 0) return true;
    }
    return false;
}

Expected<InstallReport> HookInstaller::install(const fs::path& root, const InstallOptions& options) {
    InstallReport report;
    report.hooksDir = GitRepository::hooksDir(root);
    if (!GitRepository::configuredHooksPath(root).empty()) {
        Logger::instance().warn("core.hooksPath is set, installing into " + report.hooksDir.string());
    }

    std::error_code ec;
    fs::create_directories(report.hooksDir, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "Failed to create " + report.hooksDir.string() + ": " + ec.message()};
    }

    for (const auto& hook : hookNames()) {
        fs::path target = report.hooksDir / hook;
        if (fs::exists(target, ec) && !options.force && !isShim(target)) {
            Logger::instance().warn(hook + ": existing hook left in place (use --force to replace)");
            report.skipped.push_back(hook);
            continue;
        }
        auto res = writeFile(target, shimScript(hook, options.executable));
        if (!res) return res.error();

        fs::permissions(target,
                        fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                        fs::perm_options::add, ec);
        if (ec) {
            return Error{ErrorCode::IoError, "Failed to make " + target.string() + " executable: " + ec.message()};
        }
        Logger::instance().debug("installed " + target.string());
        report.installed.push_back(hook);
    }

    report.configPath = report.hooksDir / Constants::CONFIG_FILE;
    if (!fs::exists(report.configPath, ec) || options.force) {
        auto res = writeFile(report.configPath, HookConfig::defaults().toYaml());
        if (!res) return res.error();
        report.configWritten = true;
    }
    return report;
}

}
