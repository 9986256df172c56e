#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace hookgate {

struct InstallOptions {
    bool force{false};                  // overwrite foreign hooks and an existing config
    std::string executable{"hookgate"}; // command the shims exec
};

struct InstallReport {
    std::vector<std::string> installed;
    std::vector<std::string> skipped;   // existing hooks not written by hookgate
    std::filesystem::path hooksDir;
    std::filesystem::path configPath;
    bool configWritten{false};
};

/**
 * @brief Writes hook shims into <git-dir>/hooks
 *
 * Each shim is a two-line shell script that execs `hookgate <hook> "$@"`,
 * so git's arguments (the message file for commit-msg, remote name and url
 * for pre-push) reach the tool unchanged. Shims are recognised by a marker
 * comment and always refreshed; any other existing hook is left alone
 * unless force is set.
 *
 * A default hookgate.yaml is written next to the shims when none exists.
 */
class HookInstaller {
public:
    static const std::vector<std::string>& hookNames();

    static std::string shimScript(const std::string& hook, const std::string& executable);

    /// True if the file at @p path is a hookgate shim
    static bool isShim(const std::filesystem::path& path);

    static Expected<InstallReport> install(const std::filesystem::path& root, const InstallOptions& options);
};

}
