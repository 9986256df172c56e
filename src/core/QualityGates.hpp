#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace hookgate {

/**
 * @brief Extract a coverage percentage from coverage tool output
 *
 * Looks at lines mentioning "coverage" (any case) and returns the first
 * percentage on such a line, e.g. "Coverage: 83.5%" or
 * "83.50% coverage, 501/600 lines covered".
 */
std::optional<double> parseCoveragePercent(const std::string& output);

/// Size of a file in megabytes (1 MB = 1024 * 1024 bytes)
Expected<double> fileSizeMb(const std::filesystem::path& path);

/// First word of a command line, used to probe whether a tool is installed
std::string commandTool(const std::string& command);

struct SecretHit {
    std::filesystem::path path;   // relative to the scan root
    size_t line{0};
    std::string text;
};

/**
 * @brief Scan source trees for lines that look like they hold credentials
 *
 * A line is a hit when it contains "password", "secret", "key" or "token"
 * and does not contain "// " (commented lines are ignored). Only regular
 * files whose extension is listed are read.
 *
 * @param root Repository root; dirs are resolved against it
 * @param dirs Directories to scan; missing ones are skipped
 * @param extensions File extensions including the dot (".cpp")
 * @param maxHits Stop after this many hits
 */
std::vector<SecretHit> scanForSecrets(const std::filesystem::path& root,
                                      const std::vector<std::string>& dirs,
                                      const std::vector<std::string>& extensions,
                                      size_t maxHits);

}
