#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "core/CommitValidator.hpp"
#include "core/Constants.hpp"
#include "util/Expected.hpp"

namespace hookgate {

struct QualityGates {
    int maxComplexity{Constants::DEFAULT_MAX_COMPLEXITY};
    double minCoverage{Constants::DEFAULT_MIN_COVERAGE};
    int maxCyclomaticComplexity{Constants::DEFAULT_MAX_CYCLOMATIC_COMPLEXITY};
};

struct SecurityRules {
    bool checkSecrets{true};
    bool checkUnsafeCode{true};
    bool warnOnUnwrap{true};
    std::vector<std::string> scanDirs{"src"};
    std::vector<std::string> scanExtensions{".cpp", ".hpp", ".h", ".cc"};
};

struct PerformanceRules {
    bool runBenchmarksOnPush{false};
    bool checkBinarySize{true};
    double maxBinarySizeMb{Constants::DEFAULT_MAX_BINARY_SIZE_MB};
    std::string binaryPath;     // relative to the repository root
};

struct PushRules {
    std::string protectedBranch{Constants::DEFAULT_PROTECTED_BRANCH};
};

/// Shell command lines for each quality step; empty means "skip".
struct CommandSet {
    std::string format;
    std::string formatCheck;
    std::string lint;
    std::string test;
    std::string testFast;
    std::string releaseTest;
    std::string coverage;
    std::string docs;
    std::string bench;
};

/**
 * @brief Hook settings loaded from hookgate.yaml
 *
 * File layout (every key optional, missing keys keep their defaults):
 *
 *   quality_gates: { max_complexity, min_coverage, max_cyclomatic_complexity }
 *   commit_rules:  { enforce_conventional_commits, max_subject_length, max_body_line_length }
 *   security:      { check_secrets, check_unsafe_code, warn_on_unwrap, scan_dirs, scan_extensions }
 *   performance:   { run_benchmarks_on_push, check_binary_size, max_binary_size_mb, binary_path }
 *   push:          { protected_branch }
 *   commands:      { format, format_check, lint, test, test_fast, release_test, coverage, docs, bench }
 *
 * max_complexity, max_cyclomatic_complexity, check_unsafe_code and
 * warn_on_unwrap are carried and displayed but no hook enforces them.
 */
struct HookConfig {
    QualityGates qualityGates;
    CommitRules commitRules;
    SecurityRules security;
    PerformanceRules performance;
    PushRules push;
    CommandSet commands;

    static HookConfig defaults() { return HookConfig{}; }

    /// Parse YAML text; malformed documents or wrongly typed keys give ConfigError
    static Expected<HookConfig> parse(const std::string& yamlText);

    static Expected<HookConfig> loadFile(const std::filesystem::path& path);

    /**
     * @brief Locate the config file for a repository
     * @param explicitPath Path given with --config (wins when non-empty)
     * @param root Repository root, may be empty when outside a repository
     * @return Path to use, or empty when built-in defaults apply
     *
     * Lookup order: explicitPath, $HOOKGATE_CONFIG, <git-dir>/hooks/hookgate.yaml.
     */
    static std::filesystem::path resolvePath(const std::string& explicitPath,
                                             const std::filesystem::path& root);

    /// resolvePath + loadFile; an explicitly named file must exist
    static Expected<HookConfig> loadFor(const std::string& explicitPath,
                                        const std::filesystem::path& root);

    std::string toYaml() const;
};

}
