#pragma once

#include <cstddef>

/**
 * @brief Shared constants for hook handling
 *
 * Centralizes default thresholds and file names.
 */
namespace hookgate {

namespace Constants {
    // Commit message rules
    constexpr size_t DEFAULT_MAX_SUBJECT_LENGTH = 50;    // description length bound
    constexpr size_t DEFAULT_MAX_BODY_LINE_LENGTH = 72;
    constexpr char COMMENT_CHAR = '#';                   // git comment lines
    constexpr const char* SCISSORS_MARKER = "------------------------ >8 ------------------------";

    // Quality gates
    constexpr int DEFAULT_MAX_COMPLEXITY = 20;
    constexpr double DEFAULT_MIN_COVERAGE = 80.0;        // percent
    constexpr int DEFAULT_MAX_CYCLOMATIC_COMPLEXITY = 10;
    constexpr double DEFAULT_MAX_BINARY_SIZE_MB = 50.0;
    constexpr size_t MAX_SECRET_HITS = 5;                // hits reported by pre-push

    // Repository layout
    constexpr const char* GIT_DIR = ".git";
    constexpr const char* HOOKS_DIR = "hooks";
    constexpr const char* CONFIG_FILE = "hookgate.yaml";
    constexpr const char* SHIM_MARKER = "# hookgate shim";
    constexpr const char* DEFAULT_PROTECTED_BRANCH = "master";
}
}
