#pragma once

#include <filesystem>
#include <string>

#include "util/Expected.hpp"

namespace hookgate {

/**
 * @brief Read-only view of the git repository the hooks run in
 *
 * Only the pieces hooks need: locating the work tree root and git
 * directory, the hooks directory, and the current branch from HEAD.
 *
 * Supports both a plain `.git` directory and a `.git` file containing
 * `gitdir: <path>` (worktrees and submodules). HEAD is read from the
 * per-worktree git dir; hooks live in the common dir.
 */
class GitRepository {
public:
    /**
     * @brief Find the work tree root by searching upwards for .git
     * @param start Starting directory (usually current working directory)
     * @return Absolute path to the work tree root, or NotARepository
     */
    static Expected<std::filesystem::path> discoverRoot(const std::filesystem::path& start);

    /// Resolve the git directory for a work tree root (follows gitdir: files)
    static std::filesystem::path gitDir(const std::filesystem::path& root);

    /**
     * @brief Directory shared by all worktrees of a repository
     *
     * A linked worktree's git dir holds a `commondir` file naming the main
     * git dir (relative to itself); otherwise this is gitDir(root).
     */
    static std::filesystem::path commonDir(const std::filesystem::path& root);

    /// core.hooksPath from the repository config, empty when unset
    static std::filesystem::path configuredHooksPath(const std::filesystem::path& root);

    /// Where git looks for hooks: core.hooksPath, else <common-dir>/hooks
    static std::filesystem::path hooksDir(const std::filesystem::path& root);

    /**
     * @brief Current branch name
     * @param root Work tree root
     * @return Branch name ("main" for ref: refs/heads/main), "HEAD" when
     *         detached, or IoError if HEAD cannot be read
     */
    static Expected<std::string> currentBranch(const std::filesystem::path& root);
};

}
