#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "util/Expected.hpp"

namespace hookgate {

/// Outcome of one external command.
struct ProcessResult {
    int exitCode{-1};
    std::string output;     // combined stdout and stderr

    bool ok() const { return exitCode == 0; }
};

/**
 * @brief Strategy interface for running external tools
 *
 * Quality gates shell out to formatters, linters and test runners. Hooks
 * talk to this interface so tests can substitute a scripted runner.
 */
class IProcessRunner {
public:
    virtual ~IProcessRunner() = default;

    /**
     * @brief Run a shell command line and wait for it
     * @param command Command line, interpreted by /bin/sh
     * @param workDir Directory to run in (empty = inherit)
     * @return Exit status and captured output, or error if it could not be started
     */
    virtual Expected<ProcessResult> run(const std::string& command,
                                        const std::filesystem::path& workDir) = 0;

    /// True if an executable named @p tool is reachable through PATH
    virtual bool commandAvailable(const std::string& tool) const = 0;
};

/**
 * @brief Factory for process runner instances
 */
class ProcessRunnerFactory {
public:
    /// Shell runner that echoes tool output to the terminal
    static std::unique_ptr<IProcessRunner> createDefault();

    /// Shared default runner, used when no runner is injected
    static IProcessRunner& shared();
};

}
