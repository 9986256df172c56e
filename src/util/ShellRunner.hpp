#pragma once

#include "util/IProcessRunner.hpp"

namespace hookgate {

/**
 * @brief Runs commands through /bin/sh -c using fork/exec
 *
 * The child's stdout and stderr are joined into one pipe. Output is
 * captured into ProcessResult::output and, when echo is enabled, copied to
 * stdout as it arrives so hook users see tool progress.
 *
 * A command killed by a signal reports 128 + signal number, as shells do.
 */
class ShellRunner : public IProcessRunner {
public:
    explicit ShellRunner(bool echo = true) : echoOutput(echo) {}

    Expected<ProcessResult> run(const std::string& command,
                                const std::filesystem::path& workDir) override;
    bool commandAvailable(const std::string& tool) const override;

private:
    bool echoOutput;
};

}
