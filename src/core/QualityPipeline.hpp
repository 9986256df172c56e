#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "core/HookConfig.hpp"
#include "util/Expected.hpp"
#include "util/IProcessRunner.hpp"

namespace hookgate {

/// Which set of checks to run
enum class PipelineProfile {
    Full,       // format check, lint, tests, docs, benchmarks (when benches/ exists)
    Fast,       // format (rewrites files), lint, fast tests
    Commit,     // format check, lint, fast tests; used by pre-commit
    Tests,      // full test suite only
    FastTests   // fast tests only
};

struct PipelineStep {
    std::string name;       // e.g. "lint"
    std::string label;      // e.g. "Running linter"
    std::string command;    // empty = skipped
};

struct StepResult {
    std::string name;
    std::string command;
    bool skipped{false};
    int exitCode{0};

    bool ok() const { return skipped || exitCode == 0; }
};

struct PipelineReport {
    std::vector<StepResult> steps;

    bool passed() const;
    /// First failed step, or nullptr
    const StepResult* firstFailure() const;
};

/**
 * @brief Ordered quality checks run through an IProcessRunner
 *
 * Steps run in order from the work tree root. A step without a command is
 * recorded as skipped. By default the pipeline stops at the first failing
 * step, like a shell script under `set -e`.
 */
class QualityPipeline {
public:
    QualityPipeline(IProcessRunner& runner, std::filesystem::path workDir);

    static std::vector<PipelineStep> stepsFor(PipelineProfile profile,
                                              const HookConfig& config,
                                              const std::filesystem::path& root);

    void addStep(PipelineStep step);
    void addSteps(const std::vector<PipelineStep>& steps);
    const std::vector<PipelineStep>& steps() const { return steps_; }

    /// Run all steps; errors only when a command could not be started
    Expected<PipelineReport> run(bool stopOnFailure = true);

private:
    IProcessRunner& runner;
    std::filesystem::path workDir;
    std::vector<PipelineStep> steps_;
};

/// Parse "full", "fast", "commit", "tests" or "fast-tests"
Expected<PipelineProfile> parseProfile(const std::string& name);

}
