#include "core/QualityPipeline.hpp"

#include <iostream>

#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace hookgate {

bool PipelineReport::passed() const {
    return firstFailure() == nullptr;
}

const StepResult* PipelineReport::firstFailure() const {
    for (const auto& s : steps) {
        if (!s.ok()) return &s;
    }
    return nullptr;
}

QualityPipeline::QualityPipeline(IProcessRunner& runner, fs::path workDir)
    : runner(runner), workDir(std::move(workDir)) {}

std::vector<PipelineStep> QualityPipeline::stepsFor(PipelineProfile profile,
                                                    const HookConfig& config,
                                                    const fs::path& root) {
    const CommandSet& c = config.commands;
    switch (profile) {
        case PipelineProfile::Full: {
            std::vector<PipelineStep> steps{
                {"format", "Checking formatting", c.formatCheck},
                {"lint", "Running linter", c.lint},
                {"test", "Running tests", c.test},
                {"docs", "Building documentation", c.docs},
            };
            std::error_code ec;
            if (fs::is_directory(root / "benches", ec)) {
                steps.push_back({"bench", "Running benchmarks", c.bench});
            }
            return steps;
        }
        case PipelineProfile::Fast:
            return {
                {"format", "Formatting code", c.format},
                {"lint", "Running linter", c.lint},
                {"test", "Running fast tests", c.testFast},
            };
        case PipelineProfile::Commit:
            return {
                {"format", "Checking formatting", c.formatCheck},
                {"lint", "Running linter", c.lint},
                {"test", "Running fast tests", c.testFast},
            };
        case PipelineProfile::Tests:
            return {{"test", "Running tests", c.test}};
        case PipelineProfile::FastTests:
            return {{"test", "Running fast tests", c.testFast}};
    }
    return {};
}

void QualityPipeline::addStep(PipelineStep step) {
    steps_.push_back(std::move(step));
}

void QualityPipeline::addSteps(const std::vector<PipelineStep>& steps) {
    steps_.insert(steps_.end(), steps.begin(), steps.end());
}

Expected<PipelineReport> QualityPipeline::run(bool stopOnFailure) {
    PipelineReport report;
    for (const auto& step : steps_) {
        StepResult sr;
        sr.name = step.name;
        sr.command = step.command;
        if (step.command.empty()) {
            sr.skipped = true;
            Logger::instance().info(step.name + ": no command configured, skipped");
            report.steps.push_back(sr);
            continue;
        }

        std::cout << step.label << "...\n";
        auto res = runner.run(step.command, workDir);
        if (!res) {
            return Error{res.error().code, step.name + ": " + res.error().message};
        }
        sr.exitCode = res.value().exitCode;
        report.steps.push_back(sr);

        if (!sr.ok()) {
            Logger::instance().error(step.name + " failed (exit " + std::to_string(sr.exitCode) + "): " + step.command);
            if (stopOnFailure) break;
        }
    }
    return report;
}

Expected<PipelineProfile> parseProfile(const std::string& name) {
    if (name == "full") return PipelineProfile::Full;
    if (name == "fast") return PipelineProfile::Fast;
    if (name == "commit") return PipelineProfile::Commit;
    if (name == "tests") return PipelineProfile::Tests;
    if (name == "fast-tests") return PipelineProfile::FastTests;
    return Error{ErrorCode::InvalidArgs, "unknown profile: " + name};
}

}
