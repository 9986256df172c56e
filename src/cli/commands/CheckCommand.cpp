#include "cli/commands/CheckCommand.hpp"

#include <iostream>

#include "cli/HookEnvironment.hpp"
#include "core/QualityPipeline.hpp"

namespace hookgate {

namespace {

void printPipelineSummary(const PipelineReport& report) {
    std::cout << "\nSummary:\n";
    for (const auto& s : report.steps) {
        const char* status = s.skipped ? "skip" : (s.ok() ? "ok  " : "FAIL");
        std::cout << "  " << status << "  " << s.name << "\n";
    }
}

}

Expected<void> CheckCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    PipelineProfile profile = PipelineProfile::Full;
    bool stopOnFailure = false;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--fast") {
            profile = PipelineProfile::Fast;
        } else if (args[i] == "--stop-on-failure") {
            stopOnFailure = true;
        } else if (args[i] == "--profile" && i + 1 < args.size()) {
            auto p = parseProfile(args[i + 1]);
            if (!p) return p.error();
            profile = p.value();
            ++i;
        } else {
            return Error{ErrorCode::InvalidArgs, "check: unexpected argument '" + args[i] + "'"};
        }
    }

    auto envRes = loadHookEnvironment(ctx);
    if (!envRes) return envRes.error();
    const HookEnvironment& env = envRes.value();

    std::cout << (profile == PipelineProfile::Fast ? "Running fast quality checks...\n"
                                                   : "Running comprehensive quality checks...\n");
    QualityPipeline pipeline(*env.runner, env.root);
    pipeline.addSteps(QualityPipeline::stepsFor(profile, env.config, env.root));

    auto report = pipeline.run(stopOnFailure);
    if (!report) return report.error();
    printPipelineSummary(report.value());

    if (const StepResult* failed = report.value().firstFailure()) {
        return Error{ErrorCode::CommandFailed, "quality checks failed (first failure: " + failed->name + ")"};
    }
    std::cout << "All quality checks completed!\n";
    return {};
}

}
