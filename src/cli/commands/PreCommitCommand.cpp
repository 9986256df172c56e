#include "cli/commands/PreCommitCommand.hpp"

#include <iostream>

#include "cli/HookEnvironment.hpp"
#include "core/QualityPipeline.hpp"

namespace hookgate {

Expected<void> PreCommitCommand::execute(const AppContext& ctx, const std::vector<std::string>&) {
    auto envRes = loadHookEnvironment(ctx);
    if (!envRes) return envRes.error();
    const HookEnvironment& env = envRes.value();

    std::cout << "Running pre-commit checks...\n";
    QualityPipeline pipeline(*env.runner, env.root);
    pipeline.addSteps(QualityPipeline::stepsFor(PipelineProfile::Commit, env.config, env.root));

    auto report = pipeline.run(true);
    if (!report) return report.error();
    if (const StepResult* failed = report.value().firstFailure()) {
        return Error{ErrorCode::CommandFailed, failed->name + " failed, commit aborted"};
    }
    std::cout << "Pre-commit checks passed\n";
    return {};
}

}
