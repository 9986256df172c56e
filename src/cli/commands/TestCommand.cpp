#include "cli/commands/TestCommand.hpp"

#include <iostream>

#include "cli/HookEnvironment.hpp"
#include "core/QualityPipeline.hpp"

namespace hookgate {

Expected<void> TestCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    bool fast = false;
    for (const auto& a : args) {
        if (a == "--fast") fast = true;
        else return Error{ErrorCode::InvalidArgs, "test: unexpected argument '" + a + "'"};
    }

    auto envRes = loadHookEnvironment(ctx);
    if (!envRes) return envRes.error();
    const HookEnvironment& env = envRes.value();

    QualityPipeline pipeline(*env.runner, env.root);
    pipeline.addSteps(QualityPipeline::stepsFor(fast ? PipelineProfile::FastTests : PipelineProfile::Tests,
                                                env.config, env.root));
    auto report = pipeline.run(true);
    if (!report) return report.error();
    if (report.value().firstFailure()) {
        return Error{ErrorCode::CommandFailed, "tests failed"};
    }
    std::cout << (fast ? "Fast tests completed!\n" : "Tests completed!\n");
    return {};
}

}
