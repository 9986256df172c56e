#include <gtest/gtest.h>
#include <filesystem>
#include "test_utils.hpp"
#include "core/QualityPipeline.hpp"

namespace fs = std::filesystem;

using namespace hookgate;
using namespace hookgate::test;
using namespace hookgate::test::utils;

class QualityPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        config.commands.format = "fmt";
        config.commands.formatCheck = "fmt --check";
        config.commands.lint = "lint";
        config.commands.test = "test-all";
        config.commands.testFast = "test-fast";
        config.commands.docs = "docs";
        config.commands.bench = "bench";
    }

    void TearDown() override {
        removeDir(tempDir);
    }

    fs::path tempDir;
    HookConfig config;
    FakeRunner runner;
};

// Test: Full profile order, benches only when the directory exists
TEST_F(QualityPipelineTest, FullProfileSteps) {
    auto steps = QualityPipeline::stepsFor(PipelineProfile::Full, config, tempDir);
    ASSERT_EQ(steps.size(), 4u);
    EXPECT_EQ(steps[0].command, "fmt --check");
    EXPECT_EQ(steps[1].command, "lint");
    EXPECT_EQ(steps[2].command, "test-all");
    EXPECT_EQ(steps[3].command, "docs");

    fs::create_directories(tempDir / "benches");
    steps = QualityPipeline::stepsFor(PipelineProfile::Full, config, tempDir);
    ASSERT_EQ(steps.size(), 5u);
    EXPECT_EQ(steps[4].command, "bench");
}

TEST_F(QualityPipelineTest, FastAndCommitProfiles) {
    auto fast = QualityPipeline::stepsFor(PipelineProfile::Fast, config, tempDir);
    ASSERT_EQ(fast.size(), 3u);
    EXPECT_EQ(fast[0].command, "fmt");
    EXPECT_EQ(fast[2].command, "test-fast");

    auto commit = QualityPipeline::stepsFor(PipelineProfile::Commit, config, tempDir);
    ASSERT_EQ(commit.size(), 3u);
    EXPECT_EQ(commit[0].command, "fmt --check");

    auto tests = QualityPipeline::stepsFor(PipelineProfile::FastTests, config, tempDir);
    ASSERT_EQ(tests.size(), 1u);
    EXPECT_EQ(tests[0].command, "test-fast");
}

TEST_F(QualityPipelineTest, RunsInOrderFromWorkDir) {
    QualityPipeline pipeline(runner, tempDir);
    pipeline.addSteps(QualityPipeline::stepsFor(PipelineProfile::Commit, config, tempDir));
    auto report = pipeline.run();
    ASSERT_TRUE(report.has_value()) << report.error().message;
    EXPECT_TRUE(report.value().passed());
    EXPECT_EQ(runner.calls, (std::vector<std::string>{"fmt --check", "lint", "test-fast"}));
    EXPECT_EQ(runner.lastWorkDir, tempDir);
}

// Test: First failure stops the run
TEST_F(QualityPipelineTest, StopsOnFailure) {
    runner.results["lint"] = ProcessResult{2, "warning: unused"};
    QualityPipeline pipeline(runner, tempDir);
    pipeline.addSteps(QualityPipeline::stepsFor(PipelineProfile::Commit, config, tempDir));

    auto report = pipeline.run(true);
    ASSERT_TRUE(report.has_value());
    EXPECT_FALSE(report.value().passed());
    ASSERT_NE(report.value().firstFailure(), nullptr);
    EXPECT_EQ(report.value().firstFailure()->name, "lint");
    EXPECT_EQ(report.value().firstFailure()->exitCode, 2);
    EXPECT_FALSE(runner.ran("test-fast"));
}

TEST_F(QualityPipelineTest, KeepGoingRunsEverything) {
    runner.results["lint"] = ProcessResult{1, ""};
    QualityPipeline pipeline(runner, tempDir);
    pipeline.addSteps(QualityPipeline::stepsFor(PipelineProfile::Commit, config, tempDir));

    auto report = pipeline.run(false);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report.value().steps.size(), 3u);
    EXPECT_TRUE(runner.ran("test-fast"));
    EXPECT_FALSE(report.value().passed());
}

TEST_F(QualityPipelineTest, EmptyCommandsAreSkipped) {
    HookConfig bare;
    QualityPipeline pipeline(runner, tempDir);
    pipeline.addSteps(QualityPipeline::stepsFor(PipelineProfile::Full, bare, tempDir));
    auto report = pipeline.run();
    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(report.value().passed());
    EXPECT_TRUE(runner.calls.empty());
    for (const auto& s : report.value().steps) EXPECT_TRUE(s.skipped);
}

TEST_F(QualityPipelineTest, StartFailureIsError) {
    runner.failToStart.insert("lint");
    QualityPipeline pipeline(runner, tempDir);
    pipeline.addSteps(QualityPipeline::stepsFor(PipelineProfile::Commit, config, tempDir));
    auto report = pipeline.run();
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, ErrorCode::CommandFailed);
}

TEST(PipelineProfileTest, ParseProfile) {
    EXPECT_EQ(parseProfile("fast").value(), PipelineProfile::Fast);
    EXPECT_EQ(parseProfile("fast-tests").value(), PipelineProfile::FastTests);
    EXPECT_FALSE(parseProfile("slow").has_value());
}
