#include <gtest/gtest.h>
#include <filesystem>
#include "test_utils.hpp"
#include "cli/commands/InstallCommand.hpp"

namespace fs = std::filesystem;

using namespace hookgate;
using namespace hookgate::test::utils;

class InstallCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        originalCwd = getCwd();
        setCwd(tempDir);
    }

    void TearDown() override {
        setCwd(originalCwd);
        removeDir(tempDir);
    }

    fs::path tempDir;
    fs::path originalCwd;
    AppContext ctx;
    InstallCommand cmd;
};

TEST_F(InstallCommandTest, InstallsFromSubdirectory) {
    initTestRepo(tempDir);
    fs::create_directories(tempDir / "src");
    setCwd(tempDir / "src");

    testing::internal::CaptureStdout();
    auto result = cmd.execute(ctx, {"--exec", "/usr/local/bin/hookgate"});
    std::string out = testing::internal::GetCapturedStdout();
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_TRUE(fs::exists(tempDir / ".git" / "hooks" / "commit-msg"));
    EXPECT_TRUE(fs::exists(tempDir / ".git" / "hooks" / "hookgate.yaml"));
    EXPECT_NE(out.find("commit-msg"), std::string::npos);
    EXPECT_NE(out.find("(created)"), std::string::npos);
}

TEST_F(InstallCommandTest, RejectsUnknownFlag) {
    initTestRepo(tempDir);
    auto result = cmd.execute(ctx, {"--everything"});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgs);
}
