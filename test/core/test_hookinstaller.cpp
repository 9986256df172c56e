#include <gtest/gtest.h>
#include <filesystem>
#include "test_utils.hpp"
#include "core/HookConfig.hpp"
#include "core/HookInstaller.hpp"

namespace fs = std::filesystem;

using namespace hookgate;
using namespace hookgate::test::utils;

class HookInstallerTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        initTestRepo(tempDir);
        hooks = tempDir / ".git" / "hooks";
    }

    void TearDown() override {
        removeDir(tempDir);
    }

    fs::path tempDir;
    fs::path hooks;
};

// Test: All four hooks are written and executable
TEST_F(HookInstallerTest, InstallsExecutableShims) {
    auto res = HookInstaller::install(tempDir, InstallOptions{});
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(res.value().installed.size(), 4u);
    EXPECT_TRUE(res.value().skipped.empty());

    for (const auto& hook : HookInstaller::hookNames()) {
        fs::path p = hooks / hook;
        ASSERT_TRUE(fs::exists(p)) << hook;
        auto perms = fs::status(p).permissions();
        EXPECT_NE(perms & fs::perms::owner_exec, fs::perms::none) << hook;
        EXPECT_TRUE(HookInstaller::isShim(p));
        EXPECT_NE(readFile(p).find("exec hookgate " + hook + " \"$@\""), std::string::npos);
    }
}

TEST_F(HookInstallerTest, WritesDefaultConfig) {
    auto res = HookInstaller::install(tempDir, InstallOptions{});
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_TRUE(res.value().configWritten);
    EXPECT_EQ(res.value().configPath, hooks / "hookgate.yaml");

    auto cfg = HookConfig::loadFile(res.value().configPath);
    ASSERT_TRUE(cfg.has_value()) << cfg.error().message;
    EXPECT_EQ(cfg.value().commitRules.maxSubjectLength, 50u);
}

// Test: Shims go where core.hooksPath points
TEST_F(HookInstallerTest, InstallsIntoCoreHooksPath) {
    createFile(tempDir / ".git", "config", "[core]\n\thooksPath = .githooks\n");
    auto res = HookInstaller::install(tempDir, InstallOptions{});
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(res.value().hooksDir, tempDir / ".githooks");
    EXPECT_TRUE(HookInstaller::isShim(tempDir / ".githooks" / "pre-commit"));
    EXPECT_FALSE(fs::exists(hooks / "pre-commit"));
}

TEST_F(HookInstallerTest, KeepsExistingConfig) {
    writeRepoConfig(tempDir, "push:\n  protected_branch: trunk\n");
    auto res = HookInstaller::install(tempDir, InstallOptions{});
    ASSERT_TRUE(res.has_value());
    EXPECT_FALSE(res.value().configWritten);
    EXPECT_NE(readFile(hooks / "hookgate.yaml").find("trunk"), std::string::npos);
}

// Test: Foreign hooks survive unless --force
TEST_F(HookInstallerTest, SkipsForeignHookWithoutForce) {
    createFile(hooks, "pre-push", "#!/bin/sh\necho custom\n");

    auto res = HookInstaller::install(tempDir, InstallOptions{});
    ASSERT_TRUE(res.has_value());
    ASSERT_EQ(res.value().skipped.size(), 1u);
    EXPECT_EQ(res.value().skipped[0], "pre-push");
    EXPECT_EQ(readFile(hooks / "pre-push"), "#!/bin/sh\necho custom\n");

    InstallOptions force;
    force.force = true;
    res = HookInstaller::install(tempDir, force);
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res.value().skipped.empty());
    EXPECT_TRUE(HookInstaller::isShim(hooks / "pre-push"));
}

// Test: Re-running refreshes our own shims
TEST_F(HookInstallerTest, ReinstallRefreshesShims) {
    ASSERT_TRUE(HookInstaller::install(tempDir, InstallOptions{}).has_value());
    InstallOptions opts;
    opts.executable = "/opt/tools/hookgate";
    auto res = HookInstaller::install(tempDir, opts);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value().installed.size(), 4u);
    EXPECT_NE(readFile(hooks / "commit-msg").find("exec /opt/tools/hookgate commit-msg"), std::string::npos);
}

TEST_F(HookInstallerTest, ShimQuotesExecutableWithSpaces) {
    std::string script = HookInstaller::shimScript("pre-commit", "/my tools/hookgate");
    EXPECT_EQ(script.rfind("#!/bin/sh\n", 0), 0u);
    EXPECT_NE(script.find("exec '/my tools/hookgate' pre-commit \"$@\""), std::string::npos);
}
