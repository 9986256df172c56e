#include <gtest/gtest.h>
#include <filesystem>
#include <string>
#include "test_utils.hpp"
#include "core/CommitValidator.hpp"

namespace fs = std::filesystem;

using namespace hookgate;
using namespace hookgate::test::utils;

class CommitValidatorTest : public ::testing::Test {
protected:
    CommitValidator validator;
};

// Test: Documented accept examples
TEST_F(CommitValidatorTest, AcceptsScopedFeature) {
    auto r = validator.validate("feat(ice-axe): add terrain breaking functionality");
    EXPECT_TRUE(r.valid) << r.reason;
    EXPECT_EQ(r.type, "feat");
    EXPECT_EQ(r.scope, "ice-axe");
    EXPECT_EQ(r.description, "add terrain breaking functionality");
}

TEST_F(CommitValidatorTest, AcceptsScopedFix) {
    auto r = validator.validate("fix(movement): resolve stamina calculation bug\n");
    EXPECT_TRUE(r.valid) << r.reason;
    EXPECT_EQ(r.type, "fix");
    EXPECT_EQ(r.scope, "movement");
}

TEST_F(CommitValidatorTest, AcceptsWithoutScope) {
    auto r = validator.validate("docs: update installation instructions");
    EXPECT_TRUE(r.valid) << r.reason;
    EXPECT_EQ(r.scope, "");
}

// Test: Every type in the taxonomy is accepted
TEST_F(CommitValidatorTest, AcceptsEveryAllowedType) {
    ASSERT_EQ(CommitValidator::allowedTypes().size(), 11u);
    for (const auto& type : CommitValidator::allowedTypes()) {
        EXPECT_TRUE(validator.validate(type + ": do something").valid) << type;
    }
}

// Test: Documented reject examples
TEST_F(CommitValidatorTest, RejectsMissingType) {
    auto r = validator.validate("update stuff");
    EXPECT_FALSE(r.valid);
    EXPECT_FALSE(r.reason.empty());
}

TEST_F(CommitValidatorTest, RejectsUnknownType) {
    EXPECT_FALSE(validator.validate("feature: add new level").valid);
    EXPECT_FALSE(validator.validate("Feat: add new level").valid);
}

TEST_F(CommitValidatorTest, RejectsMissingColonSpace) {
    EXPECT_FALSE(validator.validate("feat:add new level").valid);
    EXPECT_FALSE(validator.validate("feat add new level").valid);
    EXPECT_FALSE(validator.validate("feat(ui) add new level").valid);
}

TEST_F(CommitValidatorTest, RejectsEmptyDescription) {
    EXPECT_FALSE(validator.validate("feat: ").valid);
    EXPECT_FALSE(validator.validate("feat(ui): ").valid);
}

TEST_F(CommitValidatorTest, RejectsEmptyScope) {
    EXPECT_FALSE(validator.validate("feat(): add level").valid);
}

// Test: Description bound is 1..50 characters inclusive
TEST_F(CommitValidatorTest, DescriptionLengthBoundary) {
    std::string fifty(50, 'a');
    std::string fiftyOne(51, 'a');
    EXPECT_TRUE(validator.validate("chore: " + fifty).valid);
    EXPECT_TRUE(validator.validate("chore: a").valid);

    auto r = validator.validate("chore: " + fiftyOne);
    EXPECT_FALSE(r.valid);
    EXPECT_NE(r.reason.find("51"), std::string::npos);
}

// Test: Length counts characters, not bytes
TEST_F(CommitValidatorTest, DescriptionLengthCountsUtf8Characters) {
    std::string word;
    for (int i = 0; i < 25; ++i) word += "\xC3\xA9";  // 25 x U+00E9, 50 bytes
    EXPECT_TRUE(validator.validate("docs: " + word + word).valid);   // 50 chars
    EXPECT_FALSE(validator.validate("docs: " + word + word + "x").valid);
}

// Test: The scope runs to the last "): " that leaves a description
TEST_F(CommitValidatorTest, ScopeTakesLastSeparator) {
    std::string middle(60, 'm');
    auto r = validator.validate("feat(a): " + middle + " (b): z");
    EXPECT_TRUE(r.valid) << r.reason;
    EXPECT_EQ(r.scope, "a): " + middle + " (b");
    EXPECT_EQ(r.description, "z");

    auto trailing = validator.validate("fix(a): b): ");
    EXPECT_TRUE(trailing.valid) << trailing.reason;
    EXPECT_EQ(trailing.scope, "a");
    EXPECT_EQ(trailing.description, "b): ");
}

// Test: Very long subjects are rejected, not crashed on
TEST_F(CommitValidatorTest, VeryLongSubject) {
    std::string huge(200000, 'a');
    auto r = validator.validate("feat: " + huge);
    EXPECT_FALSE(r.valid);
    EXPECT_EQ(r.description.size(), huge.size());
    EXPECT_NE(r.reason.find("200000"), std::string::npos);

    auto scoped = validator.validate("feat(" + huge + "): x");
    EXPECT_TRUE(scoped.valid) << scoped.reason;
    EXPECT_EQ(scoped.scope, huge);

    EXPECT_FALSE(validator.validate("update " + huge).valid);

    CommitRules rules;
    rules.enforceConventionalCommits = false;
    CommitValidator lenient(rules);
    auto l = lenient.validate("feat: " + huge);
    EXPECT_TRUE(l.valid);
    ASSERT_FALSE(l.warnings.empty());
    EXPECT_NE(l.warnings[0].find("not a conventional commit"), std::string::npos);
}

// Test: Only the subject decides; comments and body are ignored
TEST_F(CommitValidatorTest, SkipsCommentsAndLeadingBlankLines) {
    std::string msg =
        "\n"
        "# Please enter the commit message\n"
        "perf(render): batch terrain draw calls\n"
        "\n"
        "Longer explanation here.\n"
        "# On branch main\n";
    auto r = validator.validate(msg);
    EXPECT_TRUE(r.valid) << r.reason;
    EXPECT_EQ(r.subject, "perf(render): batch terrain draw calls");
}

TEST_F(CommitValidatorTest, HandlesCrlf) {
    EXPECT_TRUE(validator.validate("test(core): cover edge cases\r\n\r\nbody\r\n").valid);
}

TEST_F(CommitValidatorTest, RejectsEmptyMessage) {
    auto r = validator.validate("# only a comment\n\n");
    EXPECT_FALSE(r.valid);
    EXPECT_EQ(r.reason, "commit message is empty");
    EXPECT_FALSE(validator.validate("").valid);
}

// Test: Subject must be the first line, not any line
TEST_F(CommitValidatorTest, ConventionalBodyDoesNotRescueBadSubject) {
    EXPECT_FALSE(validator.validate("update stuff\n\nfix: real change").valid);
}

// Test: Same message, same answer
TEST_F(CommitValidatorTest, ValidationIsIdempotent) {
    const std::string good = "refactor(ai): split planner";
    const std::string bad = "wip";
    auto a = validator.validate(good);
    auto b = validator.validate(good);
    EXPECT_EQ(a.valid, b.valid);
    EXPECT_EQ(a.description, b.description);
    EXPECT_EQ(validator.validate(bad).valid, validator.validate(bad).valid);
    EXPECT_EQ(validator.validate(bad).reason, validator.validate(bad).reason);
}

// Test: Long body lines warn but never reject
TEST_F(CommitValidatorTest, LongBodyLineWarns) {
    std::string msg = "fix: trim body\n\n" + std::string(80, 'x') + "\nshort line\n";
    auto r = validator.validate(msg);
    EXPECT_TRUE(r.valid);
    ASSERT_EQ(r.warnings.size(), 1u);
    EXPECT_NE(r.warnings[0].find("80"), std::string::npos);
}

// Test: Rules from configuration
TEST_F(CommitValidatorTest, CustomSubjectLength) {
    CommitRules rules;
    rules.maxSubjectLength = 10;
    CommitValidator strict(rules);
    EXPECT_TRUE(strict.validate("ci: 0123456789").valid);
    EXPECT_FALSE(strict.validate("ci: 0123456789a").valid);
}

TEST_F(CommitValidatorTest, EnforcementDisabledOnlyWarns) {
    CommitRules rules;
    rules.enforceConventionalCommits = false;
    CommitValidator lenient(rules);
    auto r = lenient.validate("update stuff");
    EXPECT_TRUE(r.valid);
    EXPECT_TRUE(r.reason.empty());
    ASSERT_FALSE(r.warnings.empty());
    EXPECT_NE(r.warnings[0].find("not a conventional commit"), std::string::npos);
}

// Test: Diagnostic lists types and examples
TEST_F(CommitValidatorTest, DiagnosticListsTypesAndExamples) {
    const std::string msg = "update stuff";
    auto r = validator.validate(msg);
    std::string text = validator.diagnostic(r, msg);
    EXPECT_NE(text.find("Invalid commit message format!"), std::string::npos);
    EXPECT_NE(text.find("Types: feat, fix, docs, style, refactor, test, chore, perf, ci, build, revert"),
              std::string::npos);
    EXPECT_NE(text.find("feat(ice-axe): add terrain breaking functionality"), std::string::npos);
    EXPECT_NE(text.find("Your message: update stuff"), std::string::npos);
}

// Test: Reading the message file git hands to commit-msg
TEST_F(CommitValidatorTest, ValidateFile) {
    fs::path dir = createTempDir();
    fs::path file = createFile(dir, "COMMIT_EDITMSG", "build(cmake): require C++17\n");
    auto r = validator.validateFile(file);
    ASSERT_TRUE(r.has_value()) << r.error().message;
    EXPECT_TRUE(r.value().valid);

    auto missing = validator.validateFile(dir / "nope");
    EXPECT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::IoError);
    removeDir(dir);
}
