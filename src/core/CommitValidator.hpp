#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "core/Constants.hpp"
#include "util/Expected.hpp"

namespace hookgate {

/// Tunables from the commit_rules config section.
struct CommitRules {
    bool enforceConventionalCommits{true};
    size_t maxSubjectLength{Constants::DEFAULT_MAX_SUBJECT_LENGTH};
    size_t maxBodyLineLength{Constants::DEFAULT_MAX_BODY_LINE_LENGTH};
};

/**
 * @brief Outcome of validating one commit message
 *
 * type/scope/description are filled when the subject has the
 * conventional structure, even if the description is too long.
 */
struct ValidationResult {
    bool valid{false};
    std::string subject;
    std::string type;
    std::string scope;          // without parentheses; empty if absent
    std::string description;
    std::string reason;         // why it was rejected, empty when valid
    std::vector<std::string> warnings;
};

/**
 * @brief Conventional commit checker
 *
 * A message is accepted iff its subject line matches
 *
 *     type(scope)?: description
 *
 * where type is one of the allowed types and the description holds between
 * 1 and maxSubjectLength characters. Body lines over maxBodyLineLength only
 * produce warnings. With enforceConventionalCommits off a bad subject is
 * reported as a warning and the message is accepted.
 *
 * Validation has no side effects; the same input always gives the same result.
 */
class CommitValidator {
public:
    explicit CommitValidator(CommitRules rules = {});

    ValidationResult validate(const std::string& message) const;

    /// Read the message file git passes to commit-msg and validate it
    Expected<ValidationResult> validateFile(const std::filesystem::path& path) const;

    static Expected<std::string> readMessageFile(const std::filesystem::path& path);

    /// Rejection text: allowed types, examples and the offending message
    std::string diagnostic(const ValidationResult& result, const std::string& message) const;

    const CommitRules& rules() const { return rules_; }

    static const std::vector<std::string>& allowedTypes();

private:
    CommitRules rules_;
};

}
