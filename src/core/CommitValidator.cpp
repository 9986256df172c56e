#include "core/CommitValidator.hpp"

#include <fstream>
#include <sstream>

#include "core/CommitMessage.hpp"

namespace fs = std::filesystem;

namespace hookgate {

namespace {

struct SubjectParts {
    std::string type;
    std::string scope;
    std::string description;
};

// Splits "type(scope): description" after a known type prefix. The scope is
// greedy: the last "): " that leaves a non-empty description ends it.
bool splitAfterType(const std::string& subject, size_t typeEnd, SubjectParts& parts) {
    if (typeEnd < subject.size() && subject[typeEnd] == '(') {
        size_t pos = subject.rfind("): ");
        while (pos != std::string::npos && pos > typeEnd + 1) {
            if (pos + 3 < subject.size()) {
                parts.scope = subject.substr(typeEnd + 1, pos - typeEnd - 1);
                parts.description = subject.substr(pos + 3);
                return true;
            }
            pos = subject.rfind("): ", pos - 1);
        }
        return false;
    }
    if (subject.compare(typeEnd, 2, ": ") != 0 || typeEnd + 2 >= subject.size()) {
        return false;
    }
    parts.description = subject.substr(typeEnd + 2);
    return true;
}

bool splitSubject(const std::string& subject, SubjectParts& parts) {
    for (const auto& t : CommitValidator::allowedTypes()) {
        if (subject.compare(0, t.size(), t) != 0) continue;
        if (splitAfterType(subject, t.size(), parts)) {
            parts.type = t;
            return true;
        }
    }
    return false;
}

std::string joinTypes() {
    std::string out;
    for (const auto& t : CommitValidator::allowedTypes()) {
        if (!out.empty()) out += ", ";
        out += t;
    }
    return out;
}

}

const std::vector<std::string>& CommitValidator::allowedTypes() {
    static const std::vector<std::string> types{
        "feat", "fix", "docs", "style", "refactor", "test",
        "chore", "perf", "ci", "build", "revert"};
    return types;
}

CommitValidator::CommitValidator(CommitRules rules)
    : rules_(rules) {}

ValidationResult CommitValidator::validate(const std::string& message) const {
    ValidationResult result;
    CommitMessage msg = CommitMessage::parse(message);
    result.subject = msg.subject;

    if (!msg.hasSubject) {
        result.reason = "commit message is empty";
    } else {
        SubjectParts parts;
        if (!splitSubject(msg.subject, parts)) {
            result.reason = "subject does not match 'type(scope): description'";
        } else {
            result.type = parts.type;
            result.scope = parts.scope;
            result.description = parts.description;
            size_t len = utf8Length(result.description);
            if (len > rules_.maxSubjectLength) {
                result.reason = "description is " + std::to_string(len) +
                    " characters, maximum is " + std::to_string(rules_.maxSubjectLength);
            }
        }
    }

    for (size_t i = 0; i < msg.body.size(); ++i) {
        size_t len = utf8Length(msg.body[i]);
        if (len > rules_.maxBodyLineLength) {
            result.warnings.push_back("body line " + std::to_string(i + 1) + " is " +
                std::to_string(len) + " characters (limit " +
                std::to_string(rules_.maxBodyLineLength) + ")");
        }
    }

    if (result.reason.empty()) {
        result.valid = true;
    } else if (!rules_.enforceConventionalCommits) {
        result.warnings.insert(result.warnings.begin(), "not a conventional commit: " + result.reason);
        result.reason.clear();
        result.valid = true;
    }
    return result;
}

Expected<ValidationResult> CommitValidator::validateFile(const fs::path& path) const {
    auto text = readMessageFile(path);
    if (!text) return text.error();
    return validate(text.value());
}

Expected<std::string> CommitValidator::readMessageFile(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Error{ErrorCode::IoError, "commit message file not found: " + path.string()};
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "cannot read commit message file: " + path.string()};
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    return buf.str();
}

std::string CommitValidator::diagnostic(const ValidationResult& result, const std::string& message) const {
    std::ostringstream out;
    out << "Invalid commit message format!\n";
    if (!result.reason.empty()) {
        out << "  (" << result.reason << ")\n";
    }
    out << "\n"
        << "Commit messages must follow conventional commit format:\n"
        << "  type(scope): description\n"
        << "\n"
        << "Types: " << joinTypes() << "\n"
        << "Description: 1-" << rules_.maxSubjectLength << " characters\n"
        << "Example: feat(ice-axe): add terrain breaking functionality\n"
        << "Example: fix(movement): resolve stamina calculation bug\n"
        << "Example: docs(readme): update installation instructions\n"
        << "\n"
        << "Your message: " << message;
    if (message.empty() || message.back() != '\n') out << "\n";
    return out.str();
}

}
