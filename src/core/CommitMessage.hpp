#pragma once

#include <string>
#include <vector>

namespace hookgate {

/**
 * @brief A commit message split into subject and body
 *
 * Parsing follows what git leaves in the message file:
 *   - lines starting with '#' are comments and ignored
 *   - everything below a "# ---- >8 ----" scissors line is ignored
 *   - leading blank lines are skipped; the first remaining line is the subject
 *   - trailing '\r' is stripped so CRLF files behave like LF files
 */
struct CommitMessage {
    std::string subject;
    std::vector<std::string> body;   // lines after the subject, comments removed
    bool hasSubject{false};

    static CommitMessage parse(const std::string& text);
};

/// Number of UTF-8 code points in @p s (invalid bytes count as one each)
size_t utf8Length(const std::string& s);

}
