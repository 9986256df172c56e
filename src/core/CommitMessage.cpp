#include "core/CommitMessage.hpp"

#include <sstream>

#include "core/Constants.hpp"

namespace hookgate {

namespace {

bool isBlank(const std::string& line) {
    return line.find_first_not_of(" \t") == std::string::npos;
}

bool isScissors(const std::string& line) {
    return line.size() > 1 && line[0] == Constants::COMMENT_CHAR &&
           line.find(Constants::SCISSORS_MARKER) != std::string::npos;
}

}

CommitMessage CommitMessage::parse(const std::string& text) {
    CommitMessage msg;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (isScissors(line)) break;
        if (!line.empty() && line[0] == Constants::COMMENT_CHAR) continue;

        if (!msg.hasSubject) {
            if (isBlank(line)) continue;
            msg.subject = line;
            msg.hasSubject = true;
        } else {
            msg.body.push_back(line);
        }
    }
    // Drop trailing blank lines from the body
    while (!msg.body.empty() && isBlank(msg.body.back())) {
        msg.body.pop_back();
    }
    return msg;
}

size_t utf8Length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

}
