#include "core/GitRepository.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

#include "core/Constants.hpp"

namespace fs = std::filesystem;

namespace hookgate {

namespace {

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Value of core.hooksPath in a git config file; the last assignment wins.
std::string readHooksPath(const fs::path& configFile) {
    std::ifstream in(configFile);
    std::string line;
    std::string section;
    std::string value;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;
        if (line[0] == '[') {
            size_t close = line.find(']');
            section = lower(trim(line.substr(1, close == std::string::npos ? std::string::npos : close - 1)));
            continue;
        }
        if (section != "core") continue;
        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;
        if (lower(trim(line.substr(0, eq))) != "hookspath") continue;
        value = trim(line.substr(eq + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
    }
    return value;
}

}

Expected<fs::path> GitRepository::discoverRoot(const fs::path& start) {
    std::error_code ec;
    fs::path cur = fs::absolute(start, ec);
    if (ec) return Error{ErrorCode::IoError, "Cannot resolve " + start.string() + ": " + ec.message()};
    cur = cur.lexically_normal();
    if (!cur.has_filename() && cur != cur.root_path()) cur = cur.parent_path();
    while (true) {
        fs::path marker = cur / Constants::GIT_DIR;
        if (fs::is_directory(marker, ec) || fs::is_regular_file(marker, ec)) {
            return cur;
        }
        if (!cur.has_parent_path() || cur == cur.parent_path()) {
            return Error{ErrorCode::NotARepository, "Not in a git repository"};
        }
        cur = cur.parent_path();
    }
}

fs::path GitRepository::gitDir(const fs::path& root) {
    fs::path marker = root / Constants::GIT_DIR;
    std::error_code ec;
    if (!fs::is_regular_file(marker, ec)) {
        return marker;
    }
    std::ifstream in(marker);
    std::string line;
    std::getline(in, line);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    const std::string prefix = "gitdir: ";
    if (line.rfind(prefix, 0) != 0) {
        return marker;
    }
    fs::path target = line.substr(prefix.size());
    if (target.is_relative()) target = root / target;
    return target.lexically_normal();
}

fs::path GitRepository::commonDir(const fs::path& root) {
    fs::path dir = gitDir(root);
    std::ifstream in(dir / "commondir");
    std::string line;
    if (!in || !std::getline(in, line)) return dir;
    line = trim(line);
    if (line.empty()) return dir;
    fs::path common = line;
    if (common.is_relative()) common = dir / common;
    return common.lexically_normal();
}

fs::path GitRepository::configuredHooksPath(const fs::path& root) {
    std::string value = readHooksPath(commonDir(root) / "config");
    if (value.empty()) return {};
    if (value.rfind("~/", 0) == 0) {
        const char* home = std::getenv("HOME");
        if (home && *home) value = std::string(home) + value.substr(1);
    }
    fs::path path = value;
    if (path.is_relative()) path = root / path;
    return path.lexically_normal();
}

fs::path GitRepository::hooksDir(const fs::path& root) {
    fs::path configured = configuredHooksPath(root);
    if (!configured.empty()) return configured;
    return commonDir(root) / Constants::HOOKS_DIR;
}

Expected<std::string> GitRepository::currentBranch(const fs::path& root) {
    fs::path headPath = gitDir(root) / "HEAD";
    std::ifstream headFile(headPath);
    if (!headFile) {
        return Error{ErrorCode::IoError, "Failed to read " + headPath.string()};
    }
    std::string headContent;
    std::getline(headFile, headContent);
    if (!headContent.empty() && headContent.back() == '\r') headContent.pop_back();

    const std::string prefix = "ref: refs/heads/";
    if (headContent.rfind(prefix, 0) == 0) {
        return headContent.substr(prefix.size());
    }
    // Detached HEAD holds a commit hash
    return std::string("HEAD");
}

}
