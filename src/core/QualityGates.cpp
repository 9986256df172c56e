#include "core/QualityGates.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <regex>
#include <sstream>

namespace fs = std::filesystem;

namespace hookgate {

std::optional<double> parseCoveragePercent(const std::string& output) {
    static const std::regex percentRe(R"(([0-9]+(\.[0-9]+)?)\s*%)");
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        std::string lower = line;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower.find("coverage") == std::string::npos) continue;
        std::smatch m;
        if (std::regex_search(line, m, percentRe)) {
            return std::stod(m[1].str());
        }
    }
    return std::nullopt;
}

Expected<double> fileSizeMb(const fs::path& path) {
    std::error_code ec;
    auto bytes = fs::file_size(path, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "Cannot stat " + path.string() + ": " + ec.message()};
    }
    return static_cast<double>(bytes) / (1024.0 * 1024.0);
}

std::string commandTool(const std::string& command) {
    auto begin = command.find_first_not_of(" \t");
    if (begin == std::string::npos) return {};
    auto end = command.find_first_of(" \t", begin);
    return command.substr(begin, end == std::string::npos ? std::string::npos : end - begin);
}

std::vector<SecretHit> scanForSecrets(const fs::path& root,
                                      const std::vector<std::string>& dirs,
                                      const std::vector<std::string>& extensions,
                                      size_t maxHits) {
    static const std::regex secretRe("password|secret|key|token");
    std::vector<SecretHit> hits;
    if (maxHits == 0) return hits;

    for (const auto& dir : dirs) {
        fs::path searchRoot = root / dir;
        std::error_code ec;
        if (!fs::is_directory(searchRoot, ec)) continue;

        // Collect first so results come out in a stable order
        std::vector<fs::path> files;
        for (auto it = fs::recursive_directory_iterator(searchRoot, ec);
             it != fs::recursive_directory_iterator();
             it.increment(ec)) {
            if (ec) break;
            const auto& entry = it->path();
            if (!fs::is_regular_file(entry, ec)) continue;
            std::string ext = entry.extension().string();
            if (std::find(extensions.begin(), extensions.end(), ext) == extensions.end()) continue;
            files.push_back(entry);
        }
        std::sort(files.begin(), files.end());

        for (const auto& file : files) {
            std::ifstream in(file);
            std::string line;
            size_t lineNo = 0;
            while (std::getline(in, line)) {
                ++lineNo;
                if (line.find("// ") != std::string::npos) continue;
                if (!std::regex_search(line, secretRe)) continue;
                hits.push_back(SecretHit{fs::relative(file, root, ec), lineNo, line});
                if (hits.size() >= maxHits) return hits;
            }
        }
    }
    return hits;
}

}
