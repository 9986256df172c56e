#include "core/HookConfig.hpp"

#include <cstdlib>

#include <yaml-cpp/yaml.h>

#include "core/GitRepository.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace hookgate {

namespace {

template <typename T>
void readKey(const YAML::Node& section, const char* key, T& out) {
    const YAML::Node node = section[key];
    if (node && !node.IsNull()) {
        out = node.as<T>();
    }
}

void readSize(const YAML::Node& section, const char* key, size_t& out) {
    const YAML::Node node = section[key];
    if (!node || node.IsNull()) return;
    long v = node.as<long>();
    if (v < 1) {
        throw YAML::RepresentationException(node.Mark(), std::string(key) + " must be positive");
    }
    out = static_cast<size_t>(v);
}

YAML::Node section(const YAML::Node& root, const char* name) {
    const YAML::Node node = root[name];
    if (node && !node.IsNull() && !node.IsMap()) {
        throw YAML::RepresentationException(node.Mark(), std::string(name) + " must be a mapping");
    }
    return node;
}

void emitList(YAML::Emitter& out, const char* key, const std::vector<std::string>& items) {
    out << YAML::Key << key << YAML::Value << YAML::Flow << YAML::BeginSeq;
    for (const auto& item : items) out << item;
    out << YAML::EndSeq;
}

Expected<HookConfig> fromNode(const YAML::Node& root) {
    HookConfig cfg;
    try {
        if (!root || root.IsNull()) return cfg;
        if (!root.IsMap()) {
            return Error{ErrorCode::ConfigError, "config root must be a mapping"};
        }

        if (auto s = section(root, "quality_gates")) {
            readKey(s, "max_complexity", cfg.qualityGates.maxComplexity);
            readKey(s, "min_coverage", cfg.qualityGates.minCoverage);
            readKey(s, "max_cyclomatic_complexity", cfg.qualityGates.maxCyclomaticComplexity);
        }
        if (auto s = section(root, "commit_rules")) {
            readKey(s, "enforce_conventional_commits", cfg.commitRules.enforceConventionalCommits);
            readSize(s, "max_subject_length", cfg.commitRules.maxSubjectLength);
            readSize(s, "max_body_line_length", cfg.commitRules.maxBodyLineLength);
        }
        if (auto s = section(root, "security")) {
            readKey(s, "check_secrets", cfg.security.checkSecrets);
            readKey(s, "check_unsafe_code", cfg.security.checkUnsafeCode);
            readKey(s, "warn_on_unwrap", cfg.security.warnOnUnwrap);
            readKey(s, "scan_dirs", cfg.security.scanDirs);
            readKey(s, "scan_extensions", cfg.security.scanExtensions);
        }
        if (auto s = section(root, "performance")) {
            readKey(s, "run_benchmarks_on_push", cfg.performance.runBenchmarksOnPush);
            readKey(s, "check_binary_size", cfg.performance.checkBinarySize);
            readKey(s, "max_binary_size_mb", cfg.performance.maxBinarySizeMb);
            readKey(s, "binary_path", cfg.performance.binaryPath);
        }
        if (auto s = section(root, "push")) {
            readKey(s, "protected_branch", cfg.push.protectedBranch);
        }
        if (auto s = section(root, "commands")) {
            readKey(s, "format", cfg.commands.format);
            readKey(s, "format_check", cfg.commands.formatCheck);
            readKey(s, "lint", cfg.commands.lint);
            readKey(s, "test", cfg.commands.test);
            readKey(s, "test_fast", cfg.commands.testFast);
            readKey(s, "release_test", cfg.commands.releaseTest);
            readKey(s, "coverage", cfg.commands.coverage);
            readKey(s, "docs", cfg.commands.docs);
            readKey(s, "bench", cfg.commands.bench);
        }
    } catch (const YAML::Exception& e) {
        return Error{ErrorCode::ConfigError, std::string("invalid config: ") + e.what()};
    }
    return cfg;
}

}

Expected<HookConfig> HookConfig::parse(const std::string& yamlText) {
    YAML::Node root;
    try {
        root = YAML::Load(yamlText);
    } catch (const YAML::Exception& e) {
        return Error{ErrorCode::ConfigError, std::string("invalid config: ") + e.what()};
    }
    return fromNode(root);
}

Expected<HookConfig> HookConfig::loadFile(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Error{ErrorCode::ConfigError, "config file not found: " + path.string()};
    }
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        return Error{ErrorCode::ConfigError, path.string() + ": " + e.what()};
    }
    auto res = fromNode(root);
    if (!res) {
        return Error{ErrorCode::ConfigError, path.string() + ": " + res.error().message};
    }
    return res;
}

fs::path HookConfig::resolvePath(const std::string& explicitPath, const fs::path& root) {
    if (!explicitPath.empty()) return explicitPath;
    const char* env = std::getenv("HOOKGATE_CONFIG");
    if (env && *env) return env;
    if (!root.empty()) {
        std::error_code ec;
        fs::path candidate = GitRepository::hooksDir(root) / Constants::CONFIG_FILE;
        if (fs::is_regular_file(candidate, ec)) return candidate;
    }
    return {};
}

Expected<HookConfig> HookConfig::loadFor(const std::string& explicitPath, const fs::path& root) {
    fs::path path = resolvePath(explicitPath, root);
    if (path.empty()) {
        Logger::instance().debug("no config file, using defaults");
        return defaults();
    }
    Logger::instance().debug("loading config " + path.string());
    return loadFile(path);
}

std::string HookConfig::toYaml() const {
    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "quality_gates" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "max_complexity" << YAML::Value << qualityGates.maxComplexity;
    out << YAML::Key << "min_coverage" << YAML::Value << qualityGates.minCoverage;
    out << YAML::Key << "max_cyclomatic_complexity" << YAML::Value << qualityGates.maxCyclomaticComplexity;
    out << YAML::EndMap;

    out << YAML::Key << "commit_rules" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "enforce_conventional_commits" << YAML::Value << commitRules.enforceConventionalCommits;
    out << YAML::Key << "max_subject_length" << YAML::Value << commitRules.maxSubjectLength;
    out << YAML::Key << "max_body_line_length" << YAML::Value << commitRules.maxBodyLineLength;
    out << YAML::EndMap;

    out << YAML::Key << "security" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "check_secrets" << YAML::Value << security.checkSecrets;
    out << YAML::Key << "check_unsafe_code" << YAML::Value << security.checkUnsafeCode;
    out << YAML::Key << "warn_on_unwrap" << YAML::Value << security.warnOnUnwrap;
    emitList(out, "scan_dirs", security.scanDirs);
    emitList(out, "scan_extensions", security.scanExtensions);
    out << YAML::EndMap;

    out << YAML::Key << "performance" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "run_benchmarks_on_push" << YAML::Value << performance.runBenchmarksOnPush;
    out << YAML::Key << "check_binary_size" << YAML::Value << performance.checkBinarySize;
    out << YAML::Key << "max_binary_size_mb" << YAML::Value << performance.maxBinarySizeMb;
    out << YAML::Key << "binary_path" << YAML::Value << performance.binaryPath;
    out << YAML::EndMap;

    out << YAML::Key << "push" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "protected_branch" << YAML::Value << push.protectedBranch;
    out << YAML::EndMap;

    out << YAML::Key << "commands" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "format" << YAML::Value << commands.format;
    out << YAML::Key << "format_check" << YAML::Value << commands.formatCheck;
    out << YAML::Key << "lint" << YAML::Value << commands.lint;
    out << YAML::Key << "test" << YAML::Value << commands.test;
    out << YAML::Key << "test_fast" << YAML::Value << commands.testFast;
    out << YAML::Key << "release_test" << YAML::Value << commands.releaseTest;
    out << YAML::Key << "coverage" << YAML::Value << commands.coverage;
    out << YAML::Key << "docs" << YAML::Value << commands.docs;
    out << YAML::Key << "bench" << YAML::Value << commands.bench;
    out << YAML::EndMap;

    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

}
