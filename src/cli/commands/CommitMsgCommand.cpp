#include "cli/commands/CommitMsgCommand.hpp"

#include <iostream>

#include "cli/HookEnvironment.hpp"
#include "core/CommitValidator.hpp"
#include "util/Logger.hpp"

namespace hookgate {

/**
 * @brief Execute 'hookgate commit-msg'
 *
 * Reads the message from the file git passes (or from -m arguments),
 * validates it with the repository's commit rules and prints either a
 * confirmation or the full rejection diagnostic.
 *
 * Works outside a repository too; built-in rules apply then.
 */
Expected<void> CommitMsgCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    std::vector<std::string> messageParts;
    std::string file;

    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "-m") {
            if (i + 1 >= args.size()) {
                return Error{ErrorCode::InvalidArgs, "commit-msg: -m requires a message"};
            }
            messageParts.push_back(args[i + 1]);
            ++i;
        } else if (file.empty() && messageParts.empty()) {
            file = args[i];
        } else {
            return Error{ErrorCode::InvalidArgs, "commit-msg: unexpected argument '" + args[i] + "'"};
        }
    }

    if (file.empty() && messageParts.empty()) {
        return Error{ErrorCode::InvalidArgs, "commit-msg: message file or -m <msg> required"};
    }
    if (!file.empty() && !messageParts.empty()) {
        return Error{ErrorCode::InvalidArgs, "commit-msg: give either a file or -m, not both"};
    }

    std::string message;
    if (!file.empty()) {
        auto text = CommitValidator::readMessageFile(file);
        if (!text) return text.error();
        message = text.value();
    } else {
        for (size_t i = 0; i < messageParts.size(); ++i) {
            if (i > 0) message += "\n\n";
            message += messageParts[i];
        }
    }

    auto envRes = loadHookEnvironment(ctx, false);
    if (!envRes) return envRes.error();

    CommitValidator validator(envRes.value().config.commitRules);
    ValidationResult result = validator.validate(message);

    for (const auto& w : result.warnings) {
        Logger::instance().warn(w);
    }
    if (!result.valid) {
        std::cout << validator.diagnostic(result, message);
        return Error{ErrorCode::InvalidCommitMessage, result.reason};
    }

    std::cout << "Commit message format is valid\n";
    return {};
}

}
