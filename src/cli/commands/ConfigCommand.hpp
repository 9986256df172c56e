#pragma once

#include "cli/ICommand.hpp"

namespace hookgate {

class ConfigCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "config"; }
    const char* description() const override { return "Show the effective hook configuration"; }
    const char* helpNameLine() const override { return "config -  Print the configuration hooks would use"; }
    const char* helpSynopsis() const override { return "hookgate config [--path]"; }
    const char* helpDescription() const override {
        return "Print where the configuration was loaded from followed by the merged settings "
               "as YAML. Missing keys show their defaults.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return { {"--path", "Print only the config file path (empty when using defaults)."} };
    }
};

}
