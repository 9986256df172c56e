#pragma once

#include <string>

namespace hookgate {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/**
 * @brief Process-wide leveled logger
 *
 * The threshold is read once from HOOKGATE_LOG ("error", "warn", "info",
 * "debug" or 0-3) and defaults to info. Errors and warnings go to stderr,
 * info and debug to stdout.
 */
class Logger {
public:
    static Logger& instance();
    void setLevel(LogLevel level);
    LogLevel level() const;
    void error(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void info(const std::string& msg) const;
    void debug(const std::string& msg) const;

    /// Parse a level name or digit; unknown values yield the fallback.
    static LogLevel parseLevel(const std::string& value, LogLevel fallback);

private:
    Logger();
    LogLevel currentLevel;
};

}
