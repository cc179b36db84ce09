#pragma once

#include <functional>
#include <mutex>
#include <string>

namespace gitcask {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/// Parse "debug|info|warn|error" or "0".."3"; unknown values give Info
LogLevel parseLogLevel(const std::string& text);

/**
 * @brief Process-wide logger
 *
 * Level defaults to the GITCASK_LOG environment variable (Info when unset).
 * Messages go to std::cerr unless a sink is installed, which lets an
 * embedding application route them into its own logging.
 */
class Logger {
public:
    using Sink = std::function<void(LogLevel, const std::string&)>;

    static Logger& instance();
    void setLevel(LogLevel level);
    LogLevel level() const;
    bool enabled(LogLevel level) const { return level <= currentLevel; }

    /// Replace the output sink; an empty function restores std::cerr
    void setSink(Sink sink);

    void error(const std::string& msg) const { write(LogLevel::Error, msg); }
    void warn(const std::string& msg) const { write(LogLevel::Warn, msg); }
    void info(const std::string& msg) const { write(LogLevel::Info, msg); }
    void debug(const std::string& msg) const { write(LogLevel::Debug, msg); }

private:
    Logger();
    void write(LogLevel level, const std::string& msg) const;

    LogLevel currentLevel;
    Sink sink;
    mutable std::mutex mtx;
};

}
