#include "util/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace gitcask {

LogLevel parseLogLevel(const std::string& v) {
    if (v == "debug" || v == "3") return LogLevel::Debug;
    if (v == "info" || v == "2") return LogLevel::Info;
    if (v == "warn" || v == "1") return LogLevel::Warn;
    if (v == "error" || v == "0") return LogLevel::Error;
    return LogLevel::Info;
}

static LogLevel envLogLevel() {
    const char* env = std::getenv("GITCASK_LOG");
    if (!env) return LogLevel::Info;
    return parseLogLevel(env);
}

static const char* levelTag(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "[error] ";
        case LogLevel::Warn: return "[warn ] ";
        case LogLevel::Info: return "[info ] ";
        case LogLevel::Debug: return "[debug] ";
    }
    return "";
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::Logger() : currentLevel(envLogLevel()) {}

void Logger::setLevel(LogLevel level) { currentLevel = level; }
LogLevel Logger::level() const { return currentLevel; }

void Logger::setSink(Sink s) {
    std::scoped_lock lock(mtx);
    sink = std::move(s);
}

void Logger::write(LogLevel level, const std::string& msg) const {
    if (!enabled(level)) return;
    std::scoped_lock lock(mtx);
    if (sink) {
        sink(level, msg);
        return;
    }
    std::cerr << levelTag(level) << "gitcask: " << msg << "\n";
}

}
