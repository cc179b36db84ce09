#include "util/Subprocess.hpp"

#include "util/Expected.hpp"
#include "util/Logger.hpp"

#include <array>
#include <cstdio>
#include <sys/wait.h>

namespace gitcask {

std::string shellQuote(const std::string& arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

ProcessResult runCommand(const std::string& program,
                         const std::vector<std::string>& args,
                         const std::vector<std::string>& env) {
    std::string cmd;
    for (const auto& e : env) {
        auto eq = e.find('=');
        if (eq == std::string::npos) continue;
        cmd += e.substr(0, eq + 1) + shellQuote(e.substr(eq + 1)) + " ";
    }
    cmd += program;
    for (const auto& a : args) {
        cmd += " " + shellQuote(a);
    }
    cmd += " 2>&1";

    Logger::instance().debug(cmd);

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        throw StoreError(ErrorCode::SubprocessFailure, "Failed to start: " + cmd);
    }

    ProcessResult result;
    std::array<char, 4096> buf{};
    size_t n;
    while ((n = std::fread(buf.data(), 1, buf.size(), pipe)) > 0) {
        result.output.append(buf.data(), n);
    }

    int status = pclose(pipe);
    if (status == -1) {
        throw StoreError(ErrorCode::SubprocessFailure, "Failed to wait for: " + cmd);
    }
    result.exitStatus = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
    return result;
}

}
