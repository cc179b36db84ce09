#pragma once

#include <string>
#include <vector>

namespace gitcask {

struct ProcessResult {
    int exitStatus{0};
    std::string output;  // stdout with stderr merged
};

/// Single-quote an argument for /bin/sh ("it's" -> 'it'\''s')
std::string shellQuote(const std::string& arg);

/**
 * @brief Run a shell command and capture its combined output
 *
 * `env` entries ("NAME=value") are prefixed to the command line rather than
 * set in this process. Throws StoreError(SubprocessFailure) only if the
 * process cannot be started; a non-zero exit is reported in the result.
 */
ProcessResult runCommand(const std::string& program,
                         const std::vector<std::string>& args,
                         const std::vector<std::string>& env = {});

}
