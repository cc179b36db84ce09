#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "core/VersionControlClient.hpp"

namespace gitcask {

/**
 * @brief VersionControlClient backed by the git executable
 *
 * Every call runs "git <subcommand> <args> 2>&1" with GIT_DIR pointing at
 * the repository. The executable is taken from GITCASK_GIT (default "git").
 *
 * Exit status 1 with no output counts as an empty result; any other
 * non-zero status raises StoreError(SubprocessFailure) carrying the command
 * line and its output.
 */
class GitCommandClient : public VersionControlClient {
public:
    explicit GitCommandClient(const std::filesystem::path& gitDir);

    std::vector<LogEntry> log(size_t limit, const std::string& start, const std::string& path) override;
    DiffResult diff(const std::string& from, const std::string& to, const std::string& path) override;
    std::string configGet(const std::string& key) override;
    void init(bool bare) override;

    const std::string& executable() const { return program; }

    /// Parse output of the log format this client requests
    static std::vector<LogEntry> parseLog(const std::string& output);

private:
    std::string run(const std::string& subcommand, const std::vector<std::string>& args);

    std::filesystem::path gitDir;
    std::string program;
};

}
