#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "core/Constants.hpp"

namespace gitcask {

class VersionControlClient;

/**
 * @brief How to open a repository
 *
 *   path          working directory, or the repository itself when bare
 *   branch        branch whose head the repository tracks
 *   bare          false: the repository lives in <path>/.git
 *   create        run client->init(bare) when objects/ is missing
 *   verifyObjects re-hash decoded loose objects against their id
 *   client        history/diff/config provider (GitCommandClient if null)
 */
struct RepositoryOptions {
    std::filesystem::path path;
    std::string branch{Paths::DEFAULT_BRANCH};
    bool bare{false};
    bool create{false};
    bool verifyObjects{true};
    std::shared_ptr<VersionControlClient> client;
};

}
