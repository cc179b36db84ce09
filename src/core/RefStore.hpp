#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "util/Expected.hpp"

namespace gitcask {

/**
 * @brief Branch pointers of a repository
 *
 * A branch head is the loose file <git dir>/refs/heads/<branch> holding a
 * 40-char commit id, or, when that file is absent, a line
 * "<id> refs/heads/<branch>" in <git dir>/packed-refs. Only loose files
 * are ever written.
 */
class RefStore {
public:
    explicit RefStore(const std::filesystem::path& gitDir) : gitDir(gitDir) {}

    /// <git dir>/refs/heads/<branch>
    std::filesystem::path headPath(const std::string& branch) const;
    std::filesystem::path packedRefsPath() const;

    /// Sentinel file a transaction locks: <head path>.lock
    std::filesystem::path lockPath(const std::string& branch) const;

    /// "refs/heads/<branch>"
    static std::string headsRef(const std::string& branch);

    /// Rejects empty names, "..", a leading '/', and a ".lock" suffix
    static bool isValidBranchName(const std::string& branch);

    /**
     * @brief Current commit id of a branch
     * @return The id, std::nullopt when the branch has no head yet,
     *         InvalidArgs for a bad name, CorruptObject for a malformed pointer
     */
    Expected<std::optional<std::string>> readHead(const std::string& branch) const;

    /// Point the branch at `id` (temp file + rename, never a truncated pointer)
    Expected<void> writeHead(const std::string& branch, const std::string& id) const;

private:
    Expected<std::optional<std::string>> readPackedHead(const std::string& branch) const;

    std::filesystem::path gitDir;
};

}
