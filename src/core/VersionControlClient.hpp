#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "core/CommitObject.hpp"

namespace gitcask {

/// One commit as reported by history traversal
struct LogEntry {
    std::string id;
    std::vector<std::string> parents;
    std::string tree;
    Signature author;
    Signature committer;
    std::string message;
};

/// Patch between two commits, as produced by the diff tool
struct DiffResult {
    std::string from;
    std::string to;
    std::string patch;
};

/**
 * @brief Operations delegated to an external version control tool
 *
 * The store itself never walks history or computes diffs; those go through
 * this interface so hosts and tests can substitute their own implementation.
 * Failures are raised as StoreError(SubprocessFailure).
 */
class VersionControlClient {
public:
    virtual ~VersionControlClient() = default;

    /**
     * @brief Newest-first history
     * @param limit Maximum number of entries
     * @param start Revision to start from (empty = HEAD)
     * @param path Restrict to commits touching this path (empty = all)
     * @return Empty when the branch has no commits yet
     */
    virtual std::vector<LogEntry> log(size_t limit, const std::string& start, const std::string& path) = 0;

    virtual DiffResult diff(const std::string& from, const std::string& to, const std::string& path) = 0;

    /// Configuration value, empty when unset
    virtual std::string configGet(const std::string& key) = 0;

    /// Create the repository layout
    virtual void init(bool bare) = 0;
};

}
