#pragma once

#include <cstddef>
#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "core/CommitObject.hpp"
#include "core/Identity.hpp"
#include "core/ObjectStore.hpp"
#include "core/RefStore.hpp"
#include "core/RepositoryOptions.hpp"
#include "core/Transaction.hpp"
#include "core/VersionControlClient.hpp"
#include "core/WorkingTree.hpp"
#include "util/Expected.hpp"
#include "util/Logger.hpp"

namespace gitcask {

/**
 * @brief A git repository opened on one branch
 *
 * Holds the object store, the branch pointer, the head commit and an
 * in-memory working tree loaded from it. Changes to the working tree are
 * persisted by commit(), which writes the new objects, a commit record
 * whose parent is the current head, and then moves the branch pointer.
 *
 * Writers serialize through an exclusive flock on
 * <git dir>/refs/heads/<branch>.lock held by a Transaction:
 *
 *   auto tx = repo->beginTransaction();  // lock, reload if the head moved
 *   repo->root().write("a/b", "data");
 *   repo->commit(tx, "message");         // no-op if nothing was modified
 *   // tx going out of scope releases the lock
 *
 * or, with rollback on any exception:
 *
 *   repo->transaction("message", [&] { repo->root().write("a/b", "data"); });
 *
 * Transactions do not nest: beginning a second one on the same branch
 * while one is held blocks forever. Lock acquisition has no timeout.
 * A Repository is not synchronized; hosts sharing one across threads
 * serialize access themselves.
 */
class Repository {
public:
    /**
     * @brief Open (and with options.create, bootstrap) a repository
     * @return NotARepository when objects/ is missing and create is off
     */
    static Expected<std::unique_ptr<Repository>> open(const RepositoryOptions& options);

    Repository(const Repository&) = delete;
    Repository& operator=(const Repository&) = delete;

    const std::filesystem::path& gitDir() const { return dir; }
    const std::string& branch() const { return branchName; }
    bool bare() const { return isBare; }

    ObjectStore& store() { return objects; }
    const RefStore& refs() const { return refStore; }
    VersionControlClient& client() { return *vcs; }

    /// Commit the branch pointed at when last loaded (std::nullopt on an empty branch)
    const std::optional<CommitObject>& head() const { return headCommit; }

    /// Working tree of the loaded head
    WorkingTree& root() { return *rootTree; }

    /// Switch branches and reload; pending working-tree changes are dropped
    void setBranch(const std::string& branch);

    /// True when nothing is loaded or the branch pointer on disk has moved
    bool changed() const;

    /// Drop the cache and reload, only if changed()
    void refresh();

    bool inTransaction() const { return activeTransactions > 0; }

    /**
     * @brief Lock the branch and bring the loaded state up to date
     *
     * Blocks until the lock is available. Throws StoreError(LockError) if
     * the lock file cannot be opened or locked.
     */
    Transaction beginTransaction();

    /**
     * @brief Persist the working tree as a new commit on the branch
     * @param author Defaults to defaultIdentity() stamped with the current time
     * @param committer Defaults to the author
     * @return The new commit, or std::nullopt when the tree was not modified
     *
     * Throws StoreError; the branch pointer is only moved once every object
     * has been written.
     */
    std::optional<CommitObject> commit(Transaction& tx, const std::string& message,
                                       const std::optional<Signature>& author = std::nullopt,
                                       const std::optional<Signature>& committer = std::nullopt);

    /// Drop cached objects and working-tree changes, reload from disk
    void rollback(Transaction& tx);

    /// Release the lock and remove the lock file; a failed removal is only logged
    void finishTransaction(Transaction& tx) noexcept;

    /**
     * @brief Run `fn` inside a transaction and commit its changes
     *
     * Any exception from `fn` or from the commit rolls back and is rethrown.
     * The lock is released on every path. Returns what `fn` returns.
     */
    template <typename Fn>
    std::invoke_result_t<Fn&> transaction(const std::string& message, Fn&& fn) {
        Transaction tx = beginTransaction();
        try {
            if constexpr (std::is_void_v<std::invoke_result_t<Fn&>>) {
                fn();
                commit(tx, message);
            } else {
                auto result = fn();
                commit(tx, message);
                return result;
            }
        } catch (...) {
            rollbackAfterFailure(tx);
            throw;
        }
    }

    /// Newest-first history of `start` (the current branch when empty)
    std::vector<LogEntry> log(size_t limit = 10, const std::string& start = "", const std::string& path = "");

    DiffResult diff(const std::string& from, const std::string& to, const std::string& path = "");

    Identity defaultIdentity();

private:
    Repository(const std::filesystem::path& gitDir, const RepositoryOptions& options,
               std::shared_ptr<VersionControlClient> client);

    void load();
    void checkOwner(const Transaction& tx) const;
    void rollbackAfterFailure(Transaction& tx) noexcept;

    std::filesystem::path dir;
    std::string branchName;
    bool isBare;
    std::shared_ptr<VersionControlClient> vcs;
    ObjectStore objects;
    RefStore refStore;
    std::optional<CommitObject> headCommit;
    std::unique_ptr<WorkingTree> rootTree;
    int activeTransactions{0};
};

}
