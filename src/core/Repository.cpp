#include "core/Repository.hpp"

#include "core/GitCommandClient.hpp"

namespace fs = std::filesystem;

namespace gitcask {

Expected<std::unique_ptr<Repository>> Repository::open(const RepositoryOptions& options) {
    if (options.path.empty()) {
        return Error{ErrorCode::InvalidArgs, "Repository path is empty"};
    }
    if (!RefStore::isValidBranchName(options.branch)) {
        return Error{ErrorCode::InvalidArgs, "Invalid branch name: " + options.branch};
    }

    fs::path gitDir = options.bare ? options.path : options.path / Paths::GIT_DIR;
    std::shared_ptr<VersionControlClient> client = options.client;
    if (!client) client = std::make_shared<GitCommandClient>(gitDir);

    std::error_code ec;
    if (!fs::is_directory(gitDir / Paths::OBJECTS, ec)) {
        if (!options.create) {
            return Error{ErrorCode::NotARepository, "Not a valid Git repository: '" + gitDir.string() + "'"};
        }
        fs::create_directories(gitDir, ec);
        if (ec) {
            return Error{ErrorCode::IoError, "Failed to create " + gitDir.string() + ": " + ec.message()};
        }
        try {
            client->init(options.bare);
        } catch (const StoreError& e) {
            return Error{e.code(), std::string("Failed to initialize repository: ") + e.what()};
        }
        if (!fs::is_directory(gitDir / Paths::OBJECTS, ec)) {
            return Error{ErrorCode::NotARepository, "Initialization did not create " + gitDir.string()};
        }
        Logger::instance().info("Initialized repository in " + gitDir.string());
    }

    try {
        std::unique_ptr<Repository> repo(new Repository(gitDir, options, std::move(client)));
        repo->load();
        return std::move(repo);
    } catch (const StoreError& e) {
        return Error{e.code(), e.what()};
    }
}

Repository::Repository(const fs::path& gitDir, const RepositoryOptions& options,
                       std::shared_ptr<VersionControlClient> client)
    : dir(gitDir),
      branchName(options.branch),
      isBare(options.bare),
      vcs(std::move(client)),
      objects(gitDir),
      refStore(gitDir) {
    objects.setVerifyObjects(options.verifyObjects);
}

void Repository::load() {
    auto headId = refStore.readHead(branchName).valueOrThrow();
    if (headId) {
        headCommit = objects.getCommit(*headId).valueOrThrow();
        rootTree = std::make_unique<WorkingTree>(objects, headCommit->treeHash);
    } else {
        headCommit.reset();
        rootTree = std::make_unique<WorkingTree>(objects);
    }
    Logger::instance().debug("Reloaded, head is " + (headCommit ? headCommit->hash : std::string("nil")));
}

void Repository::setBranch(const std::string& branch) {
    if (!RefStore::isValidBranchName(branch)) {
        throw StoreError(ErrorCode::InvalidArgs, "Invalid branch name: " + branch);
    }
    if (inTransaction()) {
        throw StoreError(ErrorCode::InvalidArgs, "Cannot switch branches inside a transaction");
    }
    branchName = branch;
    load();
}

bool Repository::changed() const {
    if (!headCommit) return true;
    auto onDisk = refStore.readHead(branchName).valueOrThrow();
    return !onDisk || *onDisk != headCommit->hash;
}

void Repository::refresh() {
    if (!changed()) return;
    objects.clearCache();
    load();
}

Transaction Repository::beginTransaction() {
    FileLock lock = FileLock::acquire(refStore.lockPath(branchName));
    Transaction tx(*this, std::move(lock));
    ++activeTransactions;
    refresh();
    return tx;
}

void Repository::checkOwner(const Transaction& tx) const {
    if (!tx.active() || !tx.belongsTo(*this)) {
        throw StoreError(ErrorCode::InvalidArgs, "Transaction is not active on this repository");
    }
}

std::optional<CommitObject> Repository::commit(Transaction& tx, const std::string& message,
                                               const std::optional<Signature>& author,
                                               const std::optional<Signature>& committer) {
    checkOwner(tx);
    if (!rootTree->isModified()) return std::nullopt;

    CommitObject c;
    c.author = author ? *author : defaultIdentity().now();
    c.committer = committer ? *committer : c.author;
    c.message = message;
    c.treeHash = rootTree->save(objects);
    if (headCommit) c.parentHashes.push_back(headCommit->hash);

    c.hash = objects.put(ObjectType::Commit, serializeCommit(c));
    refStore.writeHead(branchName, c.hash).valueOrThrow();
    Logger::instance().debug("Committed " + c.hash + " on " + branchName);

    load();
    return c;
}

void Repository::rollback(Transaction& tx) {
    checkOwner(tx);
    objects.clearCache();
    load();
}

void Repository::rollbackAfterFailure(Transaction& tx) noexcept {
    try {
        rollback(tx);
    } catch (const StoreError& e) {
        Logger::instance().error(std::string("Rollback failed (") + errorCodeName(e.code()) + "): " + e.what());
    } catch (const std::exception& e) {
        Logger::instance().error(std::string("Rollback failed: ") + e.what());
    }
}

void Repository::finishTransaction(Transaction& tx) noexcept {
    if (!tx.belongsTo(*this)) return;

    // Unlink while still holding the lock so a waiter woken by the release
    // sees the path gone and reopens instead of keeping the dead inode.
    fs::path lockFile = tx.lock.path();
    std::error_code ec;
    fs::remove(lockFile, ec);
    if (ec) {
        Logger::instance().warn("Could not remove lock file " + lockFile.string() + ": " + ec.message());
    }

    tx.lock.release();
    tx.repo = nullptr;
    --activeTransactions;
}

std::vector<LogEntry> Repository::log(size_t limit, const std::string& start, const std::string& path) {
    return vcs->log(limit, start.empty() ? branchName : start, path);
}

DiffResult Repository::diff(const std::string& from, const std::string& to, const std::string& path) {
    return vcs->diff(from, to, path);
}

Identity Repository::defaultIdentity() {
    return gitcask::defaultIdentity(*vcs);
}

}
