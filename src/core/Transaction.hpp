#pragma once

#include <utility>

#include "util/FileLock.hpp"

namespace gitcask {

class Repository;

/**
 * @brief Exclusive hold on a branch, obtained from Repository::beginTransaction
 *
 * Owns the branch lock. Move-only; a transaction still active when its
 * guard is destroyed is finished (lock released, lock file removed) without
 * committing or rolling back.
 */
class Transaction {
public:
    Transaction() = default;
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    Transaction(Transaction&& other) noexcept;
    Transaction& operator=(Transaction&& other) noexcept;

    bool active() const { return repo != nullptr; }
    bool belongsTo(const Repository& r) const { return repo == &r; }

private:
    friend class Repository;
    Transaction(Repository& repo, FileLock lock) : repo(&repo), lock(std::move(lock)) {}

    Repository* repo{nullptr};
    FileLock lock;
};

}
