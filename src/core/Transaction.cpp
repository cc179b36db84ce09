#include "core/Transaction.hpp"

#include "core/Repository.hpp"

namespace gitcask {

Transaction::~Transaction() {
    if (repo) repo->finishTransaction(*this);
}

Transaction::Transaction(Transaction&& other) noexcept : repo(other.repo), lock(std::move(other.lock)) {
    other.repo = nullptr;
}

Transaction& Transaction::operator=(Transaction&& other) noexcept {
    if (this != &other) {
        if (repo) repo->finishTransaction(*this);
        repo = other.repo;
        lock = std::move(other.lock);
        other.repo = nullptr;
    }
    return *this;
}

}
