#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "test_utils.hpp"
#include "core/Repository.hpp"
#include "util/FileLock.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

using namespace gitcask;
using namespace gitcask::test::utils;

class RepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        gitDir = tempDir / ".git";
        client = std::make_shared<FakeClient>(gitDir);
        client->config["user.name"] = "Config User";
        client->config["user.email"] = "config@example.com";
        unsetenv("GIT_AUTHOR_NAME");
        unsetenv("GIT_AUTHOR_EMAIL");
    }

    void TearDown() override {
        unsetenv("GIT_AUTHOR_NAME");
        unsetenv("GIT_AUTHOR_EMAIL");
        removeDir(tempDir);
    }

    std::unique_ptr<Repository> openRepo(bool create = true) {
        RepositoryOptions options;
        options.path = tempDir;
        options.create = create;
        options.client = client;
        auto result = Repository::open(options);
        if (!result) throw std::runtime_error(result.error().message);
        return std::move(result.value());
    }

    static std::string commitFile(Repository& repo, const std::string& path,
                                  const std::string& content, const std::string& message) {
        Transaction tx = repo.beginTransaction();
        repo.root().write(path, content);
        auto c = repo.commit(tx, message);
        return c ? c->hash : "";
    }

    fs::path tempDir;
    fs::path gitDir;
    std::shared_ptr<FakeClient> client;
};

// Test: A missing repository is reported without running init
TEST_F(RepositoryTest, OpenMissing) {
    RepositoryOptions options;
    options.path = tempDir;
    options.client = client;
    auto result = Repository::open(options);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NotARepository);
    EXPECT_NE(result.error().message.find("Not a valid Git repository"), std::string::npos);
    EXPECT_EQ(client->initCalls, 0);
}

// Test: Bad options are rejected up front
TEST_F(RepositoryTest, OpenInvalidOptions) {
    RepositoryOptions options;
    options.client = client;
    EXPECT_EQ(Repository::open(options).error().code, ErrorCode::InvalidArgs);

    options.path = tempDir;
    options.branch = "bad..name";
    EXPECT_EQ(Repository::open(options).error().code, ErrorCode::InvalidArgs);
}

// Test: create initializes a non-bare repository under .git
TEST_F(RepositoryTest, CreateNonBare) {
    auto repo = openRepo();
    EXPECT_EQ(client->initCalls, 1);
    EXPECT_FALSE(client->lastInitBare);
    EXPECT_EQ(repo->gitDir(), gitDir);
    EXPECT_EQ(repo->branch(), "master");
    EXPECT_FALSE(repo->bare());
    EXPECT_TRUE(fs::is_directory(gitDir / "objects"));

    // Opening again finds the existing layout
    auto again = openRepo();
    EXPECT_EQ(client->initCalls, 1);
}

// Test: create initializes a bare repository at the path itself
TEST_F(RepositoryTest, CreateBare) {
    fs::path barePath = tempDir / "store.git";
    auto bareClient = std::make_shared<FakeClient>(barePath);
    RepositoryOptions options;
    options.path = barePath;
    options.bare = true;
    options.create = true;
    options.client = bareClient;

    auto result = Repository::open(options);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_TRUE(bareClient->lastInitBare);
    EXPECT_EQ(result.value()->gitDir(), barePath);
    EXPECT_TRUE(result.value()->bare());
}

// Test: An empty repository has no head and commits nothing when untouched
TEST_F(RepositoryTest, EmptyRepository) {
    auto repo = openRepo();
    EXPECT_FALSE(repo->head().has_value());
    EXPECT_TRUE(repo->root().list().empty());
    EXPECT_TRUE(repo->changed());

    Transaction tx = repo->beginTransaction();
    EXPECT_TRUE(repo->inTransaction());
    EXPECT_FALSE(repo->commit(tx, "nothing").has_value());
    EXPECT_FALSE(fs::exists(gitDir / "refs" / "heads" / "master"));

    repo->root().write("a", "b");
    auto c = repo->commit(tx, "init");
    ASSERT_TRUE(c.has_value());
    auto onDisk = repo->refs().readHead("master");
    ASSERT_TRUE(onDisk.has_value());
    EXPECT_EQ(onDisk.value().value_or(""), c->hash);
    EXPECT_EQ(repo->root().read("a").value_or(""), "b");
    EXPECT_EQ(repo->root().list(), (std::vector<std::string>{"a"}));
}

// Test: Commits chain to the previous head and move the branch pointer
TEST_F(RepositoryTest, CommitChain) {
    auto repo = openRepo();
    std::string first = commitFile(*repo, "notes/a.txt", "one", "First");
    ASSERT_EQ(first.size(), 40u);
    ASSERT_TRUE(repo->head().has_value());
    EXPECT_EQ(repo->head()->hash, first);
    EXPECT_TRUE(repo->head()->parentHashes.empty());
    EXPECT_EQ(readFile(gitDir / "refs" / "heads" / "master"), first);
    EXPECT_FALSE(repo->changed());

    std::string second = commitFile(*repo, "notes/b.txt", "two", "Second");
    ASSERT_EQ(repo->head()->parentHashes.size(), 1u);
    EXPECT_EQ(repo->head()->parentHashes[0], first);
    EXPECT_EQ(repo->head()->message, "Second");

    auto stored = repo->store().getCommit(second);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored.value().author.name, "Config User");
    EXPECT_EQ(stored.value().author.email, "config@example.com");
    EXPECT_EQ(stored.value().committer.name, "Config User");

    auto fresh = openRepo();
    EXPECT_EQ(fresh->root().read("notes/a.txt").value_or(""), "one");
    EXPECT_EQ(fresh->root().read("notes/b.txt").value_or(""), "two");
}

// Test: An explicit author is also the committer unless one is given
TEST_F(RepositoryTest, ExplicitSignatures) {
    auto repo = openRepo();
    Signature author{"Ada", "ada@example.com", 1700000000, "+0100"};
    Signature committer{"Bot", "bot@example.com", 1700000500, "+0000"};

    Transaction tx = repo->beginTransaction();
    repo->root().write("x", "1");
    auto c1 = repo->commit(tx, "by ada", author);
    ASSERT_TRUE(c1.has_value());
    EXPECT_EQ(c1->committer.name, "Ada");
    EXPECT_EQ(c1->committer.timestamp, 1700000000);

    repo->root().write("x", "2");
    auto c2 = repo->commit(tx, "by bot", author, committer);
    ASSERT_TRUE(c2.has_value());
    EXPECT_EQ(c2->author.name, "Ada");
    EXPECT_EQ(c2->committer.name, "Bot");
    EXPECT_EQ(repo->store().getCommit(c2->hash).value().committer.timezone, "+0000");
}

// Test: The block form commits on success and rolls back on an exception
TEST_F(RepositoryTest, TransactionBlock) {
    auto repo = openRepo();
    int value = repo->transaction("add", [&] {
        repo->root().write("kept", "yes");
        return 42;
    });
    EXPECT_EQ(value, 42);
    ASSERT_TRUE(repo->head().has_value());
    std::string head = repo->head()->hash;

    EXPECT_THROW(repo->transaction("discarded", [&] {
        repo->root().write("kept", "overwritten");
        repo->root().write("extra", "never stored");
        throw std::runtime_error("abort");
    }), std::runtime_error);

    EXPECT_EQ(repo->head()->hash, head);
    EXPECT_EQ(repo->root().read("kept").value_or(""), "yes");
    EXPECT_FALSE(repo->root().contains("extra"));
    EXPECT_FALSE(repo->inTransaction());
    EXPECT_FALSE(fs::exists(repo->refs().lockPath("master")));
}

// Test: A failed pointer update leaves the branch where it was
TEST_F(RepositoryTest, FailedCommitIsAtomic) {
    auto repo = openRepo();
    std::string head = commitFile(*repo, "file", "v1", "v1");
    fs::create_directories(gitDir / "refs" / "heads" / "master.tmp");

    try {
        repo->transaction("v2", [&] { repo->root().write("file", "v2"); });
        FAIL() << "expected StoreError";
    } catch (const StoreError& e) {
        EXPECT_EQ(e.code(), ErrorCode::IoError);
    }

    EXPECT_EQ(readFile(gitDir / "refs" / "heads" / "master"), head);
    EXPECT_EQ(repo->head()->hash, head);
    EXPECT_EQ(repo->root().read("file").value_or(""), "v1");
    EXPECT_FALSE(repo->inTransaction());
    EXPECT_FALSE(fs::exists(repo->refs().lockPath("master")));
}

// Test: explicit rollback discards working-tree changes
TEST_F(RepositoryTest, Rollback) {
    auto repo = openRepo();
    commitFile(*repo, "a", "1", "one");

    Transaction tx = repo->beginTransaction();
    repo->root().write("a", "changed");
    repo->rollback(tx);
    EXPECT_EQ(repo->root().read("a").value_or(""), "1");
    EXPECT_FALSE(repo->root().isModified());
    EXPECT_FALSE(repo->commit(tx, "nothing left").has_value());
}

// Test: A rollback that cannot reload is logged and the block's error wins
TEST_F(RepositoryTest, FailedRollbackIsLogged) {
    auto repo = openRepo();
    commitFile(*repo, "a", "1", "one");

    std::vector<std::string> errors;
    Logger::instance().setSink([&](LogLevel level, const std::string& msg) {
        if (level == LogLevel::Error) errors.push_back(msg);
    });
    try {
        repo->transaction("clobber", [&] {
            createFile(gitDir / "refs" / "heads", "master", "not-a-commit-id\n");
            throw std::runtime_error("block failed");
        });
        ADD_FAILURE() << "expected runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "block failed");
    }
    Logger::instance().setSink(nullptr);

    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("Rollback failed (corrupt-object)"), std::string::npos);
    EXPECT_FALSE(repo->inTransaction());
}

// Test: A second handle sees the other's commits when it begins a transaction
TEST_F(RepositoryTest, StaleHeadIsReloaded) {
    auto a = openRepo();
    auto b = openRepo();

    std::string first = commitFile(*a, "from-a", "a", "by a");
    EXPECT_TRUE(b->changed());
    EXPECT_FALSE(b->head().has_value());

    std::string second = commitFile(*b, "from-b", "b", "by b");
    ASSERT_TRUE(b->head().has_value());
    ASSERT_EQ(b->head()->parentHashes.size(), 1u);
    EXPECT_EQ(b->head()->parentHashes[0], first);
    EXPECT_TRUE(b->root().contains("from-a"));

    EXPECT_TRUE(a->changed());
    a->refresh();
    EXPECT_FALSE(a->changed());
    EXPECT_EQ(a->head()->hash, second);
}

// Test: The branch lock is held for the transaction and its file removed afterwards
TEST_F(RepositoryTest, LockExclusion) {
    auto repo = openRepo();
    fs::path lockFile = repo->refs().lockPath("master");
    {
        Transaction tx = repo->beginTransaction();
        EXPECT_TRUE(fs::exists(lockFile));
        FileLock other = FileLock::tryAcquire(lockFile);
        EXPECT_FALSE(other.locked());
    }
    EXPECT_FALSE(fs::exists(lockFile));
    EXPECT_FALSE(repo->inTransaction());
}

// Test: A writer on another handle waits for the lock
TEST_F(RepositoryTest, SecondWriterBlocks) {
    auto a = openRepo();
    auto b = openRepo();
    std::atomic<bool> acquired{false};

    Transaction tx = a->beginTransaction();
    std::thread waiter([&] {
        Transaction other = b->beginTransaction();
        acquired = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_FALSE(acquired.load());

    tx = Transaction();
    waiter.join();
    EXPECT_TRUE(acquired.load());
}

// Test: A writer woken by the release keeps newcomers out
TEST_F(RepositoryTest, WokenWriterExcludesNewcomer) {
    auto a = openRepo();
    auto b = openRepo();
    auto c = openRepo();
    fs::path lockFile = a->refs().lockPath("master");
    std::atomic<bool> acquired{false};
    std::atomic<bool> done{false};

    Transaction tx = a->beginTransaction();
    std::thread waiter([&] {
        Transaction other = b->beginTransaction();
        acquired = true;
        while (!done.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_FALSE(acquired.load());

    tx = Transaction();
    while (!acquired.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    // b holds the branch: neither a raw lock nor a third handle gets in
    EXPECT_TRUE(fs::exists(lockFile));
    EXPECT_FALSE(FileLock::tryAcquire(lockFile).locked());
    std::atomic<bool> newcomer{false};
    std::thread third([&] {
        Transaction late = c->beginTransaction();
        newcomer = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_FALSE(newcomer.load());

    done = true;
    waiter.join();
    third.join();
    EXPECT_TRUE(newcomer.load());
    EXPECT_FALSE(fs::exists(lockFile));
}

// Test: Moved-from and finished transactions cannot commit
TEST_F(RepositoryTest, TransactionOwnership) {
    auto repo = openRepo();
    auto other = openRepo();

    Transaction tx = repo->beginTransaction();
    Transaction moved = std::move(tx);
    EXPECT_FALSE(tx.active());
    EXPECT_TRUE(moved.active());
    repo->root().write("f", "x");
    EXPECT_THROW(repo->commit(tx, "stale"), StoreError);
    EXPECT_THROW(other->commit(moved, "wrong repo"), StoreError);

    repo->finishTransaction(moved);
    EXPECT_FALSE(moved.active());
    EXPECT_THROW(repo->commit(moved, "finished"), StoreError);
}

// Test: Switching branches reloads the head of the new branch
TEST_F(RepositoryTest, SetBranch) {
    auto repo = openRepo();
    std::string master = commitFile(*repo, "m", "master file", "on master");

    repo->setBranch("feature/x");
    EXPECT_EQ(repo->branch(), "feature/x");
    EXPECT_FALSE(repo->head().has_value());
    EXPECT_FALSE(repo->root().contains("m"));
    commitFile(*repo, "f", "feature file", "on feature");
    EXPECT_TRUE(fs::exists(gitDir / "refs" / "heads" / "feature" / "x"));

    repo->setBranch("master");
    EXPECT_EQ(repo->head()->hash, master);
    EXPECT_THROW(repo->setBranch("bad name"), StoreError);

    Transaction tx = repo->beginTransaction();
    EXPECT_THROW(repo->setBranch("feature/x"), StoreError);
    EXPECT_EQ(repo->branch(), "master");
}

// Test: The default identity prefers the environment over configuration
TEST_F(RepositoryTest, DefaultIdentity) {
    auto repo = openRepo();
    Identity fromConfig = repo->defaultIdentity();
    EXPECT_EQ(fromConfig.name, "Config User");
    EXPECT_EQ(fromConfig.email, "config@example.com");

    setenv("GIT_AUTHOR_NAME", "Env User", 1);
    Identity mixed = repo->defaultIdentity();
    EXPECT_EQ(mixed.name, "Env User");
    EXPECT_EQ(mixed.email, "config@example.com");

    setenv("GIT_AUTHOR_EMAIL", "env@example.com", 1);
    EXPECT_EQ(repo->defaultIdentity().email, "env@example.com");
}

// Test: Unset configuration keys fall back to the login
TEST_F(RepositoryTest, IdentityFallback) {
    auto repo = openRepo();
    client->config.clear();
    Identity id = repo->defaultIdentity();
    EXPECT_FALSE(id.name.empty());
    EXPECT_NE(id.email.find('@'), std::string::npos);

    Signature sig = id.at(1700000000);
    EXPECT_EQ(sig.timestamp, 1700000000);
    EXPECT_EQ(sig.timezone.size(), 5u);
}

// Test: A failing configuration lookup is reported, not skipped
TEST_F(RepositoryTest, IdentityConfigFailure) {
    auto repo = openRepo();
    client->failConfig = true;
    try {
        repo->defaultIdentity();
        FAIL() << "expected StoreError";
    } catch (const StoreError& e) {
        EXPECT_EQ(e.code(), ErrorCode::SubprocessFailure);
    }

    // Environment values are used before the client is asked
    setenv("GIT_AUTHOR_NAME", "Env Author", 1);
    setenv("GIT_AUTHOR_EMAIL", "env@example.com", 1);
    Identity id = repo->defaultIdentity();
    unsetenv("GIT_AUTHOR_NAME");
    unsetenv("GIT_AUTHOR_EMAIL");
    EXPECT_EQ(id.name, "Env Author");
    EXPECT_EQ(id.email, "env@example.com");
}

// Test: History and diffs are delegated to the client
TEST_F(RepositoryTest, LogAndDiffForwarding) {
    auto repo = openRepo();
    client->history.resize(3);
    client->history[0].id = "newest";
    client->patch = "diff --git a/x b/x";

    auto entries = repo->log(2);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].id, "newest");
    EXPECT_EQ(client->calls.back(), "log 2 master ");

    repo->log(5, "v1.0", "docs");
    EXPECT_EQ(client->calls.back(), "log 5 v1.0 docs");

    DiffResult d = repo->diff("aaa", "bbb", "src");
    EXPECT_EQ(d.patch, "diff --git a/x b/x");
    EXPECT_EQ(client->calls.back(), "diff aaa bbb src");
}
