#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <string>
#include "test_utils.hpp"
#include "core/GitCommandClient.hpp"
#include "util/Expected.hpp"

namespace fs = std::filesystem;

using namespace gitcask;
using namespace gitcask::test::utils;

namespace {
    const std::string C1 = "1111111111111111111111111111111111111111";
    const std::string C2 = "2222222222222222222222222222222222222222";
    const std::string T1 = "4b825dc642cb6eb9a060e54bf8d69288fbee4904";

    std::string logRecord(const std::string& id, const std::string& parents,
                          const std::string& message) {
        return id + "\n" + parents + "\n" + T1 + "\n" +
               "Ada\nada@example.com\n1700000000\n" +
               "Bot\nbot@example.com\n1700000100\n" +
               std::string(1, '\0') + message + std::string(1, '\0') + "\n";
    }
}

// Test: Log output is split into entries with headers and messages
TEST(GitCommandClientTest, ParseLog) {
    std::string output = logRecord(C2, C1, "Second\n\nWith a body\n") +
                         logRecord(C1, "", "Root commit\n");
    auto entries = GitCommandClient::parseLog(output);

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].id, C2);
    ASSERT_EQ(entries[0].parents.size(), 1u);
    EXPECT_EQ(entries[0].parents[0], C1);
    EXPECT_EQ(entries[0].tree, T1);
    EXPECT_EQ(entries[0].author.name, "Ada");
    EXPECT_EQ(entries[0].author.email, "ada@example.com");
    EXPECT_EQ(entries[0].author.timestamp, 1700000000);
    EXPECT_EQ(entries[0].committer.name, "Bot");
    EXPECT_EQ(entries[0].committer.timestamp, 1700000100);
    EXPECT_EQ(entries[0].message, "Second\n\nWith a body");

    EXPECT_EQ(entries[1].id, C1);
    EXPECT_TRUE(entries[1].parents.empty());
    EXPECT_EQ(entries[1].message, "Root commit");
}

// Test: Merge parents and empty output
TEST(GitCommandClientTest, ParseLogEdgeCases) {
    auto merge = GitCommandClient::parseLog(logRecord(C2, C1 + " " + T1, "Merge"));
    ASSERT_EQ(merge.size(), 1u);
    EXPECT_EQ(merge[0].parents.size(), 2u);

    EXPECT_TRUE(GitCommandClient::parseLog("").empty());
    EXPECT_THROW(GitCommandClient::parseLog("short\nheader\n" + std::string(1, '\0') + "msg" +
                                            std::string(1, '\0')),
                 StoreError);
}

class GitCommandClientScriptTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        gitDir = tempDir / "repo.git";
        fs::path script = createFile(tempDir, "fake-git",
            "#!/bin/sh\n"
            "case \"$1\" in\n"
            "  config)\n"
            "    if [ \"$2\" = \"user.name\" ]; then echo \"Script User\"; exit 0; fi\n"
            "    exit 1 ;;\n"
            "  log) echo \"fatal: bad default revision 'HEAD'\"; exit 128 ;;\n"
            "  diff) echo \"dir=$GIT_DIR\"; shift; echo \"args=$*\"; exit 0 ;;\n"
            "  init) echo \"init refused\"; exit 2 ;;\n"
            "esac\n"
            "exit 3\n");
        fs::permissions(script, fs::perms::owner_all);
        setenv("GITCASK_GIT", script.c_str(), 1);
    }

    void TearDown() override {
        unsetenv("GITCASK_GIT");
        removeDir(tempDir);
    }

    fs::path tempDir;
    fs::path gitDir;
};

// Test: The executable comes from GITCASK_GIT
TEST_F(GitCommandClientScriptTest, ExecutableOverride) {
    GitCommandClient client(gitDir);
    EXPECT_EQ(client.executable(), (tempDir / "fake-git").string());
}

// Test: Exit status 1 without output is an unset value
TEST_F(GitCommandClientScriptTest, ConfigGet) {
    GitCommandClient client(gitDir);
    EXPECT_EQ(client.configGet("user.name"), "Script User");
    EXPECT_EQ(client.configGet("user.email"), "");
}

// Test: A branch without commits has an empty history
TEST_F(GitCommandClientScriptTest, LogOnEmptyBranch) {
    GitCommandClient client(gitDir);
    EXPECT_TRUE(client.log(10, "master", "").empty());
}

// Test: Diff passes GIT_DIR, --full-index and the path filter
TEST_F(GitCommandClientScriptTest, DiffArguments) {
    GitCommandClient client(gitDir);
    DiffResult d = client.diff(C1, C2, "docs/a b.txt");
    EXPECT_EQ(d.from, C1);
    EXPECT_EQ(d.to, C2);
    EXPECT_EQ(d.patch, "dir=" + gitDir.string() + "\nargs=--full-index " + C1 + " " + C2 +
                       " -- docs/a b.txt");
}

// Test: Other failures carry the command line and output
TEST_F(GitCommandClientScriptTest, FailureIsReported) {
    GitCommandClient client(gitDir);
    try {
        client.init(true);
        FAIL() << "expected StoreError";
    } catch (const StoreError& e) {
        EXPECT_EQ(e.code(), ErrorCode::SubprocessFailure);
        std::string what = e.what();
        EXPECT_NE(what.find("'init' '--bare'"), std::string::npos);
        EXPECT_NE(what.find("init refused"), std::string::npos);
    }
}
