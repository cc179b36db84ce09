#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "core/Object.hpp"
#include "core/VersionControlClient.hpp"

namespace gitcask::test {

/**
 * @brief Test utilities for gitcask tests
 *
 * Temporary directories, file helpers, a writer for pack fixtures and a
 * scripted VersionControlClient.
 */
namespace utils {

/**
 * @brief Create a temporary directory for testing
 * @return Path to temporary directory
 */
std::filesystem::path createTempDir();

/// Remove a directory and all its contents
void removeDir(const std::filesystem::path& dir);

/**
 * @brief Create a file (and its parent directories) with binary content
 * @return Full path to created file
 */
std::filesystem::path createFile(
    const std::filesystem::path& baseDir,
    const std::string& filename,
    const std::string& content = ""
);

std::string readFile(const std::filesystem::path& filePath);

/// Lay out an empty repository: objects/, objects/pack/, refs/heads/
std::filesystem::path initTestRepo(const std::filesystem::path& gitDir);

/// Number of loose object files under <git dir>/objects
size_t countLooseObjects(const std::filesystem::path& gitDir);

/**
 * @brief Delta instructions turning `base` into `target`
 *
 * One copy of the common prefix followed by inserts of the remainder.
 */
std::string makeDelta(const std::string& base, const std::string& target);

/// One entry of a pack fixture
struct PackEntry {
    enum class Kind { Whole, OfsDelta, RefDelta };

    ObjectType type{ObjectType::Blob};
    std::string data;            // full object content, also for deltas
    Kind kind{Kind::Whole};
    size_t base{0};              // index of the base entry (earlier for OfsDelta)
};

struct PackFixture {
    std::filesystem::path packPath;
    std::filesystem::path idxPath;
    std::vector<std::string> ids;        // per entry, in pack order
    std::vector<uint64_t> offsets;       // per entry, in pack order
};

/**
 * @brief Write <dir>/pack-<name>.pack and, unless idxVersion is 0, its index
 * @param idxVersion 1 or 2 (0 = no .idx)
 */
PackFixture writePack(
    const std::filesystem::path& dir,
    const std::string& name,
    const std::vector<PackEntry>& entries,
    int idxVersion = 2
);

/**
 * @brief In-memory VersionControlClient
 *
 * init() creates the repository layout under gitDir; the other calls return
 * what the test configured and record their arguments.
 */
class FakeClient : public VersionControlClient {
public:
    explicit FakeClient(std::filesystem::path gitDir = {}) : gitDir(std::move(gitDir)) {}

    std::vector<LogEntry> log(size_t limit, const std::string& start, const std::string& path) override;
    DiffResult diff(const std::string& from, const std::string& to, const std::string& path) override;
    std::string configGet(const std::string& key) override;
    void init(bool bare) override;

    std::filesystem::path gitDir;
    std::map<std::string, std::string> config;
    std::vector<LogEntry> history;
    std::string patch;
    bool failConfig{false};

    std::vector<std::string> calls;
    int initCalls{0};
    bool lastInitBare{false};
};

} // namespace utils

} // namespace gitcask::test
