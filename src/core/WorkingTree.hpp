#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/Constants.hpp"

namespace gitcask {

class ObjectStore;

/**
 * @brief Mutable in-memory snapshot of a branch's tree
 *
 * Loaded lazily from the object store: a directory lists its entries the
 * first time it is walked into, and a file's content is fetched on first
 * read. Paths are '/'-separated and relative to the root; writing a file
 * creates the intermediate directories.
 *
 * Each directory keeps a modified flag that is set on every directory along
 * a changed path, so the root flag says whether anything needs saving.
 * Errors reading the backing objects are raised as StoreError.
 */
class WorkingTree {
public:
    /// Empty tree (new branch)
    explicit WorkingTree(ObjectStore& store);

    /// Tree backed by a stored tree object, loaded on demand
    WorkingTree(ObjectStore& store, std::string treeId);

    WorkingTree(const WorkingTree&) = delete;
    WorkingTree& operator=(const WorkingTree&) = delete;

    /// Content of the file at `path`, std::nullopt when absent or a directory
    std::optional<std::string> read(const std::string& path);

    void write(const std::string& path, const std::string& content, uint32_t mode = Constants::MODE_FILE);

    /// Remove a file or a whole directory; false when nothing was there
    bool remove(const std::string& path);

    bool contains(const std::string& path);

    /// Names directly under `dir` (the root when empty), in name order
    std::vector<std::string> list(const std::string& dir = "");

    bool isModified() const { return modified; }

    /// Id of the stored tree this snapshot came from or was last saved as
    const std::string& id() const { return treeId; }

    /**
     * @brief Write modified directories bottom-up
     *
     * Directories left empty by removals are dropped. Unmodified
     * subtrees keep their id without being loaded. Returns the root tree id
     * and clears the modified flags.
     */
    std::string save(ObjectStore& target);

private:
    struct Entry {
        uint32_t mode{Constants::MODE_FILE};
        std::string id;                        // empty until saved for new files
        std::optional<std::string> content;    // loaded or written blob content
        std::unique_ptr<WorkingTree> subtree;  // set for directories

        bool isDir() const { return mode == Constants::MODE_DIR; }
    };

    void ensureLoaded();
    /// Directory reached by the first `depth` components (nullptr if missing and !create)
    WorkingTree* walk(const std::vector<std::string>& parts, size_t depth, bool create,
                      std::vector<WorkingTree*>* trail = nullptr);

    ObjectStore* store;
    std::string treeId;
    bool loaded{false};
    bool modified{false};
    std::map<std::string, Entry> entries;
};

}
