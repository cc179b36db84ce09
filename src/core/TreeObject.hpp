#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace gitcask {

/**
 * @brief One entry of a tree object
 *
 * Git tree format, repeated per entry:
 *   <octal mode> <name>\0<20-byte binary id>
 */
struct TreeEntry {
    uint32_t mode{0};       // 040000 (dir), 100644 (file), 100755, 120000, 160000
    std::string name;       // single path component
    std::string hashHex;    // 40 hex chars
    bool isTree() const;
};

struct TreeObject {
    std::vector<TreeEntry> entries;
};

/// Parse a tree payload; throws StoreError(CorruptObject) on malformed entries
TreeObject parseTree(const std::string& payload);

/**
 * @brief Serialize entries in git order
 *
 * Entries are sorted the way git sorts them: byte order of the name, with
 * directories compared as if their name had a trailing '/'.
 */
std::string serializeTree(std::vector<TreeEntry> entries);

}
