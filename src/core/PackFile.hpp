#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "core/Object.hpp"

namespace gitcask {

/// Type and payload of an object decoded from a pack (deltas already applied)
struct PackedObject {
    ObjectType type{ObjectType::Blob};
    std::string data;
};

/**
 * @brief Read-only view of one pack archive (objects/pack/pack-*.pack)
 *
 * The archive is memory-mapped for the reader's lifetime. Offsets come from
 * the companion .idx (version 1 or 2); if there is no .idx the table is
 * rebuilt by walking the pack, in which case REF_DELTA bases must precede
 * their deltas.
 *
 * Pack entry layout:
 *   header: type (3 bits) + size (varint, 4 bits in the first byte)
 *   OFS_DELTA: negative base offset (big-endian base-128, +1 per extra byte)
 *   REF_DELTA: 20-byte base id
 *   zlib stream with the payload or the delta instructions
 *
 * getObject() never mutates the reader and may run on several threads.
 * Every decode failure is reported as StoreError(CorruptObject).
 */
class PackFile {
public:
    explicit PackFile(const std::filesystem::path& packPath);
    ~PackFile();

    PackFile(const PackFile&) = delete;
    PackFile& operator=(const PackFile&) = delete;

    const std::filesystem::path& path() const { return packPath; }
    size_t objectCount() const { return index.size(); }

    /// Visit every (40-hex id, offset) pair, ordered by id
    void forEachObject(const std::function<void(const std::string&, uint64_t)>& fn) const;

    /// Offset of an object given its full 40-hex id
    std::optional<uint64_t> findOffset(const std::string& hexId) const;

    /// Decode the entry starting at `offset`, resolving its delta chain
    PackedObject getObject(uint64_t offset) const;

private:
    using RawId = std::array<uint8_t, 20>;

    struct IndexEntry {
        RawId id;
        uint64_t offset;
    };

    enum EntryKind : uint8_t {
        KindCommit = 1,
        KindTree = 2,
        KindBlob = 3,
        KindTag = 4,
        KindOfsDelta = 6,
        KindRefDelta = 7
    };

    struct EntryHeader {
        uint8_t kind{0};
        uint64_t size{0};        // inflated size (delta size for delta entries)
        uint64_t dataOffset{0};  // start of the zlib stream
        uint64_t baseOffset{0};  // OFS_DELTA / resolved REF_DELTA base
    };

    void loadIndex(const std::filesystem::path& idxPath);
    void regenerateIndex();
    std::optional<uint64_t> lookup(const RawId& id) const;

    EntryHeader readHeader(uint64_t offset) const;
    std::string inflateEntry(const EntryHeader& header, size_t* consumed = nullptr) const;
    static std::string applyDelta(const std::string& base, const std::string& delta);

    std::filesystem::path packPath;
    const uint8_t* data{nullptr};
    size_t size{0};
    uint32_t declaredCount{0};
    std::vector<IndexEntry> index;  // sorted by id once construction completes
    bool indexSorted{false};
};

}
