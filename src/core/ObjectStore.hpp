#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/CommitObject.hpp"
#include "core/Object.hpp"
#include "core/PackFile.hpp"
#include "core/TagObject.hpp"
#include "core/TreeObject.hpp"
#include "core/Trie.hpp"
#include "core/TypedObject.hpp"
#include "util/Expected.hpp"
#include "util/IHasher.hpp"

namespace gitcask {

/**
 * @brief Content-addressable object database (<git dir>/objects)
 *
 * Objects are addressed by the SHA-1 of "<type> <size>\0<payload>", either
 * with the full 40-char id or with an abbreviation of at least
 * Constants::MIN_ABBREV_LENGTH characters.
 *
 * Lookup order:
 *   1. in-memory cache (a Trie of decoded objects)
 *   2. loose files: objects/<first-2-chars>/<remaining-38-chars>
 *   3. pack archives: objects/pack/*.pack, indexed in a second Trie
 *
 * An abbreviation matching more than one object at the level where it
 * first matches is Ambiguous. Writes only ever create loose files; a file
 * that already exists is left untouched.
 *
 * Not synchronized: callers sharing a store across threads serialize access.
 */
class ObjectStore {
public:
    /// Counters for what get()/put() actually touched
    struct Stats {
        size_t cacheHits{0};
        size_t looseReads{0};
        size_t packReads{0};
        size_t looseWrites{0};
    };

    /**
     * @param gitDir Repository directory holding objects/ (".git" or a bare repo)
     * @param hasher Digest algorithm (SHA-1 when nullptr)
     */
    explicit ObjectStore(const std::filesystem::path& gitDir, std::unique_ptr<IHasher> hasher = nullptr);
    ~ObjectStore();

    ObjectStore(const ObjectStore&) = delete;
    ObjectStore& operator=(const ObjectStore&) = delete;

    /// <git dir>/objects
    std::filesystem::path objectsDir() const;

    /// Path of the loose file for a full id
    std::filesystem::path getObjectPath(const std::string& id) const;

    /**
     * @brief Open every objects/pack/*.pack and index its entries
     *
     * Called by the constructor; call again after packs are added on disk.
     * Throws StoreError(CorruptObject) for a damaged pack or index.
     */
    void loadPacks();
    const std::vector<std::unique_ptr<PackFile>>& packs() const { return packFiles; }

    /// Re-hash decoded loose objects and reject mismatches (on by default)
    void setVerifyObjects(bool verify) { verifyObjects = verify; }

    /**
     * @brief Resolve a full or abbreviated id
     * @return The decoded object, or NotFound / Ambiguous / CorruptObject
     */
    Expected<ObjectPtr> get(const std::string& key);

    Expected<TreeObject> getTree(const std::string& key);
    Expected<CommitObject> getCommit(const std::string& key);
    Expected<TagObject> getTag(const std::string& key);

    /// Payload of a blob
    Expected<std::string> getBlob(const std::string& key);

    /// Resolve any object and decode it by its type tag
    Expected<TypedObject> getParsed(const std::string& key);

    /**
     * @brief Store an object and return its id
     *
     * The loose file is written through a temporary file and a rename, only
     * when absent. The cache is refreshed either way. Throws StoreError(IoError).
     */
    std::string put(ObjectType type, const std::string& payload);

    /// Id the object would have, without storing it
    std::string hashObject(ObjectType type, const std::string& payload);

    void clearCache() { cache.clear(); }
    size_t cacheSize() const { return cache.size(); }
    const Stats& stats() const { return counters; }

private:
    struct PackLocation {
        size_t pack;
        uint64_t offset;
    };

    Expected<std::optional<ObjectPtr>> findLoose(const std::string& key);
    Expected<std::optional<ObjectPtr>> readLoose(const std::string& id, const std::filesystem::path& path);
    Expected<std::optional<ObjectPtr>> findPacked(const std::string& key);
    ObjectPtr remember(ObjectType type, std::string id, std::string data);
    Expected<ObjectPtr> getTyped(const std::string& key, ObjectType type);

    std::filesystem::path gitDir;
    std::unique_ptr<IHasher> hasher;
    bool verifyObjects{true};
    Trie<ObjectPtr> cache;
    Trie<PackLocation> packIndex;
    std::vector<std::unique_ptr<PackFile>> packFiles;
    Stats counters;
};

}
