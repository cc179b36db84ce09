#include "core/ObjectStore.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>

#include <unistd.h>

#include "core/Constants.hpp"
#include "core/Envelope.hpp"
#include "util/IHasher.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace gitcask {

namespace {
    std::string toLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
            return static_cast<char>(c >= 'A' && c <= 'Z' ? c - 'A' + 'a' : c);
        });
        return s;
    }

    Error notFound(const std::string& key) {
        return Error{ErrorCode::NotFound, "Object not found: " + key};
    }

    Error ambiguous(const std::string& key) {
        return Error{ErrorCode::Ambiguous, "Ambiguous object id: " + key};
    }
}

ObjectStore::ObjectStore(const fs::path& dir, std::unique_ptr<IHasher> h)
    : gitDir(dir), hasher(h ? std::move(h) : HasherFactory::createDefault()) {
    loadPacks();
}

ObjectStore::~ObjectStore() = default;

fs::path ObjectStore::objectsDir() const {
    return gitDir / Paths::OBJECTS;
}

fs::path ObjectStore::getObjectPath(const std::string& id) const {
    return objectsDir() / id.substr(0, Constants::OBJECT_DIR_LENGTH) / id.substr(Constants::OBJECT_DIR_LENGTH);
}

void ObjectStore::loadPacks() {
    packFiles.clear();
    packIndex.clear();

    fs::path packDir = objectsDir() / Paths::PACK;
    std::error_code ec;
    if (!fs::is_directory(packDir, ec)) return;

    std::vector<fs::path> paths;
    for (const auto& entry : fs::directory_iterator(packDir, ec)) {
        if (entry.path().extension() == ".pack") paths.push_back(entry.path());
    }
    if (ec) {
        throw StoreError(ErrorCode::IoError, "Failed to list " + packDir.string() + ": " + ec.message());
    }
    std::sort(paths.begin(), paths.end());

    for (const auto& path : paths) {
        auto pack = std::make_unique<PackFile>(path);
        size_t slot = packFiles.size();
        pack->forEachObject([&](const std::string& id, uint64_t offset) {
            packIndex.insert(id, PackLocation{slot, offset});
        });
        Logger::instance().debug("Loaded " + path.filename().string() + " (" +
                                 std::to_string(pack->objectCount()) + " objects)");
        packFiles.push_back(std::move(pack));
    }
}

ObjectPtr ObjectStore::remember(ObjectType type, std::string id, std::string data) {
    auto obj = std::make_shared<Object>();
    obj->type = type;
    obj->id = std::move(id);
    obj->data = std::move(data);
    cache.insert(obj->id, obj);
    return obj;
}

Expected<ObjectPtr> ObjectStore::get(const std::string& rawKey) {
    if (rawKey.size() < Constants::MIN_ABBREV_LENGTH || !isHexKey(rawKey)) {
        return notFound(rawKey);
    }
    std::string key = toLower(rawKey);

    auto cached = cache.find(key, 2);
    if (cached.size() == 1) {
        ++counters.cacheHits;
        return cached.front().second;
    }

    Logger::instance().debug("Loading " + key);

    auto loose = findLoose(key);
    if (!loose) return loose.error();
    if (loose.value()) return *loose.value();

    auto packed = findPacked(key);
    if (!packed) return packed.error();
    if (packed.value()) return *packed.value();

    return notFound(key);
}

Expected<std::optional<ObjectPtr>> ObjectStore::findLoose(const std::string& key) {
    if (key.size() == Constants::SHA1_HEX_LENGTH) {
        fs::path path = getObjectPath(key);
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) return std::optional<ObjectPtr>();
        return readLoose(key, path);
    }

    // Abbreviation: scan objects/<2 hex>/ for names starting with the rest
    fs::path dir = objectsDir() / key.substr(0, Constants::OBJECT_DIR_LENGTH);
    std::string rest = key.substr(Constants::OBJECT_DIR_LENGTH);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return std::optional<ObjectPtr>();

    std::vector<fs::path> matches;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        std::string name = entry.path().filename().string();
        if (name.size() == Constants::SHA1_HEX_LENGTH - Constants::OBJECT_DIR_LENGTH &&
            name.compare(0, rest.size(), rest) == 0 && isHexKey(name)) {
            matches.push_back(entry.path());
        }
    }
    if (ec) {
        return Error{ErrorCode::IoError, "Failed to list " + dir.string() + ": " + ec.message()};
    }

    if (matches.empty()) return std::optional<ObjectPtr>();
    if (matches.size() > 1) return ambiguous(key);
    std::string id = key.substr(0, Constants::OBJECT_DIR_LENGTH) + matches.front().filename().string();
    return readLoose(toLower(id), matches.front());
}

Expected<std::optional<ObjectPtr>> ObjectStore::readLoose(const std::string& id, const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "Failed to open object file for reading: " + id};
    }
    std::vector<uint8_t> buf((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Error{ErrorCode::IoError, "Error reading object file: " + id};
    }
    ++counters.looseReads;

    if (!isLegacyFrame(buf)) {
        return Error{ErrorCode::CorruptObject, "Not a loose object: " + id};
    }

    Envelope env;
    try {
        env = decodeFrame(buf);
    } catch (const StoreError& e) {
        return Error{ErrorCode::CorruptObject, "Bad object " + id + ": " + e.what()};
    }

    if (verifyObjects && digestOf(env.type, env.payload, *hasher) != id) {
        return Error{ErrorCode::CorruptObject, "Object " + id + " does not match its content"};
    }
    return std::optional<ObjectPtr>(remember(env.type, id, std::move(env.payload)));
}

Expected<std::optional<ObjectPtr>> ObjectStore::findPacked(const std::string& key) {
    auto hits = packIndex.find(key, 2);
    if (hits.empty()) return std::optional<ObjectPtr>();
    if (hits.size() > 1) return ambiguous(key);

    const std::string& id = hits.front().first;
    const PackLocation& loc = hits.front().second;
    PackedObject obj;
    try {
        obj = packFiles[loc.pack]->getObject(loc.offset);
    } catch (const StoreError& e) {
        return Error{e.code(), "Bad packed object " + id + ": " + e.what()};
    }
    ++counters.packReads;
    return std::optional<ObjectPtr>(remember(obj.type, id, std::move(obj.data)));
}

Expected<ObjectPtr> ObjectStore::getTyped(const std::string& key, ObjectType type) {
    auto obj = get(key);
    if (!obj) return obj;
    if (obj.value()->type != type) {
        return Error{ErrorCode::TypeMismatch, "Object " + obj.value()->id + " is a " +
                                                  typeName(obj.value()->type) + ", not a " + typeName(type)};
    }
    return obj;
}

Expected<TreeObject> ObjectStore::getTree(const std::string& key) {
    auto obj = getTyped(key, ObjectType::Tree);
    if (!obj) return obj.error();
    try {
        return parseTree(obj.value()->data);
    } catch (const StoreError& e) {
        return Error{e.code(), "Bad tree " + obj.value()->id + ": " + e.what()};
    }
}

Expected<CommitObject> ObjectStore::getCommit(const std::string& key) {
    auto obj = getTyped(key, ObjectType::Commit);
    if (!obj) return obj.error();
    try {
        return parseCommit(obj.value()->data, obj.value()->id);
    } catch (const StoreError& e) {
        return Error{e.code(), "Bad commit " + obj.value()->id + ": " + e.what()};
    }
}

Expected<TagObject> ObjectStore::getTag(const std::string& key) {
    auto obj = getTyped(key, ObjectType::Tag);
    if (!obj) return obj.error();
    try {
        return parseTag(obj.value()->data, obj.value()->id);
    } catch (const StoreError& e) {
        return Error{e.code(), "Bad tag " + obj.value()->id + ": " + e.what()};
    }
}

Expected<std::string> ObjectStore::getBlob(const std::string& key) {
    auto obj = getTyped(key, ObjectType::Blob);
    if (!obj) return obj.error();
    return obj.value()->data;
}

Expected<TypedObject> ObjectStore::getParsed(const std::string& key) {
    auto obj = get(key);
    if (!obj) return obj.error();
    try {
        return parseObject(*obj.value());
    } catch (const StoreError& e) {
        return Error{e.code(), "Bad " + std::string(typeName(obj.value()->type)) + " " +
                                   obj.value()->id + ": " + e.what()};
    }
}

std::string ObjectStore::hashObject(ObjectType type, const std::string& payload) {
    return digestOf(type, payload, *hasher);
}

std::string ObjectStore::put(ObjectType type, const std::string& payload) {
    std::string id = hashObject(type, payload);
    fs::path objPath = getObjectPath(id);

    std::error_code ec;
    if (!fs::exists(objPath, ec)) {
        fs::create_directories(objPath.parent_path(), ec);
        if (ec) {
            throw StoreError(ErrorCode::IoError, "Failed to create object directory: " + ec.message());
        }

        std::vector<uint8_t> compressed = encodeFrame(type, payload);

        // Write next to the final name so the rename stays on one filesystem
        fs::path tmpPath = objPath.parent_path() /
                           ("tmp_obj_" + objPath.filename().string() + "_" + std::to_string(::getpid()));
        {
            std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw StoreError(ErrorCode::IoError, "Failed to open object file for writing: " + id);
            }
            out.write(reinterpret_cast<const char*>(compressed.data()),
                      static_cast<std::streamsize>(compressed.size()));
            out.flush();
            if (!out.good()) {
                out.close();
                fs::remove(tmpPath, ec);
                throw StoreError(ErrorCode::IoError, "Failed to write object: " + id);
            }
        }
        fs::rename(tmpPath, objPath, ec);
        if (ec) {
            std::error_code ignored;
            fs::remove(tmpPath, ignored);
            throw StoreError(ErrorCode::IoError, "Failed to store object " + id + ": " + ec.message());
        }
        ++counters.looseWrites;
        Logger::instance().debug("Stored " + id);
    }

    remember(type, id, payload);
    return id;
}

}
