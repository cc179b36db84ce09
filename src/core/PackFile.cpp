#include "core/PackFile.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include "core/Constants.hpp"
#include "core/Envelope.hpp"
#include "util/Expected.hpp"
#include "util/IHasher.hpp"
#include "util/Logger.hpp"
#include "util/Zlib.hpp"

namespace fs = std::filesystem;

namespace gitcask {

namespace {
    constexpr size_t PACK_HEADER_SIZE = 12;
    constexpr size_t TRAILER_SIZE = 20;

    uint32_t be32(const uint8_t* p) {
        return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
    }

    uint64_t be64(const uint8_t* p) {
        return (uint64_t(be32(p)) << 32) | be32(p + 4);
    }

    [[noreturn]] void corrupt(const fs::path& pack, const std::string& what) {
        throw StoreError(ErrorCode::CorruptObject, pack.filename().string() + ": " + what);
    }

    ObjectType kindToType(uint8_t kind) {
        switch (kind) {
            case 1: return ObjectType::Commit;
            case 2: return ObjectType::Tree;
            case 3: return ObjectType::Blob;
            default: return ObjectType::Tag;
        }
    }

    bool isDelta(uint8_t kind) { return kind == 6 || kind == 7; }
}

PackFile::PackFile(const fs::path& path) : packPath(path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        throw StoreError(ErrorCode::IoError, "Failed to open pack " + path.string() + ": " + std::strerror(errno));
    }
    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        int err = errno;
        ::close(fd);
        throw StoreError(ErrorCode::IoError, "Failed to stat pack " + path.string() + ": " + std::strerror(err));
    }
    size = static_cast<size_t>(st.st_size);
    if (size < PACK_HEADER_SIZE + TRAILER_SIZE) {
        ::close(fd);
        corrupt(packPath, "file too small to be a pack");
    }
    void* map = ::mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0);
    int mapErr = errno;
    ::close(fd);
    if (map == MAP_FAILED) {
        throw StoreError(ErrorCode::IoError, "Failed to map pack " + path.string() + ": " + std::strerror(mapErr));
    }
    data = static_cast<const uint8_t*>(map);

    try {
        if (be32(data) != Constants::PACK_SIGNATURE) corrupt(packPath, "bad pack signature");
        uint32_t version = be32(data + 4);
        if (version != 2 && version != 3) corrupt(packPath, "unsupported pack version " + std::to_string(version));
        declaredCount = be32(data + 8);

        fs::path idxPath = packPath;
        idxPath.replace_extension(".idx");
        std::error_code ec;
        if (fs::exists(idxPath, ec)) {
            loadIndex(idxPath);
        } else {
            Logger::instance().debug("No index for " + packPath.filename().string() + ", scanning pack");
            regenerateIndex();
        }
        std::sort(index.begin(), index.end(),
                  [](const IndexEntry& a, const IndexEntry& b) { return a.id < b.id; });
        indexSorted = true;
    } catch (...) {
        ::munmap(const_cast<uint8_t*>(data), size);
        data = nullptr;
        throw;
    }
}

PackFile::~PackFile() {
    if (data) ::munmap(const_cast<uint8_t*>(data), size);
}

void PackFile::loadIndex(const fs::path& idxPath) {
    std::ifstream in(idxPath, std::ios::binary);
    if (!in) {
        throw StoreError(ErrorCode::IoError, "Failed to open pack index " + idxPath.string());
    }
    std::vector<uint8_t> idx((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw StoreError(ErrorCode::IoError, "Error reading pack index " + idxPath.string());
    }

    const bool v2 = idx.size() >= 8 && be32(idx.data()) == Constants::PACK_IDX_SIGNATURE;
    const size_t fanoutAt = v2 ? 8 : 0;
    if (v2 && be32(idx.data() + 4) != 2) {
        corrupt(idxPath, "unsupported index version " + std::to_string(be32(idx.data() + 4)));
    }
    if (idx.size() < fanoutAt + Constants::PACK_IDX_FANOUT * 4 + 2 * TRAILER_SIZE) {
        corrupt(idxPath, "index truncated");
    }

    uint32_t prev = 0;
    for (size_t i = 0; i < Constants::PACK_IDX_FANOUT; ++i) {
        uint32_t n = be32(idx.data() + fanoutAt + i * 4);
        if (n < prev) corrupt(idxPath, "fan-out table is not monotonic");
        prev = n;
    }
    const size_t count = prev;
    if (count != declaredCount) {
        corrupt(idxPath, "index lists " + std::to_string(count) + " objects, pack has " +
                             std::to_string(declaredCount));
    }

    const size_t tableAt = fanoutAt + Constants::PACK_IDX_FANOUT * 4;
    const size_t trailerAt = idx.size() - 2 * TRAILER_SIZE;
    index.reserve(count);

    if (v2) {
        const size_t idsAt = tableAt;
        const size_t offsetsAt = idsAt + count * 20 + count * 4;
        const size_t largeAt = offsetsAt + count * 4;
        if (largeAt > trailerAt) corrupt(idxPath, "index truncated");
        for (size_t i = 0; i < count; ++i) {
            IndexEntry e{};
            std::memcpy(e.id.data(), idx.data() + idsAt + i * 20, 20);
            uint32_t off = be32(idx.data() + offsetsAt + i * 4);
            if (off & 0x80000000u) {
                size_t li = off & 0x7fffffffu;
                if (largeAt + (li + 1) * 8 > trailerAt) corrupt(idxPath, "large offset out of range");
                e.offset = be64(idx.data() + largeAt + li * 8);
            } else {
                e.offset = off;
            }
            index.push_back(e);
        }
    } else {
        if (tableAt + count * 24 > trailerAt) corrupt(idxPath, "index truncated");
        for (size_t i = 0; i < count; ++i) {
            IndexEntry e{};
            const uint8_t* rec = idx.data() + tableAt + i * 24;
            e.offset = be32(rec);
            std::memcpy(e.id.data(), rec + 4, 20);
            index.push_back(e);
        }
    }

    if (std::memcmp(idx.data() + trailerAt, data + size - TRAILER_SIZE, TRAILER_SIZE) != 0) {
        corrupt(idxPath, "index does not belong to this pack (checksum mismatch)");
    }
    for (const auto& e : index) {
        if (e.offset < PACK_HEADER_SIZE || e.offset >= size - TRAILER_SIZE) {
            corrupt(idxPath, "object offset " + std::to_string(e.offset) + " outside pack");
        }
    }
}

void PackFile::regenerateIndex() {
    auto hasher = HasherFactory::createDefault();
    uint64_t pos = PACK_HEADER_SIZE;
    index.reserve(declaredCount);

    for (uint32_t i = 0; i < declaredCount; ++i) {
        EntryHeader header = readHeader(pos);
        size_t consumed = 0;
        std::string raw = inflateEntry(header, &consumed);

        PackedObject obj;
        if (isDelta(header.kind)) {
            obj = getObject(pos);
        } else {
            obj.type = kindToType(header.kind);
            obj.data = std::move(raw);
        }

        IndexEntry e{};
        std::vector<uint8_t> id;
        IHasher::fromHex(digestOf(obj.type, obj.data, *hasher), id);
        std::copy(id.begin(), id.end(), e.id.begin());
        e.offset = pos;
        index.push_back(e);

        pos = header.dataOffset + consumed;
    }
    if (pos != size - TRAILER_SIZE) {
        corrupt(packPath, "unexpected data after the last entry");
    }
}

std::optional<uint64_t> PackFile::lookup(const RawId& id) const {
    if (indexSorted) {
        auto it = std::lower_bound(index.begin(), index.end(), id,
                                   [](const IndexEntry& e, const RawId& key) { return e.id < key; });
        if (it != index.end() && it->id == id) return it->offset;
        return std::nullopt;
    }
    for (const auto& e : index) {
        if (e.id == id) return e.offset;
    }
    return std::nullopt;
}

std::optional<uint64_t> PackFile::findOffset(const std::string& hexId) const {
    std::vector<uint8_t> raw;
    if (hexId.size() != Constants::SHA1_HEX_LENGTH || !IHasher::fromHex(hexId, raw)) return std::nullopt;
    RawId id{};
    std::copy(raw.begin(), raw.end(), id.begin());
    return lookup(id);
}

void PackFile::forEachObject(const std::function<void(const std::string&, uint64_t)>& fn) const {
    for (const auto& e : index) {
        fn(IHasher::toHex(e.id.data(), e.id.size()), e.offset);
    }
}

PackFile::EntryHeader PackFile::readHeader(uint64_t offset) const {
    const uint64_t end = size - TRAILER_SIZE;
    if (offset < PACK_HEADER_SIZE || offset >= end) {
        corrupt(packPath, "no entry at offset " + std::to_string(offset));
    }

    EntryHeader h;
    uint64_t pos = offset;
    uint8_t c = data[pos++];
    h.kind = (c >> 4) & 0x7;
    h.size = c & 0x0f;
    unsigned shift = 4;
    while (c & 0x80) {
        if (pos >= end || shift > 57) corrupt(packPath, "bad entry header at offset " + std::to_string(offset));
        c = data[pos++];
        h.size |= uint64_t(c & 0x7f) << shift;
        shift += 7;
    }

    switch (h.kind) {
        case KindCommit:
        case KindTree:
        case KindBlob:
        case KindTag:
            break;
        case KindOfsDelta: {
            if (pos >= end) corrupt(packPath, "truncated delta offset at " + std::to_string(offset));
            c = data[pos++];
            uint64_t back = c & 0x7f;
            while (c & 0x80) {
                if (pos >= end || back > (UINT64_MAX >> 8)) {
                    corrupt(packPath, "bad delta offset at " + std::to_string(offset));
                }
                c = data[pos++];
                back = ((back + 1) << 7) | (c & 0x7f);
            }
            if (back == 0 || back > offset) {
                corrupt(packPath, "delta base outside pack at " + std::to_string(offset));
            }
            h.baseOffset = offset - back;
            break;
        }
        case KindRefDelta: {
            if (pos + 20 > end) corrupt(packPath, "truncated delta base id at " + std::to_string(offset));
            RawId base{};
            std::memcpy(base.data(), data + pos, 20);
            pos += 20;
            auto baseOffset = lookup(base);
            if (!baseOffset) {
                corrupt(packPath, "unresolvable delta base " + IHasher::toHex(base.data(), base.size()));
            }
            h.baseOffset = *baseOffset;
            break;
        }
        default:
            corrupt(packPath, "invalid entry type " + std::to_string(h.kind) + " at offset " + std::to_string(offset));
    }
    h.dataOffset = pos;
    return h;
}

std::string PackFile::inflateEntry(const EntryHeader& header, size_t* consumed) const {
    const uint64_t end = size - TRAILER_SIZE;
    if (header.dataOffset >= end) corrupt(packPath, "entry data outside pack");
    std::string out;
    try {
        out = zlib::inflatePrefix(data + header.dataOffset, end - header.dataOffset, header.size, consumed);
    } catch (const StoreError& e) {
        corrupt(packPath, std::string(e.what()) + " at offset " + std::to_string(header.dataOffset));
    }
    if (out.size() != header.size) {
        corrupt(packPath, "entry size mismatch at offset " + std::to_string(header.dataOffset));
    }
    return out;
}

PackedObject PackFile::getObject(uint64_t offset) const {
    std::vector<EntryHeader> chain;
    EntryHeader h = readHeader(offset);
    while (isDelta(h.kind)) {
        chain.push_back(h);
        if (chain.size() > Constants::MAX_DELTA_CHAIN) corrupt(packPath, "delta chain too long");
        h = readHeader(h.baseOffset);
    }

    PackedObject obj;
    obj.type = kindToType(h.kind);
    obj.data = inflateEntry(h);
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        obj.data = applyDelta(obj.data, inflateEntry(*it));
    }
    return obj;
}

std::string PackFile::applyDelta(const std::string& base, const std::string& delta) {
    size_t pos = 0;
    auto readSize = [&](const char* what) {
        uint64_t value = 0;
        unsigned shift = 0;
        uint8_t b;
        do {
            if (pos >= delta.size() || shift > 63) {
                throw StoreError(ErrorCode::CorruptObject, std::string("truncated delta ") + what);
            }
            b = static_cast<uint8_t>(delta[pos++]);
            value |= uint64_t(b & 0x7f) << shift;
            shift += 7;
        } while (b & 0x80);
        return value;
    };

    uint64_t srcSize = readSize("source size");
    uint64_t dstSize = readSize("target size");
    if (srcSize != base.size()) {
        throw StoreError(ErrorCode::CorruptObject, "delta base size mismatch");
    }

    std::string result;
    result.reserve(dstSize);
    while (pos < delta.size()) {
        uint8_t cmd = static_cast<uint8_t>(delta[pos++]);
        if (cmd & 0x80) {
            uint64_t copyOff = 0, copySize = 0;
            for (int i = 0; i < 4; ++i) {
                if (cmd & (1 << i)) {
                    if (pos >= delta.size()) throw StoreError(ErrorCode::CorruptObject, "truncated delta copy");
                    copyOff |= uint64_t(static_cast<uint8_t>(delta[pos++])) << (8 * i);
                }
            }
            for (int i = 0; i < 3; ++i) {
                if (cmd & (0x10 << i)) {
                    if (pos >= delta.size()) throw StoreError(ErrorCode::CorruptObject, "truncated delta copy");
                    copySize |= uint64_t(static_cast<uint8_t>(delta[pos++])) << (8 * i);
                }
            }
            if (copySize == 0) copySize = 0x10000;
            if (copyOff + copySize > base.size()) {
                throw StoreError(ErrorCode::CorruptObject, "delta copy outside base");
            }
            result.append(base, copyOff, copySize);
        } else if (cmd != 0) {
            if (pos + cmd > delta.size()) throw StoreError(ErrorCode::CorruptObject, "truncated delta insert");
            result.append(delta, pos, cmd);
            pos += cmd;
        } else {
            throw StoreError(ErrorCode::CorruptObject, "reserved delta opcode");
        }
    }

    if (result.size() != dstSize) {
        throw StoreError(ErrorCode::CorruptObject, "delta result size mismatch");
    }
    return result;
}

}
