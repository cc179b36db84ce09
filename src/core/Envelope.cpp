#include "core/Envelope.hpp"

#include <algorithm>
#include <cctype>

#include "core/Constants.hpp"
#include "util/Expected.hpp"
#include "util/IHasher.hpp"
#include "util/Zlib.hpp"

namespace gitcask {

const char* typeName(ObjectType type) {
    switch (type) {
        case ObjectType::Blob: return "blob";
        case ObjectType::Tree: return "tree";
        case ObjectType::Commit: return "commit";
        case ObjectType::Tag: return "tag";
    }
    return "unknown";
}

std::optional<ObjectType> parseObjectType(const std::string& name) {
    if (name == "blob") return ObjectType::Blob;
    if (name == "tree") return ObjectType::Tree;
    if (name == "commit") return ObjectType::Commit;
    if (name == "tag") return ObjectType::Tag;
    return std::nullopt;
}

std::string envelopeHeader(ObjectType type, size_t size) {
    std::string header = typeName(type);
    header += ' ';
    header += std::to_string(size);
    header += '\0';
    return header;
}

std::string digestOf(ObjectType type, const std::string& payload, IHasher& hasher) {
    hasher.reset();
    hasher.update(envelopeHeader(type, payload.size()));
    hasher.update(payload);
    return hasher.hexDigest();
}

std::string digestOf(ObjectType type, const std::string& payload) {
    auto hasher = HasherFactory::createDefault();
    return digestOf(type, payload, *hasher);
}

bool isLegacyFrame(const uint8_t* data, size_t len) {
    if (len < 2) return false;
    unsigned word = (static_cast<unsigned>(data[0]) << 8) | data[1];
    return data[0] == Constants::ZLIB_CMF_DEFLATE && word % 31 == 0;
}

std::vector<uint8_t> encodeFrame(ObjectType type, const std::string& payload) {
    return zlib::compress(envelopeHeader(type, payload.size()) + payload);
}

Envelope decodeFrame(const std::vector<uint8_t>& buf) {
    std::string raw = zlib::decompress(buf);

    size_t nul = raw.find('\0');
    if (nul == std::string::npos) {
        throw StoreError(ErrorCode::CorruptObject, "object header is not terminated");
    }
    size_t space = raw.find(' ');
    if (space == std::string::npos || space > nul) {
        throw StoreError(ErrorCode::CorruptObject, "object header has no size");
    }

    auto type = parseObjectType(raw.substr(0, space));
    if (!type) {
        throw StoreError(ErrorCode::CorruptObject, "unknown object type '" + raw.substr(0, space) + "'");
    }

    std::string sizeStr = raw.substr(space + 1, nul - space - 1);
    if (sizeStr.empty() || sizeStr.size() > 19 || !std::all_of(sizeStr.begin(), sizeStr.end(),
                                        [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        throw StoreError(ErrorCode::CorruptObject, "object size is not a number");
    }
    size_t declared = std::stoull(sizeStr);
    size_t actual = raw.size() - nul - 1;
    if (actual != declared) {
        throw StoreError(ErrorCode::CorruptObject,
                         "object length mismatch: declared " + sizeStr + ", found " + std::to_string(actual));
    }

    Envelope env;
    env.type = *type;
    env.payload = raw.substr(nul + 1);
    return env;
}

bool isHexKey(const std::string& key) {
    return !key.empty() && key.size() <= Constants::SHA1_HEX_LENGTH &&
           std::all_of(key.begin(), key.end(),
                       [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); });
}

}
