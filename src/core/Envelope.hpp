#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "core/Object.hpp"

namespace gitcask {

class IHasher;

/**
 * @brief Loose object framing
 *
 * An envelope is "<type> <size>\0<payload>"; a loose object file is that
 * envelope deflated into one zlib stream. The object id is the SHA-1 of the
 * uncompressed envelope.
 */
struct Envelope {
    ObjectType type{ObjectType::Blob};
    std::string payload;
};

/// "<type> <size>\0"
std::string envelopeHeader(ObjectType type, size_t size);

/// Hex digest of the envelope for (type, payload)
std::string digestOf(ObjectType type, const std::string& payload, IHasher& hasher);
std::string digestOf(ObjectType type, const std::string& payload);

/**
 * @brief Cheap check that a buffer starts like a zlib stream
 *
 * True when the first byte is 0x78 and the big-endian 16-bit value of the
 * first two bytes is a multiple of 31 (the zlib FCHECK property).
 */
bool isLegacyFrame(const uint8_t* data, size_t len);
inline bool isLegacyFrame(const std::vector<uint8_t>& buf) { return isLegacyFrame(buf.data(), buf.size()); }

/// Deflate the envelope for (type, payload)
std::vector<uint8_t> encodeFrame(ObjectType type, const std::string& payload);

/**
 * @brief Inflate and split a loose object
 *
 * Throws StoreError(CorruptObject) on inflate failure, a missing NUL or
 * space, an unknown type tag, or a payload whose length differs from the
 * declared size.
 */
Envelope decodeFrame(const std::vector<uint8_t>& buf);

/// True for 1..40 hex characters (either case)
bool isHexKey(const std::string& key);

}
