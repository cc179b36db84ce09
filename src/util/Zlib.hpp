#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace gitcask::zlib {

/// Deflate a buffer into a single zlib stream
std::vector<uint8_t> compress(const std::string& data);

/**
 * @brief Inflate one complete zlib stream
 *
 * Throws StoreError(CorruptObject) when the stream is malformed, fails its
 * Adler-32 check, or ends before Z_STREAM_END.
 */
std::string decompress(const uint8_t* data, size_t len);
inline std::string decompress(const std::vector<uint8_t>& data) {
    return decompress(data.data(), data.size());
}

/**
 * @brief Inflate a zlib stream embedded in a larger buffer
 *
 * Stops at Z_STREAM_END and reports how many input bytes the stream used,
 * which is how pack entries are delimited.
 */
std::string inflatePrefix(const uint8_t* data, size_t len, size_t sizeHint, size_t* consumed);

}
