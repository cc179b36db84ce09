#include "util/Zlib.hpp"

#include "util/Expected.hpp"

#include <algorithm>

#include <zlib.h>

namespace gitcask::zlib {

std::vector<uint8_t> compress(const std::string& data) {
    z_stream stream{};
    stream.zalloc = Z_NULL;
    stream.zfree = Z_NULL;
    stream.opaque = Z_NULL;

    if (deflateInit(&stream, Z_DEFAULT_COMPRESSION) != Z_OK) {
        throw StoreError(ErrorCode::InternalError, "zlib deflateInit failed");
    }

    stream.avail_in = static_cast<uInt>(data.size());
    // Some zlib versions have non-const next_in
    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data.data()));

    std::vector<uint8_t> compressed(deflateBound(&stream, static_cast<uLong>(data.size())));
    stream.avail_out = static_cast<uInt>(compressed.size());
    stream.next_out = compressed.data();

    if (deflate(&stream, Z_FINISH) != Z_STREAM_END) {
        deflateEnd(&stream);
        throw StoreError(ErrorCode::InternalError, "zlib deflate failed");
    }

    compressed.resize(stream.total_out);
    deflateEnd(&stream);
    return compressed;
}

std::string inflatePrefix(const uint8_t* data, size_t len, size_t sizeHint, size_t* consumed) {
    z_stream stream{};
    stream.zalloc = Z_NULL;
    stream.zfree = Z_NULL;
    stream.opaque = Z_NULL;

    if (inflateInit(&stream) != Z_OK) {
        throw StoreError(ErrorCode::InternalError, "zlib inflateInit failed");
    }

    stream.avail_in = static_cast<uInt>(len);
    stream.next_in = const_cast<Bytef*>(data);

    std::string out;
    // Deflate never expands more than ~1032:1, so a larger hint is bogus
    out.reserve(std::min<size_t>(sizeHint, len * 1032));
    std::vector<uint8_t> buffer(sizeHint > 0 && sizeHint < 65536 ? sizeHint + 1 : 16384);

    int ret;
    do {
        stream.avail_out = static_cast<uInt>(buffer.size());
        stream.next_out = buffer.data();

        ret = inflate(&stream, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            std::string why = stream.msg ? stream.msg : "truncated stream";
            inflateEnd(&stream);
            throw StoreError(ErrorCode::CorruptObject, "zlib inflate failed: " + why);
        }
        out.append(reinterpret_cast<const char*>(buffer.data()), buffer.size() - stream.avail_out);
    } while (ret != Z_STREAM_END);

    if (consumed) *consumed = len - stream.avail_in;
    inflateEnd(&stream);
    return out;
}

std::string decompress(const uint8_t* data, size_t len) {
    size_t used = 0;
    std::string out = inflatePrefix(data, len, len * 3, &used);
    if (used != len) {
        throw StoreError(ErrorCode::CorruptObject, "trailing bytes after zlib stream");
    }
    return out;
}

}
