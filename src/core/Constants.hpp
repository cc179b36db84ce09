#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @brief Git on-disk constants shared by the store, pack reader and refs
 */
namespace gitcask {

namespace Constants {
    // Object ids
    constexpr size_t SHA1_HEX_LENGTH = 40;        // SHA-1 produces 40-char hex strings
    constexpr size_t SHA1_RAW_LENGTH = 20;
    constexpr size_t MIN_ABBREV_LENGTH = 5;       // Shorter keys are never resolved

    // Loose object fan-out: objects/<first-2-chars>/<remaining-38-chars>
    constexpr size_t OBJECT_DIR_LENGTH = 2;

    // Zlib stream header: CMF byte for deflate with 32K window
    constexpr uint8_t ZLIB_CMF_DEFLATE = 0x78;

    // Pack files
    constexpr uint32_t PACK_SIGNATURE = 0x5041434B;      // "PACK"
    constexpr uint32_t PACK_IDX_SIGNATURE = 0xFF744F63;  // "\377tOc"
    constexpr size_t PACK_IDX_FANOUT = 256;
    constexpr size_t MAX_DELTA_CHAIN = 10000;

    // Tree entry modes (octal)
    constexpr uint32_t MODE_FILE = 0100644;
    constexpr uint32_t MODE_EXECUTABLE = 0100755;
    constexpr uint32_t MODE_SYMLINK = 0120000;
    constexpr uint32_t MODE_DIR = 0040000;
    constexpr uint32_t MODE_GITLINK = 0160000;
}

namespace Paths {
    constexpr const char* GIT_DIR = ".git";
    constexpr const char* OBJECTS = "objects";
    constexpr const char* PACK = "pack";
    constexpr const char* REFS_HEADS = "refs/heads";
    constexpr const char* PACKED_REFS = "packed-refs";
    constexpr const char* LOCK_SUFFIX = ".lock";
    constexpr const char* DEFAULT_BRANCH = "master";
}
}
