#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace gitcask {

/**
 * @brief Strategy interface for the object digest algorithm
 *
 * Object ids are the hex digest of "<type> <size>\0<payload>". Only SHA-1
 * is registered; the interface keeps the store independent of it.
 */
class IHasher {
public:
    virtual ~IHasher() = default;

    virtual void reset() = 0;
    virtual void update(const uint8_t* data, size_t len) = 0;
    virtual void update(const std::string& data) = 0;

    /// Finalize and return digest bytes; the hasher is reset afterwards
    virtual std::vector<uint8_t> digest() = 0;

    virtual const char* name() const = 0;
    virtual size_t digestSize() const = 0;

    /// Finalize and return the lowercase hex digest
    std::string hexDigest() { return toHex(digest()); }

    static std::string toHex(const std::vector<uint8_t>& bytes);
    static std::string toHex(const uint8_t* bytes, size_t len);

    /// Parse lowercase/uppercase hex into bytes; false on odd length or bad digit
    static bool fromHex(const std::string& hex, std::vector<uint8_t>& out);
};

class HasherFactory {
public:
    /// SHA-1, the algorithm git object ids use
    static std::unique_ptr<IHasher> createDefault();

    /// Hasher by algorithm name, nullptr when the name is not registered
    static std::unique_ptr<IHasher> create(const std::string& algorithm);
};

}
