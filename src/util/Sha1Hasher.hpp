#pragma once

#include "util/IHasher.hpp"

#include <array>
#include <cstdint>

namespace gitcask {

/// Streaming SHA-1 (FIPS 180-4), 20-byte digests
class Sha1Hasher : public IHasher {
public:
    Sha1Hasher();

    void reset() override;
    void update(const uint8_t* data, size_t len) override;
    void update(const std::string& data) override;
    std::vector<uint8_t> digest() override;
    const char* name() const override { return "sha1"; }
    size_t digestSize() const override { return 20; }

private:
    void processBlock(const uint8_t* block);

    std::array<uint32_t, 5> h{};
    std::array<uint8_t, 64> pending{};
    size_t pendingLen{0};
    uint64_t totalLen{0};
};

}
