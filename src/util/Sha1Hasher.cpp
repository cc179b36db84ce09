#include "util/Sha1Hasher.hpp"

#include <algorithm>
#include <cstring>

namespace gitcask {

namespace {

inline uint32_t rotl(uint32_t x, uint32_t n) { return (x << n) | (x >> (32 - n)); }

inline uint32_t loadBe32(const uint8_t* p) {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
}

}

Sha1Hasher::Sha1Hasher() { reset(); }

void Sha1Hasher::reset() {
    h = {0x67452301u, 0xEFCDAB89u, 0x98BADCFEu, 0x10325476u, 0xC3D2E1F0u};
    pending.fill(0);
    pendingLen = 0;
    totalLen = 0;
}

void Sha1Hasher::update(const uint8_t* data, size_t len) {
    totalLen += len;
    if (pendingLen > 0) {
        size_t take = std::min(len, pending.size() - pendingLen);
        std::memcpy(pending.data() + pendingLen, data, take);
        pendingLen += take;
        data += take;
        len -= take;
        if (pendingLen < pending.size()) return;
        processBlock(pending.data());
        pendingLen = 0;
    }
    while (len >= 64) {
        processBlock(data);
        data += 64;
        len -= 64;
    }
    if (len > 0) {
        std::memcpy(pending.data(), data, len);
        pendingLen = len;
    }
}

void Sha1Hasher::update(const std::string& data) {
    update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::vector<uint8_t> Sha1Hasher::digest() {
    const uint64_t bitLen = totalLen * 8;

    uint8_t tail[128] = {0};
    std::memcpy(tail, pending.data(), pendingLen);
    tail[pendingLen] = 0x80;
    const size_t tailLen = pendingLen < 56 ? 64 : 128;
    for (int i = 0; i < 8; ++i) {
        tail[tailLen - 1 - i] = static_cast<uint8_t>(bitLen >> (8 * i));
    }
    processBlock(tail);
    if (tailLen == 128) processBlock(tail + 64);

    std::vector<uint8_t> out(20);
    for (size_t i = 0; i < h.size(); ++i) {
        out[i * 4 + 0] = static_cast<uint8_t>(h[i] >> 24);
        out[i * 4 + 1] = static_cast<uint8_t>(h[i] >> 16);
        out[i * 4 + 2] = static_cast<uint8_t>(h[i] >> 8);
        out[i * 4 + 3] = static_cast<uint8_t>(h[i]);
    }
    reset();
    return out;
}

void Sha1Hasher::processBlock(const uint8_t* block) {
    uint32_t w[80];
    for (int i = 0; i < 16; ++i) w[i] = loadBe32(block + i * 4);
    for (int i = 16; i < 80; ++i) w[i] = rotl(w[i - 3] ^ w[i - 8] ^ w[i - 14] ^ w[i - 16], 1);

    uint32_t a = h[0], b = h[1], c = h[2], d = h[3], e = h[4];
    for (int i = 0; i < 80; ++i) {
        uint32_t f, k;
        switch (i / 20) {
            case 0: f = (b & c) | (~b & d);          k = 0x5A827999u; break;
            case 1: f = b ^ c ^ d;                   k = 0x6ED9EBA1u; break;
            case 2: f = (b & c) | (b & d) | (c & d); k = 0x8F1BBCDCu; break;
            default: f = b ^ c ^ d;                  k = 0xCA62C1D6u; break;
        }
        uint32_t t = rotl(a, 5) + f + e + k + w[i];
        e = d;
        d = c;
        c = rotl(b, 30);
        b = a;
        a = t;
    }
    h[0] += a;
    h[1] += b;
    h[2] += c;
    h[3] += d;
    h[4] += e;
}

}
