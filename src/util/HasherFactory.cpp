#include "util/IHasher.hpp"
#include "util/Sha1Hasher.hpp"

namespace gitcask {

std::string IHasher::toHex(const uint8_t* bytes, size_t len) {
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out[2*i] = hex[(bytes[i] >> 4) & 0xF];
        out[2*i+1] = hex[bytes[i] & 0xF];
    }
    return out;
}

std::string IHasher::toHex(const std::vector<uint8_t>& bytes) {
    return toHex(bytes.data(), bytes.size());
}

bool IHasher::fromHex(const std::string& hex, std::vector<uint8_t>& out) {
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
        if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
        return -1;
    };
    if (hex.size() % 2 != 0) return false;
    std::vector<uint8_t> bytes(hex.size() / 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        int hi = nibble(hex[2*i]);
        int lo = nibble(hex[2*i+1]);
        if (hi < 0 || lo < 0) return false;
        bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    out = std::move(bytes);
    return true;
}

std::unique_ptr<IHasher> HasherFactory::createDefault() {
    return std::make_unique<Sha1Hasher>();
}

std::unique_ptr<IHasher> HasherFactory::create(const std::string& algorithm) {
    if (algorithm == "sha1") {
        return std::make_unique<Sha1Hasher>();
    }
    return nullptr;
}

}
