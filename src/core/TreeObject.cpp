#include "core/TreeObject.hpp"

#include <algorithm>

#include "core/Constants.hpp"
#include "util/Expected.hpp"
#include "util/IHasher.hpp"

namespace gitcask {

namespace {
    std::string sortKey(const TreeEntry& e) {
        return e.isTree() ? e.name + "/" : e.name;
    }

    uint32_t parseOctalMode(const std::string& text) {
        if (text.empty() || text.size() > 7) {
            throw StoreError(ErrorCode::CorruptObject, "Invalid tree entry mode: '" + text + "'");
        }
        uint32_t mode = 0;
        for (char c : text) {
            if (c < '0' || c > '7') {
                throw StoreError(ErrorCode::CorruptObject, "Invalid tree entry mode: '" + text + "'");
            }
            mode = (mode << 3) | static_cast<uint32_t>(c - '0');
        }
        return mode;
    }

    std::string formatOctalMode(uint32_t mode) {
        std::string out;
        do {
            out.insert(out.begin(), static_cast<char>('0' + (mode & 7)));
            mode >>= 3;
        } while (mode != 0);
        return out;
    }
}

bool TreeEntry::isTree() const { return mode == Constants::MODE_DIR; }

TreeObject parseTree(const std::string& content) {
    TreeObject tree;
    size_t pos = 0;

    while (pos < content.size()) {
        TreeEntry entry;

        size_t spacePos = content.find(' ', pos);
        if (spacePos == std::string::npos) {
            throw StoreError(ErrorCode::CorruptObject, "Invalid tree entry: missing mode");
        }
        entry.mode = parseOctalMode(content.substr(pos, spacePos - pos));

        size_t nullPos = content.find('\0', spacePos + 1);
        if (nullPos == std::string::npos) {
            throw StoreError(ErrorCode::CorruptObject, "Invalid tree entry: missing null terminator");
        }
        entry.name = content.substr(spacePos + 1, nullPos - spacePos - 1);
        if (entry.name.empty()) {
            throw StoreError(ErrorCode::CorruptObject, "Invalid tree entry: empty name");
        }

        size_t hashStart = nullPos + 1;
        if (hashStart + Constants::SHA1_RAW_LENGTH > content.size()) {
            throw StoreError(ErrorCode::CorruptObject, "Invalid tree entry: incomplete hash");
        }
        entry.hashHex = IHasher::toHex(reinterpret_cast<const uint8_t*>(content.data() + hashStart),
                                       Constants::SHA1_RAW_LENGTH);

        tree.entries.push_back(std::move(entry));
        pos = hashStart + Constants::SHA1_RAW_LENGTH;
    }
    return tree;
}

std::string serializeTree(std::vector<TreeEntry> entries) {
    std::sort(entries.begin(), entries.end(),
              [](const TreeEntry& a, const TreeEntry& b) { return sortKey(a) < sortKey(b); });

    std::string out;
    for (const auto& entry : entries) {
        std::vector<uint8_t> raw;
        if (entry.hashHex.size() != Constants::SHA1_HEX_LENGTH || !IHasher::fromHex(entry.hashHex, raw)) {
            throw StoreError(ErrorCode::InvalidArgs, "Invalid id for tree entry '" + entry.name + "'");
        }
        out += formatOctalMode(entry.mode);
        out += ' ';
        out += entry.name;
        out += '\0';
        out.append(reinterpret_cast<const char*>(raw.data()), raw.size());
    }
    return out;
}

}
