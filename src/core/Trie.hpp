#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gitcask {

/**
 * @brief Path-compressed 16-ary radix tree keyed by hex digests
 *
 * Each edge carries a run of hex digits; a node branches on the next digit.
 * Lookup cost depends on the key length, not on the number of entries.
 *
 * find() takes either a full key (at most one result when all keys have the
 * same length) or an abbreviation, in which case every entry whose key
 * starts with it is returned. Keys are case-insensitive; keys containing a
 * non-hex character are rejected by insert and match nothing in find.
 *
 * Not synchronized.
 */
template <typename V>
class Trie {
public:
    using Entry = std::pair<std::string, V>;

    Trie() : root(std::make_unique<Node>()) {}

    Trie(const Trie&) = delete;
    Trie& operator=(const Trie&) = delete;
    Trie(Trie&&) noexcept = default;
    Trie& operator=(Trie&&) noexcept = default;

    /// Insert or overwrite; returns false (and stores nothing) for a non-hex key
    bool insert(const std::string& rawKey, V value) {
        std::string key;
        if (!normalize(rawKey, key) || key.empty()) return false;

        Node* node = root.get();
        size_t pos = 0;
        while (pos < key.size()) {
            auto& slot = node->children[digit(key[pos])];
            if (!slot) {
                slot = std::make_unique<Node>();
                slot->label = key.substr(pos);
                slot->value = std::move(value);
                ++count;
                return true;
            }

            size_t common = commonPrefix(slot->label, key, pos);
            if (common < slot->label.size()) {
                // Split the edge at the first differing digit
                auto mid = std::make_unique<Node>();
                mid->label = slot->label.substr(0, common);
                slot->label.erase(0, common);
                size_t childDigit = digit(slot->label[0]);
                mid->children[childDigit] = std::move(slot);
                slot = std::move(mid);
            }
            node = slot.get();
            pos += common;
        }

        if (!node->value) ++count;
        node->value = std::move(value);
        return true;
    }

    /**
     * @brief All entries whose key starts with `rawKey`
     * @param limit Stop after this many results (0 = no limit)
     */
    std::vector<Entry> find(const std::string& rawKey, size_t limit = 0) const {
        std::vector<Entry> out;
        std::string key;
        if (!normalize(rawKey, key)) return out;

        const Node* node = root.get();
        std::string path;
        size_t pos = 0;
        while (pos < key.size()) {
            const Node* child = node->children[digit(key[pos])].get();
            if (!child) return out;

            size_t remaining = key.size() - pos;
            if (child->label.size() >= remaining) {
                if (child->label.compare(0, remaining, key, pos, remaining) != 0) return out;
                collect(child, path + child->label, limit, out);
                return out;
            }
            if (key.compare(pos, child->label.size(), child->label) != 0) return out;
            path += child->label;
            pos += child->label.size();
            node = child;
        }
        collect(node, path, limit, out);
        return out;
    }

    /// Exact lookup
    std::optional<V> get(const std::string& key) const {
        auto hits = find(key);
        for (auto& hit : hits) {
            if (hit.first.size() == key.size()) return std::move(hit.second);
        }
        return std::nullopt;
    }

    size_t size() const { return count; }
    bool empty() const { return count == 0; }

    void clear() {
        root = std::make_unique<Node>();
        count = 0;
    }

private:
    struct Node {
        std::string label;  // hex digits on the edge leading here
        std::array<std::unique_ptr<Node>, 16> children;
        std::optional<V> value;
    };

    static size_t digit(char c) {
        return c <= '9' ? static_cast<size_t>(c - '0') : static_cast<size_t>(c - 'a' + 10);
    }

    static bool normalize(const std::string& in, std::string& out) {
        out.resize(in.size());
        for (size_t i = 0; i < in.size(); ++i) {
            char c = in[i];
            if (c >= 'A' && c <= 'F') c = static_cast<char>(c - 'A' + 'a');
            if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
            out[i] = c;
        }
        return true;
    }

    static size_t commonPrefix(const std::string& label, const std::string& key, size_t pos) {
        size_t n = 0;
        while (n < label.size() && pos + n < key.size() && label[n] == key[pos + n]) ++n;
        return n;
    }

    static bool collect(const Node* node, const std::string& prefix, size_t limit, std::vector<Entry>& out) {
        if (node->value) {
            out.emplace_back(prefix, *node->value);
            if (limit != 0 && out.size() >= limit) return false;
        }
        for (const auto& child : node->children) {
            if (child && !collect(child.get(), prefix + child->label, limit, out)) return false;
        }
        return true;
    }

    std::unique_ptr<Node> root;
    size_t count{0};
};

}
