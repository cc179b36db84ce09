#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace gitcask {

/**
 * @brief Author/committer line: "Name <email> <unix seconds> <+HHMM>"
 */
struct Signature {
    std::string name;
    std::string email;
    int64_t timestamp{0};
    std::string timezone{"+0000"};

    std::string toString() const;
    /// Parse the text after "author "/"committer "; throws StoreError(CorruptObject)
    static Signature parse(const std::string& line);
};

/**
 * @brief Parsed commit object
 *
 * Git commit format:
 *   tree <hash>
 *   parent <hash>            (zero or more)
 *   author <signature>
 *   committer <signature>
 *
 *   <message>
 */
struct CommitObject {
    std::string hash;                       // id of this commit (empty until stored)
    std::string treeHash;
    std::vector<std::string> parentHashes;  // 0 for root, 1+ for merges
    Signature author;
    Signature committer;
    std::string message;

    std::string shortMessage() const {
        size_t newlinePos = message.find('\n');
        if (newlinePos != std::string::npos) {
            return message.substr(0, newlinePos);
        }
        return message;
    }

    std::string shortHash() const {
        return hash.length() >= 7 ? hash.substr(0, 7) : hash;
    }
};

/// Parse a commit payload; a missing tree header is CorruptObject
CommitObject parseCommit(const std::string& payload, const std::string& hash = "");

/// Payload for a commit; the message is written verbatim
std::string serializeCommit(const CommitObject& commit);

}
