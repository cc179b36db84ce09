#include "core/CommitObject.hpp"

#include "core/Constants.hpp"
#include "core/Envelope.hpp"
#include "util/Expected.hpp"

namespace gitcask {

namespace {
    std::string headerHash(const std::string& line, size_t prefixLen, const std::string& what) {
        std::string hash = line.substr(prefixLen);
        while (!hash.empty() && (hash.back() == ' ' || hash.back() == '\t' || hash.back() == '\r')) {
            hash.pop_back();
        }
        if (hash.size() != Constants::SHA1_HEX_LENGTH || !isHexKey(hash)) {
            throw StoreError(ErrorCode::CorruptObject, "Invalid " + what + " hash in commit: '" + hash + "'");
        }
        return hash;
    }
}

std::string Signature::toString() const {
    return name + " <" + email + "> " + std::to_string(timestamp) + " " + timezone;
}

Signature Signature::parse(const std::string& line) {
    size_t emailStart = line.find('<');
    size_t emailEnd = line.find('>', emailStart == std::string::npos ? 0 : emailStart);
    if (emailStart == std::string::npos || emailEnd == std::string::npos) {
        throw StoreError(ErrorCode::CorruptObject, "Invalid signature: " + line);
    }
    Signature sig;
    sig.name = line.substr(0, emailStart);
    if (!sig.name.empty() && sig.name.back() == ' ') sig.name.pop_back();
    sig.email = line.substr(emailStart + 1, emailEnd - emailStart - 1);

    std::string rest = emailEnd + 1 < line.size() ? line.substr(emailEnd + 1) : "";
    size_t tsStart = rest.find_first_not_of(' ');
    if (tsStart != std::string::npos) {
        size_t tsEnd = rest.find(' ', tsStart);
        std::string ts = rest.substr(tsStart, tsEnd == std::string::npos ? std::string::npos : tsEnd - tsStart);
        try {
            sig.timestamp = std::stoll(ts);
        } catch (const std::exception&) {
            throw StoreError(ErrorCode::CorruptObject, "Invalid signature timestamp: " + line);
        }
        if (tsEnd != std::string::npos) {
            sig.timezone = rest.substr(tsEnd + 1);
        }
    }
    return sig;
}

CommitObject parseCommit(const std::string& content, const std::string& hash) {
    CommitObject commit;
    commit.hash = hash;

    size_t pos = 0;
    bool sawTree = false;
    while (pos < content.size()) {
        size_t eol = content.find('\n', pos);
        if (eol == std::string::npos) eol = content.size();
        std::string line = content.substr(pos, eol - pos);
        pos = eol + 1;

        if (line.empty()) {
            // Blank line marks start of message
            commit.message = pos < content.size() ? content.substr(pos) : "";
            break;
        }

        if (line.rfind("tree ", 0) == 0) {
            commit.treeHash = headerHash(line, 5, "tree");
            sawTree = true;
        } else if (line.rfind("parent ", 0) == 0) {
            commit.parentHashes.push_back(headerHash(line, 7, "parent"));
        } else if (line.rfind("author ", 0) == 0) {
            commit.author = Signature::parse(line.substr(7));
        } else if (line.rfind("committer ", 0) == 0) {
            commit.committer = Signature::parse(line.substr(10));
        }
        // Other headers (encoding, gpgsig, mergetag) are not interpreted
    }

    if (!sawTree) {
        throw StoreError(ErrorCode::CorruptObject, "Commit has no tree: " + hash);
    }
    return commit;
}

std::string serializeCommit(const CommitObject& commit) {
    std::string out = "tree " + commit.treeHash + "\n";
    for (const auto& parent : commit.parentHashes) {
        out += "parent " + parent + "\n";
    }
    out += "author " + commit.author.toString() + "\n";
    out += "committer " + commit.committer.toString() + "\n";
    out += "\n";
    out += commit.message;
    return out;
}

}
