#include "core/RefStore.hpp"

#include <fstream>
#include <sstream>

#include "core/Constants.hpp"
#include "core/Envelope.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace gitcask {

namespace {
    std::string trim(const std::string& s) {
        size_t first = s.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return "";
        size_t last = s.find_last_not_of(" \t\r\n");
        return s.substr(first, last - first + 1);
    }

    bool endsWith(const std::string& s, const std::string& suffix) {
        return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    bool isFullId(const std::string& s) {
        return s.size() == Constants::SHA1_HEX_LENGTH && isHexKey(s);
    }
}

fs::path RefStore::headPath(const std::string& branch) const {
    return gitDir / Paths::REFS_HEADS / branch;
}

fs::path RefStore::packedRefsPath() const {
    return gitDir / Paths::PACKED_REFS;
}

fs::path RefStore::lockPath(const std::string& branch) const {
    fs::path p = headPath(branch);
    p += Paths::LOCK_SUFFIX;
    return p;
}

std::string RefStore::headsRef(const std::string& branch) {
    return std::string(Paths::REFS_HEADS) + "/" + branch;
}

bool RefStore::isValidBranchName(const std::string& branch) {
    if (branch.empty() || branch.front() == '/' || branch.back() == '/') return false;
    if (branch.find("..") != std::string::npos) return false;
    if (endsWith(branch, Paths::LOCK_SUFFIX)) return false;
    for (char c : branch) {
        if (c == '\0' || c == '\n' || c == ' ' || c == '\\') return false;
    }
    return true;
}

Expected<std::optional<std::string>> RefStore::readHead(const std::string& branch) const {
    if (!isValidBranchName(branch)) {
        return Error{ErrorCode::InvalidArgs, "Invalid branch name: " + branch};
    }

    fs::path path = headPath(branch);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return readPackedHead(branch);
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "Failed to read branch reference: " + path.string()};
    }
    std::stringstream ss;
    ss << in.rdbuf();
    std::string id = trim(ss.str());
    if (id.empty()) return std::optional<std::string>();
    if (!isFullId(id)) {
        return Error{ErrorCode::CorruptObject, "Malformed branch reference " + headsRef(branch) + ": " + id};
    }
    return std::optional<std::string>(id);
}

Expected<std::optional<std::string>> RefStore::readPackedHead(const std::string& branch) const {
    fs::path path = packedRefsPath();
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return std::optional<std::string>();

    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::IoError, "Failed to read " + path.string()};
    }

    const std::string wanted = headsRef(branch);
    std::string line;
    while (std::getline(in, line)) {
        // "# pack-refs with: ..." header and "^<id>" peeled-tag lines
        if (line.empty() || line[0] == '#' || line[0] == '^') continue;
        size_t space = line.find(' ');
        if (space == std::string::npos) continue;
        if (trim(line.substr(space + 1)) != wanted) continue;

        std::string id = line.substr(0, space);
        if (!isFullId(id)) {
            return Error{ErrorCode::CorruptObject, "Malformed packed reference " + wanted + ": " + id};
        }
        return std::optional<std::string>(id);
    }
    return std::optional<std::string>();
}

Expected<void> RefStore::writeHead(const std::string& branch, const std::string& id) const {
    if (!isValidBranchName(branch)) {
        return Error{ErrorCode::InvalidArgs, "Invalid branch name: " + branch};
    }
    if (!isFullId(id)) {
        return Error{ErrorCode::InvalidArgs, "Not a full object id: " + id};
    }

    fs::path path = headPath(branch);
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return Error{ErrorCode::IoError, "Failed to create ref directory: " + ec.message()};
    }

    fs::path tmpPath = path;
    tmpPath += ".tmp";
    {
        std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::IoError, "Failed to open " + tmpPath.string() + " for writing"};
        }
        out << id;
        out.flush();
        if (!out.good()) {
            out.close();
            fs::remove(tmpPath, ec);
            return Error{ErrorCode::IoError, "Failed to write branch reference " + headsRef(branch)};
        }
    }

    fs::rename(tmpPath, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmpPath, ignored);
        return Error{ErrorCode::IoError, "Failed to update " + headsRef(branch) + ": " + ec.message()};
    }
    Logger::instance().debug("Updated " + headsRef(branch) + " to " + id);
    return {};
}

}
