#include "core/GitCommandClient.hpp"

#include <cstdlib>
#include <sstream>

#include "util/Expected.hpp"
#include "util/Subprocess.hpp"

namespace fs = std::filesystem;

namespace gitcask {

namespace {
    // %x00 separates the header block from the message, and entries from each other
    const char* LOG_FORMAT = "--format=tformat:%H%n%P%n%T%n%an%n%ae%n%at%n%cn%n%ce%n%ct%n%x00%s%n%b%x00";

    std::string trimNewlines(const std::string& s) {
        size_t first = s.find_first_not_of('\n');
        if (first == std::string::npos) return "";
        size_t last = s.find_last_not_of('\n');
        return s.substr(first, last - first + 1);
    }

    std::string chomp(std::string s) {
        while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
        return s;
    }

    int64_t toSeconds(const std::string& s) {
        try {
            return std::stoll(s);
        } catch (const std::exception&) {
            throw StoreError(ErrorCode::SubprocessFailure, "Unexpected timestamp in log output: " + s);
        }
    }

    bool isEmptyHistory(const std::string& message) {
        return message.find("bad default revision") != std::string::npos ||
               message.find("does not have any commits yet") != std::string::npos ||
               message.find("unknown revision") != std::string::npos;
    }
}

GitCommandClient::GitCommandClient(const fs::path& dir) : gitDir(dir) {
    const char* env = std::getenv("GITCASK_GIT");
    program = (env && *env) ? env : "git";
}

std::string GitCommandClient::run(const std::string& subcommand, const std::vector<std::string>& args) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(subcommand);
    argv.insert(argv.end(), args.begin(), args.end());

    ProcessResult result = runCommand(program, argv, {"GIT_DIR=" + gitDir.string()});
    std::string out = chomp(result.output);
    if (result.exitStatus != 0) {
        if (result.exitStatus == 1 && out.empty()) return "";
        std::string cmd = program;
        for (const auto& a : argv) cmd += " " + shellQuote(a);
        throw StoreError(ErrorCode::SubprocessFailure, cmd + ": " + out);
    }
    return out;
}

std::vector<LogEntry> GitCommandClient::parseLog(const std::string& output) {
    std::vector<std::string> pieces;
    std::string piece;
    std::istringstream in(output);
    while (std::getline(in, piece, '\0')) pieces.push_back(trimNewlines(piece));

    std::vector<LogEntry> entries;
    for (size_t i = 0; i + 1 < pieces.size(); i += 2) {
        std::vector<std::string> lines;
        std::istringstream header(pieces[i]);
        std::string line;
        while (std::getline(header, line)) lines.push_back(line);
        if (lines.size() < 9) {
            throw StoreError(ErrorCode::SubprocessFailure, "Unexpected log output: " + pieces[i]);
        }

        LogEntry e;
        e.id = lines[0];
        std::istringstream parents(lines[1]);
        std::string parent;
        while (parents >> parent) e.parents.push_back(parent);
        e.tree = lines[2];
        e.author.name = lines[3];
        e.author.email = lines[4];
        e.author.timestamp = toSeconds(lines[5]);
        e.committer.name = lines[6];
        e.committer.email = lines[7];
        e.committer.timestamp = toSeconds(lines[8]);
        e.message = pieces[i + 1];
        entries.push_back(std::move(e));
    }
    return entries;
}

std::vector<LogEntry> GitCommandClient::log(size_t limit, const std::string& start, const std::string& path) {
    std::vector<std::string> args{LOG_FORMAT, "-" + std::to_string(limit)};
    if (!start.empty()) args.push_back(start);
    if (!path.empty()) {
        args.push_back("--");
        args.push_back(path);
    }
    try {
        return parseLog(run("log", args));
    } catch (const StoreError& e) {
        if (e.code() == ErrorCode::SubprocessFailure && isEmptyHistory(e.what())) return {};
        throw;
    }
}

DiffResult GitCommandClient::diff(const std::string& from, const std::string& to, const std::string& path) {
    std::vector<std::string> args{"--full-index", from, to};
    if (!path.empty()) {
        args.push_back("--");
        args.push_back(path);
    }
    return DiffResult{from, to, run("diff", args)};
}

std::string GitCommandClient::configGet(const std::string& key) {
    return run("config", {key});
}

void GitCommandClient::init(bool bare) {
    std::vector<std::string> args;
    if (bare) args.push_back("--bare");
    run("init", args);
}

}
