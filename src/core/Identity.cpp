#include "core/Identity.hpp"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <ctime>

#include <pwd.h>
#include <unistd.h>

#include "core/VersionControlClient.hpp"

namespace gitcask {

namespace {
    std::string envOr(const char* name) {
        const char* v = std::getenv(name);
        return v ? v : "";
    }

    std::string loginName() {
        if (const char* login = ::getlogin()) return login;
        std::string user = envOr("USER");
        if (!user.empty()) return user;
        if (struct passwd* pw = ::getpwuid(::getuid())) return pw->pw_name;
        return "unknown";
    }

    std::string gecosName(const std::string& login) {
        struct passwd* pw = ::getpwnam(login.c_str());
        if (!pw || !pw->pw_gecos) return login;
        std::string gecos = pw->pw_gecos;
        // GECOS is "Full Name,Room,Phone,..."
        gecos = gecos.substr(0, gecos.find(','));
        return gecos.empty() ? login : gecos;
    }

    std::string hostName() {
        std::array<char, 256> buf{};
        if (::gethostname(buf.data(), buf.size() - 1) != 0) return "localhost";
        return buf.data();
    }
}

std::string localTimezone(int64_t when) {
    std::time_t t = static_cast<std::time_t>(when);
    std::tm local{};
    if (!::localtime_r(&t, &local)) return "+0000";
    long offset = local.tm_gmtoff / 60;
    char sign = offset < 0 ? '-' : '+';
    if (offset < 0) offset = -offset;
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%c%02ld%02ld", sign, offset / 60, offset % 60);
    return buf;
}

Signature Identity::at(int64_t when) const {
    Signature sig;
    sig.name = name;
    sig.email = email;
    sig.timestamp = when;
    sig.timezone = localTimezone(when);
    return sig;
}

Signature Identity::now() const {
    return at(static_cast<int64_t>(std::time(nullptr)));
}

Identity defaultIdentity(VersionControlClient& client) {
    Identity id;
    id.name = envOr("GIT_AUTHOR_NAME");
    id.email = envOr("GIT_AUTHOR_EMAIL");
    if (id.name.empty()) id.name = client.configGet("user.name");
    if (id.email.empty()) id.email = client.configGet("user.email");

    if (id.name.empty() || id.email.empty()) {
        std::string login = loginName();
        if (id.name.empty()) id.name = gecosName(login);
        if (id.email.empty()) id.email = login + "@" + hostName();
    }
    return id;
}

}
