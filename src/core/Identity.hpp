#pragma once

#include <cstdint>
#include <string>

#include "core/CommitObject.hpp"

namespace gitcask {

class VersionControlClient;

/// Name and email recorded as commit author/committer
struct Identity {
    std::string name;
    std::string email;

    /// Signature stamped with `when` in the local timezone
    Signature at(int64_t when) const;

    /// Signature stamped with the current time
    Signature now() const;
};

/**
 * @brief Identity used when a commit names no author
 *
 * Each field is resolved independently, first non-empty wins:
 *   1. GIT_AUTHOR_NAME / GIT_AUTHOR_EMAIL
 *   2. client.configGet("user.name") / ("user.email")
 *   3. the login's passwd GECOS name / "<login>@<hostname>"
 *
 * An unset config key reads as empty; a failing lookup propagates the
 * client's StoreError(SubprocessFailure).
 */
Identity defaultIdentity(VersionControlClient& client);

/// "+HHMM" / "-HHMM" offset of local time at `when`
std::string localTimezone(int64_t when);

}
