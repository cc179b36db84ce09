#pragma once

#include <string>

#include "core/CommitObject.hpp"
#include "core/Object.hpp"

namespace gitcask {

/// Annotated tag: object/type/tag/tagger headers followed by the message
struct TagObject {
    std::string hash;
    std::string objectHash;
    ObjectType objectType{ObjectType::Commit};
    std::string name;
    Signature tagger;
    std::string message;
};

/// Throws StoreError(CorruptObject) when object/type headers are missing or invalid
TagObject parseTag(const std::string& payload, const std::string& hash = "");

}
