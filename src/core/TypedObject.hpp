#pragma once

#include <string>
#include <variant>

#include "core/CommitObject.hpp"
#include "core/Object.hpp"
#include "core/TagObject.hpp"
#include "core/TreeObject.hpp"

namespace gitcask {

struct BlobObject {
    std::string hash;
    std::string data;
};

/// Decoded view of an Object, one alternative per ObjectType
using TypedObject = std::variant<BlobObject, TreeObject, CommitObject, TagObject>;

/// Parse the payload according to the type tag; throws StoreError(CorruptObject)
TypedObject parseObject(const Object& object);

}
