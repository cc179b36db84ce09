#pragma once

#include <memory>
#include <optional>
#include <string>

namespace gitcask {

/// The closed set of object type tags; anything else fails to decode
enum class ObjectType { Blob, Tree, Commit, Tag };

const char* typeName(ObjectType type);
std::optional<ObjectType> parseObjectType(const std::string& name);

/**
 * @brief A decoded object: type tag, id and payload (no header)
 *
 * Owned by the ObjectStore cache and handed out as ObjectPtr, so callers
 * share one immutable copy.
 */
struct Object {
    ObjectType type{ObjectType::Blob};
    std::string id;      // 40-char lowercase hex
    std::string data;    // payload bytes
};

using ObjectPtr = std::shared_ptr<const Object>;

}
