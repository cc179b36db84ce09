#include "core/TypedObject.hpp"

#include "util/Expected.hpp"

namespace gitcask {

TypedObject parseObject(const Object& object) {
    switch (object.type) {
        case ObjectType::Blob:
            return BlobObject{object.id, object.data};
        case ObjectType::Tree:
            return parseTree(object.data);
        case ObjectType::Commit:
            return parseCommit(object.data, object.id);
        case ObjectType::Tag:
            return parseTag(object.data, object.id);
    }
    throw StoreError(ErrorCode::CorruptObject, "Unknown object type for " + object.id);
}

}
