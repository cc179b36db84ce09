#include "core/TagObject.hpp"

#include "core/Constants.hpp"
#include "core/Envelope.hpp"
#include "util/Expected.hpp"

namespace gitcask {

TagObject parseTag(const std::string& content, const std::string& hash) {
    TagObject tag;
    tag.hash = hash;
    bool sawObject = false;
    bool sawType = false;

    size_t pos = 0;
    while (pos < content.size()) {
        size_t eol = content.find('\n', pos);
        if (eol == std::string::npos) eol = content.size();
        std::string line = content.substr(pos, eol - pos);
        pos = eol + 1;

        if (line.empty()) {
            tag.message = pos < content.size() ? content.substr(pos) : "";
            break;
        }
        if (line.rfind("object ", 0) == 0) {
            tag.objectHash = line.substr(7);
            if (tag.objectHash.size() != Constants::SHA1_HEX_LENGTH || !isHexKey(tag.objectHash)) {
                throw StoreError(ErrorCode::CorruptObject, "Invalid object hash in tag " + hash);
            }
            sawObject = true;
        } else if (line.rfind("type ", 0) == 0) {
            auto type = parseObjectType(line.substr(5));
            if (!type) {
                throw StoreError(ErrorCode::CorruptObject, "Invalid target type in tag " + hash);
            }
            tag.objectType = *type;
            sawType = true;
        } else if (line.rfind("tag ", 0) == 0) {
            tag.name = line.substr(4);
        } else if (line.rfind("tagger ", 0) == 0) {
            tag.tagger = Signature::parse(line.substr(7));
        }
    }

    if (!sawObject || !sawType) {
        throw StoreError(ErrorCode::CorruptObject, "Tag is missing object/type headers: " + hash);
    }
    return tag;
}

}
