#include "util/Expected.hpp"

namespace gitcask {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::InvalidArgs: return "invalid-args";
        case ErrorCode::NotARepository: return "not-a-repository";
        case ErrorCode::IoError: return "io-error";
        case ErrorCode::NotFound: return "not-found";
        case ErrorCode::Ambiguous: return "ambiguous";
        case ErrorCode::CorruptObject: return "corrupt-object";
        case ErrorCode::TypeMismatch: return "type-mismatch";
        case ErrorCode::LockError: return "lock-error";
        case ErrorCode::SubprocessFailure: return "subprocess-failure";
        case ErrorCode::InternalError: return "internal-error";
    }
    return "unknown";
}

}
