#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace gitcask {

enum class ErrorCode {
    None = 0,
    InvalidArgs,
    NotARepository,
    IoError,
    NotFound,
    Ambiguous,
    CorruptObject,
    TypeMismatch,
    LockError,
    SubprocessFailure,
    InternalError
};

/// Stable lowercase name of an error code ("not-found", "corrupt-object", ...)
const char* errorCodeName(ErrorCode code);

struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
};

/**
 * @brief Exception form of Error
 *
 * Raised by transactional operations, where unwinding drives rollback.
 * Lookups report the same codes through Expected instead.
 */
class StoreError : public std::runtime_error {
public:
    StoreError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}
    explicit StoreError(const Error& err) : StoreError(err.code, err.message) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

template <typename T>
class Expected {
public:
    Expected(const T& value) : hasValue(true), value_(value) {}
    Expected(T&& value) : hasValue(true), value_(std::move(value)) {}
    Expected(const Error& err) : hasValue(false), error_(err) {}
    Expected(Error&& err) : hasValue(false), error_(std::move(err)) {}

    bool has_value() const { return hasValue; }
    explicit operator bool() const { return hasValue; }
    const T& value() const { return value_; }
    T& value() { return value_; }
    const Error& error() const { return error_; }

    /// Value, or the error raised as StoreError
    T& valueOrThrow() {
        if (!hasValue) throw StoreError(error_);
        return value_;
    }
    const T& valueOrThrow() const {
        if (!hasValue) throw StoreError(error_);
        return value_;
    }

private:
    bool hasValue{false};
    T value_{};
    Error error_{};
};

template <>
class Expected<void> {
public:
    Expected() : ok(true) {}
    Expected(const Error& err) : ok(false), error_(err) {}
    Expected(Error&& err) : ok(false), error_(std::move(err)) {}
    bool has_value() const { return ok; }
    explicit operator bool() const { return ok; }
    const Error& error() const { return error_; }

    void valueOrThrow() const {
        if (!ok) throw StoreError(error_);
    }

private:
    bool ok{false};
    Error error_{};
};

}
