#pragma once
#include <string>
#include <utility>

namespace otadump {

enum class ErrorKind : int {
    None = 0,
    // Structural problems with the payload.
    BadMagic,
    UnsupportedVersion,
    ManifestDecodeError,
    MissingField,
    TruncatedBlob,
    SizeMismatch,
    CorruptData,
    // Content does not match its declared digest.
    HashMismatch,
    UnsupportedOperation,
    Io,
    Cancelled,
    Config,
};

enum class ErrorCategory : int {
    None,
    Format,
    Integrity,
    Unsupported,
    Io,
    Cancelled,
    Config,
};

const char* ErrorKindName(ErrorKind kind);
const char* ErrorCategoryName(ErrorCategory category);
ErrorCategory CategoryOf(ErrorKind kind);

struct Result {
    bool ok{true};
    ErrorKind kind{ErrorKind::None};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }
    ErrorCategory category() const { return CategoryOf(kind); }

    static Result Ok() { return {}; }

    // errno-style failure from the I/O layer.
    static Result Fail(int e, std::string m) {
        return {.ok = false, .kind = ErrorKind::Io, .err = e, .msg = std::move(m)};
    }
    static Result Fail(ErrorKind k, std::string m) {
        return {.ok = false, .kind = k, .err = -1, .msg = std::move(m)};
    }
};

} // namespace otadump
