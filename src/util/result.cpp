#include "util/result.hpp"

namespace otadump {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                 return "None";
        case ErrorKind::BadMagic:             return "BadMagic";
        case ErrorKind::UnsupportedVersion:   return "UnsupportedVersion";
        case ErrorKind::ManifestDecodeError:  return "ManifestDecodeError";
        case ErrorKind::MissingField:         return "MissingField";
        case ErrorKind::TruncatedBlob:        return "TruncatedBlob";
        case ErrorKind::SizeMismatch:         return "SizeMismatch";
        case ErrorKind::CorruptData:          return "CorruptData";
        case ErrorKind::HashMismatch:         return "HashMismatch";
        case ErrorKind::UnsupportedOperation: return "UnsupportedOperation";
        case ErrorKind::Io:                   return "IoError";
        case ErrorKind::Cancelled:            return "Cancelled";
        case ErrorKind::Config:               return "ConfigError";
    }
    return "Unknown";
}

const char* ErrorCategoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::None:        return "None";
        case ErrorCategory::Format:      return "FormatError";
        case ErrorCategory::Integrity:   return "IntegrityError";
        case ErrorCategory::Unsupported: return "UnsupportedOperation";
        case ErrorCategory::Io:          return "IoError";
        case ErrorCategory::Cancelled:   return "Cancelled";
        case ErrorCategory::Config:      return "ConfigError";
    }
    return "Unknown";
}

ErrorCategory CategoryOf(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return ErrorCategory::None;
        case ErrorKind::BadMagic:
        case ErrorKind::UnsupportedVersion:
        case ErrorKind::ManifestDecodeError:
        case ErrorKind::MissingField:
        case ErrorKind::TruncatedBlob:
        case ErrorKind::SizeMismatch:
        case ErrorKind::CorruptData:
            return ErrorCategory::Format;
        case ErrorKind::HashMismatch:
            return ErrorCategory::Integrity;
        case ErrorKind::UnsupportedOperation:
            return ErrorCategory::Unsupported;
        case ErrorKind::Io:
            return ErrorCategory::Io;
        case ErrorKind::Cancelled:
            return ErrorCategory::Cancelled;
        case ErrorKind::Config:
            return ErrorCategory::Config;
    }
    return ErrorCategory::None;
}

} // namespace otadump
