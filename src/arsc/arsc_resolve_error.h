/**
 * Copyright (c) 2026 rid2name authors
 */
#pragma once

#include <string>
#include <string_view>

namespace r2n::arsc {
enum class ResolveErrorKind {
    MalformedIdentifier,
    PackageNotFound,
    TypeNotFound,
    InvalidType,
    KeyIndexOutOfRange,
    StringDecodeError,
};

inline std::string_view to_string(ResolveErrorKind kind) {
    switch (kind) {
        case ResolveErrorKind::MalformedIdentifier:
            return "MalformedIdentifier";
        case ResolveErrorKind::PackageNotFound:
            return "PackageNotFound";
        case ResolveErrorKind::TypeNotFound:
            return "TypeNotFound";
        case ResolveErrorKind::InvalidType:
            return "InvalidType";
        case ResolveErrorKind::KeyIndexOutOfRange:
            return "KeyIndexOutOfRange";
        case ResolveErrorKind::StringDecodeError:
            return "StringDecodeError";
    }
    return "Unknown";
}

// Structural failure of a single resolution step. Never retried.
struct ResolveError {
    ResolveErrorKind kind = ResolveErrorKind::StringDecodeError;
    std::string message;
};
}  // namespace r2n::arsc
