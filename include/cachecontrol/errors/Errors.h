//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structures reported by the Cache-Control parser
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "cachecontrol/DeltaSeconds.h"

namespace cachecontrol {
namespace errors {

// Categorization of parse failures.
enum class ErrorCategory {
    UnknownDirective,
    InvalidDirectiveValue,
    SourceReadFailure
};

// Typed error representation returned by strict parsing and the stream entry points.
struct CacheControlError {
    ErrorCategory category{ErrorCategory::UnknownDirective};
    std::string message;
    std::string directive;                   // offending token or key, lower-case as normalized
    std::optional<std::string> value;        // raw value text (InvalidDirectiveValue only)
    std::optional<DeltaSecondsStatus> cause; // conversion failure (InvalidDirectiveValue only)
};

inline const char* toString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::UnknownDirective: return "UnknownDirective";
        case ErrorCategory::InvalidDirectiveValue: return "InvalidDirectiveValue";
        case ErrorCategory::SourceReadFailure: return "SourceReadFailure";
    }
    return "Unknown";
}

// Build an UnknownDirective error for the given token.
//
// Args:
//   token: The normalized directive token (may be empty for stray commas).
//
// Returns:
//   CacheControlError with message "unknown directive: <token>".
inline CacheControlError makeUnknownDirectiveError(const std::string& token) {
    CacheControlError e;
    e.category = ErrorCategory::UnknownDirective;
    e.message = "unknown directive: " + token;
    e.directive = token;
    return e;
}

// Build an InvalidDirectiveValue error.
//
// Args:
//   key: Directive name on the left of '='.
//   rawValue: Text on the right of '=' as it appeared after normalization.
//   cause: Why delta-seconds conversion rejected the value.
//
// Returns:
//   CacheControlError with message "failed to parse the value of directive(<key>=<value>): <cause>".
inline CacheControlError makeInvalidValueError(const std::string& key, const std::string& rawValue,
                                               DeltaSecondsStatus cause) {
    CacheControlError e;
    e.category = ErrorCategory::InvalidDirectiveValue;
    e.message = "failed to parse the value of directive(" + key + "=" + rawValue + "): " + cachecontrol::toString(cause);
    e.directive = key;
    e.value = rawValue;
    e.cause = cause;
    return e;
}

inline CacheControlError makeSourceReadError() {
    CacheControlError e;
    e.category = ErrorCategory::SourceReadFailure;
    e.message = "failed to read Cache-Control header from stream";
    return e;
}

} // namespace errors
} // namespace cachecontrol
