//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CacheControl.h
// Purpose: Parser and formatter for the HTTP Cache-Control header (RFC 9111 Section 5.2)
//==========================================================================================================

#pragma once

#include <chrono>
#include <iosfwd>
#include <optional>
#include <string>

#include "cachecontrol/ParseMode.h"
#include "cachecontrol/errors/Errors.h"

namespace cachecontrol {

//==========================================================================================================
// Header
// Purpose: Parsed representation of one logical Cache-Control header value.
// Notes:
//   - Boolean directives default to false, delta-seconds directives to std::nullopt.
//   - max-age=0 is a present zero, distinct from an absent max-age.
//==========================================================================================================
struct Header {
    std::optional<std::chrono::seconds> maxAge;   // max-age
    std::optional<std::chrono::seconds> maxStale; // max-stale
    std::optional<std::chrono::seconds> minFresh; // min-fresh
    bool noCache{false};                          // no-cache
    bool noStore{false};                          // no-store
    bool noTransform{false};                      // no-transform
    bool onlyIfCached{false};                     // only-if-cached
    bool mustRevalidate{false};                   // must-revalidate
    bool mustUnderstand{false};                   // must-understand
    bool isPrivate{false};                        // private
    bool proxyRevalidate{false};                  // proxy-revalidate
    bool isPublic{false};                         // public
    std::optional<std::chrono::seconds> sMaxAge;  // s-maxage

    // True when no directive is set.
    bool empty() const;

    bool operator==(const Header&) const = default;
};

//==========================================================================================================
// ParseOptions
// Purpose: Relaxations applied on top of strict parsing. Both default to false (fail on first problem).
// Fields:
//   ignoreUnknownDirectives: Skip unrecognized directive names instead of failing.
//   ignoreInvalidValues: Skip directives whose value is not delta-seconds instead of failing.
//==========================================================================================================
struct ParseOptions {
    bool ignoreUnknownDirectives{false};
    bool ignoreInvalidValues{false};

    // Both relaxations enabled; strict parsing with these options never fails.
    static ParseOptions lenient() {
        return ParseOptions{true, true};
    }

    // Options read from CACHECONTROL_IGNORE_UNKNOWN / CACHECONTROL_IGNORE_INVALID (default false).
    static ParseOptions fromEnv();
};

//==========================================================================================================
// ParseResult
// Purpose: Outcome of a parse that may fail. Exactly one of header/error is populated.
//==========================================================================================================
struct ParseResult {
    std::optional<Header> header;
    std::optional<errors::CacheControlError> error;

    bool ok() const { return header.has_value(); }
};

//==========================================================================================================
// parse
// Purpose: Lenient parse. Unknown directives and invalid values are dropped; never fails.
// Args:
//   header: A single Cache-Control header value (already combined from multiple fields by the caller).
// Returns:
//   The parsed Header (all defaults for empty input).
//==========================================================================================================
Header parse(const std::string& header);

//==========================================================================================================
// parseStrict
// Purpose: Strict parse. Fails on the first unknown directive or invalid value unless the corresponding
//          option relaxes the check.
// Args:
//   header: A single Cache-Control header value.
//   options: Relaxations; defaults fail on everything.
// Returns:
//   ParseResult holding the Header, or an UnknownDirective/InvalidDirectiveValue error. No partial
//   Header is returned on error.
//==========================================================================================================
ParseResult parseStrict(const std::string& header, const ParseOptions& options = {});

//==========================================================================================================
// parse (mode dispatch)
// Purpose: Parse with the mode chosen at runtime. options only apply to ParseMode::Strict.
//==========================================================================================================
ParseResult parse(const std::string& header, ParseMode mode, const ParseOptions& options = {});

//==========================================================================================================
// Stream overloads
// Purpose: Drain the stream into a string, then parse. A stream that is already failed or goes bad while
//          being read yields a SourceReadFailure error, even for the lenient overload.
//==========================================================================================================
ParseResult parse(std::istream& in);
ParseResult parseStrict(std::istream& in, const ParseOptions& options = {});

//==========================================================================================================
// formatHeader
// Purpose: Canonical serialization: directives in kCanonicalDirectives order, joined by ", ".
//          Durations are written as whole seconds. A default Header formats to "".
//==========================================================================================================
std::string formatHeader(const Header& header);

std::ostream& operator<<(std::ostream& os, const Header& header);

} // namespace cachecontrol
