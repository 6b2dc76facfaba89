//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CacheControl.cpp
// Purpose: Parser and formatter for the HTTP Cache-Control header (RFC 9111 Section 5.2)
//==========================================================================================================

#include "cachecontrol/CacheControl.h"

#include <cctype>
#include <istream>
#include <ostream>
#include <string_view>
#include <vector>

#include "cachecontrol/DeltaSeconds.h"
#include "cachecontrol/Directives.h"
#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace cachecontrol {

namespace {

using Duration = std::optional<std::chrono::seconds>;

// Lower-case ASCII and drop every space/tab, including inside tokens.
std::string normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == ' ' || c == '\t') {
            continue;
        }
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

std::string trim(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) {
        ++b;
    }
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) {
        --e;
    }
    return s.substr(b, e - b);
}

// Split on every ','; "a,,b," yields {"a", "", "b", ""}.
std::vector<std::string> splitDirectives(const std::string& s) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (true) {
        std::size_t comma = s.find(',', start);
        if (comma == std::string::npos) {
            out.push_back(s.substr(start));
            break;
        }
        out.push_back(s.substr(start, comma - start));
        start = comma + 1;
    }
    return out;
}

bool Header::* booleanMember(std::string_view name) {
    if (name == Directives::NoCache) return &Header::noCache;
    if (name == Directives::NoStore) return &Header::noStore;
    if (name == Directives::NoTransform) return &Header::noTransform;
    if (name == Directives::OnlyIfCached) return &Header::onlyIfCached;
    if (name == Directives::MustRevalidate) return &Header::mustRevalidate;
    if (name == Directives::MustUnderstand) return &Header::mustUnderstand;
    if (name == Directives::Private) return &Header::isPrivate;
    if (name == Directives::ProxyRevalidate) return &Header::proxyRevalidate;
    if (name == Directives::Public) return &Header::isPublic;
    return nullptr;
}

Duration Header::* durationMember(std::string_view name) {
    if (name == Directives::MaxAge) return &Header::maxAge;
    if (name == Directives::MaxStale) return &Header::maxStale;
    if (name == Directives::MinFresh) return &Header::minFresh;
    if (name == Directives::SMaxAge) return &Header::sMaxAge;
    return nullptr;
}

ParseResult failWith(errors::CacheControlError err) {
    LOG_DEBUG("Cache-Control parse failed: {}", err.message);
    ParseResult r;
    r.error = std::move(err);
    return r;
}

// Shared core for every entry point; lenient parsing is this with ParseOptions::lenient().
ParseResult parseWithOptions(const std::string& raw, const ParseOptions& options) {
    const std::string normalized = normalize(raw);

    Header h;
    if (normalized.empty()) {
        return ParseResult{h, std::nullopt};
    }

    for (const auto& token : splitDirectives(normalized)) {
        auto eq = token.find('=');
        if (eq == std::string::npos) {
            if (auto member = booleanMember(token)) {
                h.*member = true;
                continue;
            }
            if (options.ignoreUnknownDirectives) {
                LOG_DEBUG("Ignoring unknown Cache-Control directive '{}'", token);
                continue;
            }
            return failWith(errors::makeUnknownDirectiveError(token));
        }

        const std::string key = token.substr(0, eq);
        const std::string value = token.substr(eq + 1);
        auto converted = parseDeltaSeconds(trim(value));
        if (converted.status != DeltaSecondsStatus::Ok) {
            if (options.ignoreInvalidValues) {
                LOG_DEBUG("Ignoring Cache-Control directive '{}' with invalid value '{}' ({})",
                          key, value, toString(converted.status));
                continue;
            }
            return failWith(errors::makeInvalidValueError(key, value, converted.status));
        }

        // Only the delta-seconds names take a value; "private=5" is unknown here.
        if (auto member = durationMember(key)) {
            h.*member = converted.value;
            continue;
        }
        if (options.ignoreUnknownDirectives) {
            LOG_DEBUG("Ignoring unknown Cache-Control directive '{}'", key);
            continue;
        }
        return failWith(errors::makeUnknownDirectiveError(key));
    }

    return ParseResult{h, std::nullopt};
}

// Drains the stream with unformatted reads so streambuf failures surface as badbit.
bool readAll(std::istream& in, std::string& out) {
    out.clear();
    if (in.fail()) {
        return false;
    }
    char buf[4096];
    while (in.read(buf, sizeof(buf)) || in.gcount() > 0) {
        out.append(buf, static_cast<std::size_t>(in.gcount()));
        if (in.eof()) {
            break;
        }
    }
    return !in.bad();
}

} // namespace

bool Header::empty() const {
    return *this == Header{};
}

ParseOptions ParseOptions::fromEnv() {
    ParseOptions o;
    o.ignoreUnknownDirectives = GetEnvFlag("CACHECONTROL_IGNORE_UNKNOWN", false);
    o.ignoreInvalidValues = GetEnvFlag("CACHECONTROL_IGNORE_INVALID", false);
    return o;
}

Header parse(const std::string& header) {
    // Cannot fail with both relaxations on
    auto r = parseWithOptions(header, ParseOptions::lenient());
    return r.header.value_or(Header{});
}

ParseResult parseStrict(const std::string& header, const ParseOptions& options) {
    return parseWithOptions(header, options);
}

ParseResult parse(const std::string& header, ParseMode mode, const ParseOptions& options) {
    if (mode == ParseMode::Strict) {
        return parseWithOptions(header, options);
    }
    return parseWithOptions(header, ParseOptions::lenient());
}

ParseResult parse(std::istream& in) {
    return parseStrict(in, ParseOptions::lenient());
}

ParseResult parseStrict(std::istream& in, const ParseOptions& options) {
    std::string raw;
    if (!readAll(in, raw)) {
        LOG_DEBUG("Failed to read Cache-Control header from stream (read {} bytes)", raw.size());
        ParseResult r;
        r.error = errors::makeSourceReadError();
        return r;
    }
    return parseWithOptions(raw, options);
}

std::string formatHeader(const Header& header) {
    std::string out;
    for (const auto& d : kCanonicalDirectives) {
        std::string piece;
        if (d.kind == DirectiveKind::Boolean) {
            auto member = booleanMember(d.name);
            if (member == nullptr || !(header.*member)) {
                continue;
            }
            piece = std::string(d.name);
        } else {
            auto member = durationMember(d.name);
            if (member == nullptr || !(header.*member).has_value()) {
                continue;
            }
            piece = std::string(d.name) + "=" + std::to_string((header.*member)->count());
        }
        if (!out.empty()) {
            out += ", ";
        }
        out += piece;
    }
    return out;
}

std::ostream& operator<<(std::ostream& os, const Header& header) {
    return os << formatHeader(header);
}

} // namespace cachecontrol
