//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Directives.h
// Purpose: Cache-Control directive names (RFC 9111 Section 5.2) and their canonical ordering
//==========================================================================================================

#pragma once

#include <array>
#include <string_view>

namespace cachecontrol {

namespace Directives {
    // Valued (delta-seconds)
    constexpr const char* MaxAge = "max-age";
    constexpr const char* MaxStale = "max-stale";
    constexpr const char* MinFresh = "min-fresh";
    constexpr const char* SMaxAge = "s-maxage";

    // Boolean
    constexpr const char* NoCache = "no-cache";
    constexpr const char* NoStore = "no-store";
    constexpr const char* NoTransform = "no-transform";
    constexpr const char* OnlyIfCached = "only-if-cached";
    constexpr const char* MustRevalidate = "must-revalidate";
    constexpr const char* MustUnderstand = "must-understand";
    constexpr const char* Private = "private";
    constexpr const char* ProxyRevalidate = "proxy-revalidate";
    constexpr const char* Public = "public";
}

// Shape of a recognized directive: bare token or name=delta-seconds.
enum class DirectiveKind {
    Boolean,
    DeltaSeconds
};

struct DirectiveInfo {
    std::string_view name;
    DirectiveKind kind;
};

// Canonical serialization order. formatHeader() emits directives in exactly this order.
inline constexpr std::array<DirectiveInfo, 13> kCanonicalDirectives{{
    {Directives::MaxAge, DirectiveKind::DeltaSeconds},
    {Directives::MaxStale, DirectiveKind::DeltaSeconds},
    {Directives::MinFresh, DirectiveKind::DeltaSeconds},
    {Directives::NoCache, DirectiveKind::Boolean},
    {Directives::NoStore, DirectiveKind::Boolean},
    {Directives::NoTransform, DirectiveKind::Boolean},
    {Directives::OnlyIfCached, DirectiveKind::Boolean},
    {Directives::MustRevalidate, DirectiveKind::Boolean},
    {Directives::MustUnderstand, DirectiveKind::Boolean},
    {Directives::Private, DirectiveKind::Boolean},
    {Directives::ProxyRevalidate, DirectiveKind::Boolean},
    {Directives::Public, DirectiveKind::Boolean},
    {Directives::SMaxAge, DirectiveKind::DeltaSeconds},
}};

} // namespace cachecontrol
