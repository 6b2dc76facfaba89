//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ParseMode.h
// Purpose: Lenient/Strict parsing modes with string conversion for config friendliness
//==========================================================================================================

#pragma once

#include <string>

#include "env/EnvVars.h"

namespace cachecontrol {

// Lenient never fails; Strict stops at the first unknown directive or invalid value
// (subject to ParseOptions).
enum class ParseMode {
    Lenient = 0,
    Strict = 1,
};

inline const char* toString(ParseMode mode) {
    switch (mode) {
        case ParseMode::Strict: return "Strict";
        case ParseMode::Lenient:
        default: return "Lenient";
    }
}

inline ParseMode parseMode(const std::string& s) {
    if (s == "strict" || s == "Strict" || s == "STRICT") return ParseMode::Strict;
    return ParseMode::Lenient;
}

// Mode named by CACHECONTROL_PARSE_MODE; Lenient when unset or unrecognized.
inline ParseMode parseModeFromEnv() {
    return parseMode(GetEnvOrDefault("CACHECONTROL_PARSE_MODE", "lenient"));
}

} // namespace cachecontrol
