//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DeltaSeconds.h
// Purpose: Conversion of RFC 9111 delta-seconds text into std::chrono::seconds
//==========================================================================================================

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace cachecontrol {

enum class DeltaSecondsStatus {
    Ok,
    Empty,            // no characters at all
    Negative,         // leading '-' followed by digits
    Fractional,       // digits '.' digits
    InvalidCharacter, // anything that is not a bare decimal integer ("invalid", "10s", "+5")
    OutOfRange        // does not fit std::chrono::seconds::rep
};

struct DeltaSecondsResult {
    DeltaSecondsStatus status;
    std::optional<std::chrono::seconds> value; // present when status==Ok
};

//==========================================================================================================
// parseDeltaSeconds
// Purpose: Convert a delta-seconds value (one or more ASCII digits, nothing else) to a duration.
// Args:
//   text: The raw directive value, already trimmed of surrounding whitespace.
// Returns:
//   DeltaSecondsResult with status Ok and the duration, or a failure status and no value.
//==========================================================================================================
DeltaSecondsResult parseDeltaSeconds(const std::string& text);

// Human-readable description of a conversion status, used as the cause in value errors.
const char* toString(DeltaSecondsStatus status);

} // namespace cachecontrol
