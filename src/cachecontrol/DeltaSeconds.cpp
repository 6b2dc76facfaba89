//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DeltaSeconds.cpp
// Purpose: Conversion of RFC 9111 delta-seconds text into std::chrono::seconds
//==========================================================================================================

#include "cachecontrol/DeltaSeconds.h"

#include <charconv>
#include <cstdint>
#include <system_error>

namespace cachecontrol {

namespace {

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

bool allDigits(const std::string& s, std::size_t begin, std::size_t end) {
    if (begin >= end) {
        return false;
    }
    for (std::size_t i = begin; i < end; ++i) {
        if (!isDigit(s[i])) {
            return false;
        }
    }
    return true;
}

} // namespace

DeltaSecondsResult parseDeltaSeconds(const std::string& text) {
    if (text.empty()) {
        return { DeltaSecondsStatus::Empty, std::nullopt };
    }

    if (!allDigits(text, 0, text.size())) {
        if (text[0] == '-' && allDigits(text, 1, text.size())) {
            return { DeltaSecondsStatus::Negative, std::nullopt };
        }
        auto dot = text.find('.');
        if (dot != std::string::npos && allDigits(text, 0, dot) && allDigits(text, dot + 1, text.size())) {
            return { DeltaSecondsStatus::Fractional, std::nullopt };
        }
        return { DeltaSecondsStatus::InvalidCharacter, std::nullopt };
    }

    std::chrono::seconds::rep v = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, v);
    if (ec == std::errc::result_out_of_range) {
        return { DeltaSecondsStatus::OutOfRange, std::nullopt };
    }
    if (ec != std::errc() || ptr != last) {
        return { DeltaSecondsStatus::InvalidCharacter, std::nullopt };
    }
    return { DeltaSecondsStatus::Ok, std::chrono::seconds(v) };
}

const char* toString(DeltaSecondsStatus status) {
    switch (status) {
        case DeltaSecondsStatus::Ok: return "ok";
        case DeltaSecondsStatus::Empty: return "empty value";
        case DeltaSecondsStatus::Negative: return "negative delta-seconds";
        case DeltaSecondsStatus::Fractional: return "fractional delta-seconds";
        case DeltaSecondsStatus::InvalidCharacter: return "not a delta-seconds integer";
        case DeltaSecondsStatus::OutOfRange: return "delta-seconds out of range";
    }
    return "unknown";
}

} // namespace cachecontrol
