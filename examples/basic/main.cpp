//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Basic example: lenient parse, field access and canonical formatting
//==========================================================================================================

#include <iostream>
#include "cachecontrol/CacheControl.h"
#include "cachecontrol/version.h"
#include "logging/Logger.h"

using namespace cachecontrol;

int main() {
    Logger::setLogLevel(LogLevel::LOG_DEBUG_LEVEL);
    LOG_INFO("cachecontrol version: {}", getVersionString());

    const std::string raw = "max-age=3600, must-revalidate, private";
    Header h = parse(raw);

    std::cout << "max-age: ";
    if (h.maxAge) {
        std::cout << h.maxAge->count() << "s";
    } else {
        std::cout << "<none>";
    }
    std::cout << " must-revalidate: " << std::boolalpha << h.mustRevalidate
              << " private: " << h.isPrivate
              << " max-stale: " << (h.maxStale ? std::to_string(h.maxStale->count()) + "s" : std::string("<none>"))
              << std::endl;

    // Unknown directives and bad values are dropped (see DEBUG log lines)
    Header messy = parse("Private, X-Vendor-Flag, MAX-AGE = 60, s-maxage=soon");
    std::cout << "canonical: " << messy << std::endl;
    return 0;
}
