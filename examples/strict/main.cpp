//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Strict parsing with error reporting and the option toggles
//==========================================================================================================

#include <iostream>
#include <string>

#include "cachecontrol/CacheControl.h"
#include "logging/Logger.h"

using namespace cachecontrol;

static void report(const std::string& raw, const ParseOptions& opts) {
    auto r = parseStrict(raw, opts);
    if (r.ok()) {
        std::cout << "ok    [" << raw << "] -> [" << *r.header << "]" << std::endl;
        return;
    }
    std::cout << "error [" << raw << "] " << errors::toString(r.error->category)
              << ": " << r.error->message << std::endl;
}

int main() {
    ParseOptions strict;
    report("max-age=3600, must-revalidate, private, ???", strict);
    report("max-age=invalid, must-revalidate, private", strict);
    report("max-age=10s", strict);
    report("private=5", strict);

    ParseOptions ignoreInvalid;
    ignoreInvalid.ignoreInvalidValues = true;
    report("max-age=invalid, private", ignoreInvalid);

    // Mode and options from CACHECONTROL_PARSE_MODE / CACHECONTROL_IGNORE_*
    const auto mode = parseModeFromEnv();
    auto r = parse("no-store, x-experimental", mode, ParseOptions::fromEnv());
    LOG_INFO("mode {} -> {}", toString(mode), r.ok() ? formatHeader(*r.header) : r.error->message);
    return 0;
}
