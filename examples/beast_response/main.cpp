//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Read Cache-Control from a Boost.Beast response, parse it and write back the canonical form
//==========================================================================================================

#include <iostream>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "cachecontrol/CacheControl.h"
#include "logging/Logger.h"

namespace http = boost::beast::http;

// Combine every Cache-Control field into one logical value (RFC 9110 Section 5.3).
static std::string combinedCacheControl(const http::response<http::string_body>& res) {
    std::string combined;
    auto range = res.equal_range(http::field::cache_control);
    for (auto it = range.first; it != range.second; ++it) {
        if (!combined.empty()) {
            combined += ", ";
        }
        combined.append(it->value().data(), it->value().size());
    }
    return combined;
}

int main() {
    http::response<http::string_body> res{http::status::ok, 11};
    res.set(http::field::server, "cachecontrol-example");
    res.insert(http::field::cache_control, "Public, MAX-AGE=600");
    res.insert(http::field::cache_control, "s-maxage=3600, stale-while-revalidate=30");
    res.body() = "hello";
    res.prepare_payload();

    const std::string raw = combinedCacheControl(res);
    LOG_INFO("Upstream Cache-Control: {}", raw);

    auto strict = cachecontrol::parseStrict(raw);
    if (!strict.ok()) {
        LOG_WARN("Strict parse rejected header: {}", strict.error->message);
    }

    const cachecontrol::Header h = cachecontrol::parse(raw);
    if (h.noStore) {
        LOG_INFO("Response must not be stored");
    }
    res.set(http::field::cache_control, cachecontrol::formatHeader(h));

    std::cout << res.base() << std::endl;
    return 0;
}
