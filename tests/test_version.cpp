//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_version.cpp
// Purpose: Version helpers
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "cachecontrol/version.h"

TEST(Version, StringMatchesComponents) {
    const auto v = cachecontrol::getVersion();
    const std::string expected = std::to_string(v.major) + "." + std::to_string(v.minor) + "." + std::to_string(v.patch);
    EXPECT_EQ(cachecontrol::getVersionString(), expected);
    EXPECT_GE(v.major, 1);
}
