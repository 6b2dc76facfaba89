//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_delta_seconds.cpp
// Purpose: delta-seconds conversion (bare non-negative decimal integers only)
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "cachecontrol/DeltaSeconds.h"

using namespace cachecontrol;

TEST(DeltaSeconds, AcceptsIntegers) {
    auto r = parseDeltaSeconds("3600");
    EXPECT_EQ(r.status, DeltaSecondsStatus::Ok);
    ASSERT_TRUE(r.value.has_value());
    EXPECT_EQ(r.value.value(), std::chrono::seconds(3600));

    auto zero = parseDeltaSeconds("0");
    EXPECT_EQ(zero.status, DeltaSecondsStatus::Ok);
    EXPECT_EQ(zero.value, std::chrono::seconds(0));
}

TEST(DeltaSeconds, AcceptsLeadingZeros) {
    auto r = parseDeltaSeconds("007");
    EXPECT_EQ(r.status, DeltaSecondsStatus::Ok);
    EXPECT_EQ(r.value, std::chrono::seconds(7));
}

TEST(DeltaSeconds, RejectsEmpty) {
    auto r = parseDeltaSeconds("");
    EXPECT_EQ(r.status, DeltaSecondsStatus::Empty);
    EXPECT_FALSE(r.value.has_value());
}

TEST(DeltaSeconds, RejectsNonNumeric) {
    EXPECT_EQ(parseDeltaSeconds("invalid").status, DeltaSecondsStatus::InvalidCharacter);
    EXPECT_EQ(parseDeltaSeconds("10s").status, DeltaSecondsStatus::InvalidCharacter);
    EXPECT_EQ(parseDeltaSeconds("1h").status, DeltaSecondsStatus::InvalidCharacter);
    EXPECT_EQ(parseDeltaSeconds("+5").status, DeltaSecondsStatus::InvalidCharacter);
    EXPECT_EQ(parseDeltaSeconds("-").status, DeltaSecondsStatus::InvalidCharacter);
    EXPECT_EQ(parseDeltaSeconds("\"60\"").status, DeltaSecondsStatus::InvalidCharacter);
    EXPECT_EQ(parseDeltaSeconds("1.").status, DeltaSecondsStatus::InvalidCharacter);
}

TEST(DeltaSeconds, RejectsNegative) {
    auto r = parseDeltaSeconds("-5");
    EXPECT_EQ(r.status, DeltaSecondsStatus::Negative);
    EXPECT_FALSE(r.value.has_value());
}

TEST(DeltaSeconds, RejectsFractional) {
    EXPECT_EQ(parseDeltaSeconds("1.5").status, DeltaSecondsStatus::Fractional);
}

TEST(DeltaSeconds, RejectsOutOfRange) {
    auto r = parseDeltaSeconds("99999999999999999999999");
    EXPECT_EQ(r.status, DeltaSecondsStatus::OutOfRange);
    EXPECT_FALSE(r.value.has_value());
}

TEST(DeltaSeconds, AcceptsLargestRepresentable) {
    auto r = parseDeltaSeconds("9223372036854775807");
    EXPECT_EQ(r.status, DeltaSecondsStatus::Ok);
}

TEST(DeltaSeconds, StatusStrings) {
    EXPECT_EQ(std::string(toString(DeltaSecondsStatus::Ok)), std::string("ok"));
    EXPECT_EQ(std::string(toString(DeltaSecondsStatus::InvalidCharacter)), std::string("not a delta-seconds integer"));
    EXPECT_EQ(std::string(toString(DeltaSecondsStatus::Negative)), std::string("negative delta-seconds"));
}
