//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_stream.cpp
// Purpose: Stream entry points (drain then parse; read failures surface as SourceReadFailure)
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <streambuf>
#include <string>

#include "cachecontrol/CacheControl.h"

using namespace cachecontrol;
using cachecontrol::errors::ErrorCategory;

namespace {

// Serves a prefix, then throws from underflow() to simulate an I/O error mid-read.
class FailingBuf : public std::streambuf {
public:
    explicit FailingBuf(std::string prefix) : prefix_(std::move(prefix)) {
        setg(prefix_.data(), prefix_.data(), prefix_.data() + prefix_.size());
    }

protected:
    int_type underflow() override {
        throw std::runtime_error("simulated read failure");
    }

private:
    std::string prefix_;
};

} // namespace

TEST(StreamParse, LenientFromStringStream) {
    std::istringstream in("max-age=120, Public, bogus");
    auto r = parse(in);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.header->maxAge, std::chrono::seconds(120));
    EXPECT_TRUE(r.header->isPublic);
}

TEST(StreamParse, StrictFromStringStream) {
    std::istringstream in("no-cache, bogus");
    auto r = parseStrict(in);
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->category, ErrorCategory::UnknownDirective);
    EXPECT_EQ(r.error->directive, std::string("bogus"));
}

TEST(StreamParse, StrictWithOptions) {
    std::istringstream in("no-cache, bogus");
    ParseOptions opts;
    opts.ignoreUnknownDirectives = true;
    auto r = parseStrict(in, opts);
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(r.header->noCache);
}

TEST(StreamParse, EmptyStream) {
    std::istringstream in("");
    auto r = parseStrict(in);
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(r.header->empty());
}

TEST(StreamParse, LargeInputSpanningReadChunks) {
    std::string big;
    for (int i = 0; i < 2000; ++i) {
        big += "no-store, ";
    }
    big += "max-age=5";
    std::istringstream in(big);
    auto r = parseStrict(in);
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(r.header->noStore);
    EXPECT_EQ(r.header->maxAge, std::chrono::seconds(5));
}

TEST(StreamParse, AlreadyFailedStreamIsReadFailure) {
    std::istringstream in("public");
    in.setstate(std::ios::failbit);
    auto r = parse(in);
    EXPECT_FALSE(r.ok());
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->category, ErrorCategory::SourceReadFailure);
}

TEST(StreamParse, UnopenedFileIsReadFailure) {
    std::ifstream in("/nonexistent/cachecontrol/header.txt");
    auto r = parseStrict(in);
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->category, ErrorCategory::SourceReadFailure);
    EXPECT_EQ(r.error->message, std::string("failed to read Cache-Control header from stream"));
}

TEST(StreamParse, ThrowingStreamBufIsReadFailure) {
    FailingBuf buf("public, ");
    std::istream in(&buf);
    auto r = parse(in);
    EXPECT_FALSE(r.header.has_value());
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->category, ErrorCategory::SourceReadFailure);
}
