//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_literals.cpp
// Purpose: GoogleTests for size literals, size predicates and day offsets
//==========================================================================================================

#include <gtest/gtest.h>
#include <limits>
#include "mdagent/query/Literals.h"

using namespace mdagent::query;

TEST(SizeLiteral, Suffixes) {
    EXPECT_EQ(ParseSizeLiteral("10K"), 10 * 1024);
    EXPECT_EQ(ParseSizeLiteral("2M"), 2 * 1024 * 1024);
    EXPECT_EQ(ParseSizeLiteral("1G"), int64_t{1} << 30);
    EXPECT_EQ(ParseSizeLiteral("1GB"), ParseSizeLiteral("1G"));
    EXPECT_EQ(ParseSizeLiteral("3kb"), 3 * 1024);
    EXPECT_EQ(ParseSizeLiteral("512B"), 512);
    EXPECT_EQ(ParseSizeLiteral("300"), 300);
}

TEST(SizeLiteral, UnparsableYieldsZero) {
    EXPECT_EQ(ParseSizeLiteral(""), 0);
    EXPECT_EQ(ParseSizeLiteral("abc"), 0);
    EXPECT_EQ(ParseSizeLiteral("1.5M"), 0);
    EXPECT_EQ(ParseSizeLiteral("K"), 0);
}

TEST(SizeLiteral, OverflowSaturates) {
    EXPECT_EQ(ParseSizeLiteral("99999999999999G"), std::numeric_limits<int64_t>::max());
}

TEST(SizePredicate, OperatorAndDefault) {
    SizePredicate gt = ParseSizePredicate(">1G");
    EXPECT_EQ(gt.op, '>');
    EXPECT_EQ(gt.bytes, int64_t{1} << 30);

    SizePredicate lt = ParseSizePredicate("<100K");
    EXPECT_EQ(lt.op, '<');
    EXPECT_EQ(lt.bytes, 100 * 1024);

    SizePredicate def = ParseSizePredicate("5M");
    EXPECT_EQ(def.op, '>');
    EXPECT_EQ(def.bytes, 5 * 1024 * 1024);
}

TEST(ParseInteger, WholeStringOnly) {
    EXPECT_EQ(ParseInteger("7"), std::optional<int64_t>(7));
    EXPECT_EQ(ParseInteger("+7"), std::optional<int64_t>(7));
    EXPECT_EQ(ParseInteger("-3"), std::optional<int64_t>(-3));
    EXPECT_FALSE(ParseInteger("").has_value());
    EXPECT_FALSE(ParseInteger("7d").has_value());
    EXPECT_FALSE(ParseInteger(" 7").has_value());
    EXPECT_FALSE(ParseInteger("+-7").has_value());
    EXPECT_FALSE(ParseInteger("99999999999999999999").has_value());
}

TEST(DayOffset, IntegerOrAbsent) {
    EXPECT_EQ(ParseDayOffset("7"), std::optional<int64_t>(7));
    EXPECT_FALSE(ParseDayOffset("abc").has_value());
    EXPECT_FALSE(ParseDayOffset("1.5").has_value());
}
