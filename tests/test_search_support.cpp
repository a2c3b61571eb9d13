//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_search_support.cpp
// Purpose: GoogleTests for sort/scope argument parsing and result formatting
//==========================================================================================================

#include <gtest/gtest.h>
#include "mdagent/search/ResultFormatter.h"
#include "mdagent/search/SearchEngine.h"

using namespace mdagent::search;

namespace {

// 2024-03-05T14:07:00Z
TimePoint sampleTime() {
    return std::chrono::system_clock::from_time_t(1709647620);
}

SearchResult sampleResult() {
    SearchResult r;
    r.path = "/Users/me/notes.txt";
    r.kind = "Plain Text";
    r.size = 1536;
    r.modified = sampleTime();
    r.contentType = "public.plain-text";
    return r;
}

} // namespace

TEST(SortSpec, LogicalKeysMapToAttributes) {
    SortSpec date = ParseSortSpec("-date");
    EXPECT_EQ(date.attribute, "kMDItemContentModificationDate");
    EXPECT_TRUE(date.descending);

    SortSpec size = ParseSortSpec("size");
    EXPECT_EQ(size.attribute, "kMDItemFSSize");
    EXPECT_FALSE(size.descending);

    EXPECT_EQ(ParseSortSpec("name").attribute, "kMDItemFSName");
    EXPECT_EQ(ParseSortSpec("created").attribute, "kMDItemFSCreationDate");
}

TEST(SortSpec, UnknownKeyPassesThrough) {
    SortSpec s = ParseSortSpec("-kMDItemLastUsedDate");
    EXPECT_EQ(s.attribute, "kMDItemLastUsedDate");
    EXPECT_TRUE(s.descending);
    EXPECT_EQ(ParseSortSpec("Date").attribute, "Date");
}

TEST(SortSpec, BareDashMeansNoAttribute) {
    SortSpec s = ParseSortSpec("-");
    EXPECT_TRUE(s.attribute.empty());
}

TEST(Scopes, SplitTrimAndDropEmpty) {
    EXPECT_TRUE(ParseScopes("").empty());
    EXPECT_EQ(ParseScopes("~/src"), (std::vector<std::string>{"~/src"}));
    EXPECT_EQ(ParseScopes(" /a , ,/b ,"), (std::vector<std::string>{"/a", "/b"}));
}

TEST(Formatter, HumanSize) {
    EXPECT_EQ(FormatHumanSize(0), "0B");
    EXPECT_EQ(FormatHumanSize(512), "512B");
    EXPECT_EQ(FormatHumanSize(1536), "1.5K");
    EXPECT_EQ(FormatHumanSize(20 * 1024 * 1024), "20.0M");
    EXPECT_EQ(FormatHumanSize(int64_t{3} << 30), "3.0G");
}

TEST(Formatter, Dates) {
    EXPECT_EQ(FormatIso8601(sampleTime()), "2024-03-05T14:07:00Z");
    EXPECT_EQ(FormatDate(sampleTime()), "2024-03-05");
}

TEST(Formatter, CompactAndFull) {
    const SearchResult r = sampleResult();
    EXPECT_EQ(FormatCompact(r), "/Users/me/notes.txt|1.5K|2024-03-05");
    EXPECT_EQ(FormatFull(r),
              "/Users/me/notes.txt | kind:Plain Text | size:1536 | mod:2024-03-05T14:07:00Z | type:public.plain-text");
}

TEST(Formatter, AbsentFieldsAreOmitted) {
    SearchResult bare;
    bare.path = "/tmp/x";
    EXPECT_EQ(FormatCompact(bare), "/tmp/x");
    EXPECT_EQ(FormatFull(bare), "/tmp/x");

    SearchResult sizeOnly = bare;
    sizeOnly.size = 10;
    EXPECT_EQ(FormatCompact(sizeOnly), "/tmp/x|10B");
    EXPECT_EQ(FormatFull(sizeOnly), "/tmp/x | size:10");
}

TEST(Formatter, FormatSelectionAndJoin) {
    EXPECT_EQ(ParseOutputFormat("paths"), OutputFormat::Paths);
    EXPECT_EQ(ParseOutputFormat("full"), OutputFormat::Full);
    EXPECT_EQ(ParseOutputFormat("compact"), OutputFormat::Compact);
    EXPECT_EQ(ParseOutputFormat("weird"), OutputFormat::Compact);

    SearchResult a; a.path = "/a";
    SearchResult b; b.path = "/b";
    EXPECT_EQ(FormatResults({a, b}, OutputFormat::Paths), "/a\n/b");
    EXPECT_EQ(FormatResults({}, OutputFormat::Compact), "");
}
