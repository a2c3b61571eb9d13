//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResultFormatter.h
// Purpose: Text renderings of search results returned by the search tool
//==========================================================================================================

#pragma once

#include <string>
#include <vector>

#include "mdagent/search/SearchEngine.h"

namespace mdagent {
namespace search {

enum class OutputFormat {
    Compact,  // path|<human size>|<YYYY-MM-DD>
    Full,     // path | kind:.. | size:.. | mod:.. | type:..
    Paths     // path
};

// "paths" and "full" select those modes; anything else is Compact.
OutputFormat ParseOutputFormat(const std::string& name);

// 2024-03-05T14:07:00Z
std::string FormatIso8601(const TimePoint& tp);

// 2024-03-05 (UTC)
std::string FormatDate(const TimePoint& tp);

// 512B, 1.5K, 20.0M, 3.2G
std::string FormatHumanSize(int64_t bytes);

std::string FormatCompact(const SearchResult& r);
std::string FormatFull(const SearchResult& r);

//==========================================================================================================
// FormatResults
// Purpose: Renders one line per result joined with '\n' (no trailing newline; empty for no results).
//==========================================================================================================
std::string FormatResults(const std::vector<SearchResult>& results, OutputFormat format);

} // namespace search
} // namespace mdagent
