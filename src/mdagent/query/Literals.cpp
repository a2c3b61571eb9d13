//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Literals.cpp
// Purpose: Size and day-offset literal parsing
//==========================================================================================================

#include "mdagent/query/Literals.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <limits>
#include <utility>

namespace mdagent {
namespace query {

namespace {

std::string trimBlanks(const std::string& s) {
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return std::string();
    const auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

// Two-letter forms first so "KB" is never read as "K" followed by a stray "B"
constexpr std::array<std::pair<const char*, int64_t>, 7> kSizeSuffixes{{
    {"KB", int64_t{1} << 10},
    {"MB", int64_t{1} << 20},
    {"GB", int64_t{1} << 30},
    {"K", int64_t{1} << 10},
    {"M", int64_t{1} << 20},
    {"G", int64_t{1} << 30},
    {"B", 1},
}};

} // namespace

std::optional<int64_t> ParseInteger(const std::string& text) {
    const char* first = text.data();
    const char* last = text.data() + text.size();
    if (first != last && *first == '+') {
        ++first;
        if (first != last && (*first == '-' || *first == '+')) return std::nullopt;
    }
    if (first == last) return std::nullopt;
    int64_t v = 0;
    auto [p, ec] = std::from_chars(first, last, v);
    if (ec != std::errc() || p != last) return std::nullopt;
    return v;
}

int64_t ParseSizeLiteral(const std::string& text) {
    std::string s = trimBlanks(text);
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::toupper(c)); });

    int64_t multiplier = 1;
    for (const auto& [suffix, factor] : kSizeSuffixes) {
        const std::string sfx(suffix);
        if (s.size() >= sfx.size() && s.compare(s.size() - sfx.size(), sfx.size(), sfx) == 0) {
            s.erase(s.size() - sfx.size());
            multiplier = factor;
            break;
        }
    }

    auto n = ParseInteger(s);
    if (!n.has_value()) return 0;
    const int64_t maxV = std::numeric_limits<int64_t>::max();
    const int64_t minV = std::numeric_limits<int64_t>::min();
    if (*n > maxV / multiplier) return maxV;
    if (*n < minV / multiplier) return minV;
    return *n * multiplier;
}

SizePredicate ParseSizePredicate(const std::string& text) {
    std::string s = trimBlanks(text);
    SizePredicate pred;
    if (!s.empty() && (s.front() == '>' || s.front() == '<')) {
        pred.op = s.front();
        s.erase(0, 1);
    }
    pred.bytes = ParseSizeLiteral(s);
    return pred;
}

std::optional<int64_t> ParseDayOffset(const std::string& text) {
    return ParseInteger(text);
}

} // namespace query
} // namespace mdagent
