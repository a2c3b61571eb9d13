//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: NativeQuery.cpp
// Purpose: MDQuery fragment builders
//==========================================================================================================

#include "mdagent/query/NativeQuery.h"

#include <format>
#include <limits>

namespace mdagent {
namespace query {

namespace {

constexpr int64_t kSecondsPerDay = 86400;

// "$time.now(-N)" with N seconds back; saturates instead of overflowing on absurd day counts
std::string nowMinusDays(int64_t days) {
    const int64_t limit = std::numeric_limits<int64_t>::max() / kSecondsPerDay;
    if (days > limit) days = limit;
    if (days < -limit) days = -limit;
    return std::format("$time.now({})", -days * kSecondsPerDay);
}

} // namespace

std::string QuoteValue(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('"');
    for (char c : value) {
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

// Trailing "cd": case and diacritic insensitive comparison
std::string Filename(const std::string& pattern) {
    return std::format("{} == {}cd", Attributes::FSName, QuoteValue(pattern));
}

std::string Content(const std::string& text) {
    return std::format("{} == {}cd", Attributes::TextContent, QuoteValue("*" + text + "*"));
}

std::string Kind(const std::string& kind) {
    return std::format("{} == {}cd", Attributes::Kind, QuoteValue(kind));
}

std::string ContentType(const std::string& uti) {
    return std::format("{} == {}", Attributes::ContentType, QuoteValue(uti));
}

std::string ContentTypeTree(const std::string& uti) {
    return std::format("{} == {}", Attributes::ContentTypeTree, QuoteValue(uti));
}

std::string ModifiedWithinDays(int64_t days) {
    return std::format("{} > {}", Attributes::ContentModificationDate, nowMinusDays(days));
}

std::string CreatedWithinDays(int64_t days) {
    return std::format("{} > {}", Attributes::FSCreationDate, nowMinusDays(days));
}

std::string Size(char op, int64_t bytes) {
    return std::format("{} {} {}", Attributes::FSSize, op, bytes);
}

std::string And(const std::vector<std::string>& fragments) {
    if (fragments.empty()) return MatchAll;
    if (fragments.size() == 1) return fragments.front();
    std::string out = "(";
    for (size_t i = 0; i < fragments.size(); ++i) {
        if (i > 0) out += " && ";
        out += fragments[i];
    }
    out += ")";
    return out;
}

} // namespace query
} // namespace mdagent
