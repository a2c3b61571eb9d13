//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResultFormatter.cpp
// Purpose: Compact, full and path-only result rendering
//==========================================================================================================

#include "mdagent/search/ResultFormatter.h"

#include <ctime>
#include <format>
#include <iomanip>
#include <sstream>

namespace mdagent {
namespace search {

namespace {

std::string formatUtc(const TimePoint& tp, const char* pattern) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm buf{};
    ::gmtime_r(&t, &buf);
    std::ostringstream oss;
    oss << std::put_time(&buf, pattern);
    return oss.str();
}

std::string joinLines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out.push_back('\n');
        out += lines[i];
    }
    return out;
}

} // namespace

OutputFormat ParseOutputFormat(const std::string& name) {
    if (name == "paths") return OutputFormat::Paths;
    if (name == "full") return OutputFormat::Full;
    return OutputFormat::Compact;
}

std::string FormatIso8601(const TimePoint& tp) {
    return formatUtc(tp, "%Y-%m-%dT%H:%M:%SZ");
}

std::string FormatDate(const TimePoint& tp) {
    return formatUtc(tp, "%Y-%m-%d");
}

std::string FormatHumanSize(int64_t bytes) {
    if (bytes < 1024) return std::format("{}B", bytes);
    const double b = static_cast<double>(bytes);
    if (bytes < (int64_t{1} << 20)) return std::format("{:.1f}K", b / 1024.0);
    if (bytes < (int64_t{1} << 30)) return std::format("{:.1f}M", b / (1024.0 * 1024.0));
    return std::format("{:.1f}G", b / (1024.0 * 1024.0 * 1024.0));
}

std::string FormatCompact(const SearchResult& r) {
    std::string line = r.path;
    if (r.size.has_value()) line += "|" + FormatHumanSize(*r.size);
    if (r.modified.has_value()) line += "|" + FormatDate(*r.modified);
    return line;
}

std::string FormatFull(const SearchResult& r) {
    std::string line = r.path;
    if (r.kind.has_value()) line += " | kind:" + *r.kind;
    if (r.size.has_value()) line += std::format(" | size:{}", *r.size);
    if (r.modified.has_value()) line += " | mod:" + FormatIso8601(*r.modified);
    if (r.contentType.has_value()) line += " | type:" + *r.contentType;
    return line;
}

std::string FormatResults(const std::vector<SearchResult>& results, OutputFormat format) {
    std::vector<std::string> lines;
    lines.reserve(results.size());
    for (const auto& r : results) {
        switch (format) {
            case OutputFormat::Paths: lines.push_back(r.path); break;
            case OutputFormat::Full: lines.push_back(FormatFull(r)); break;
            case OutputFormat::Compact: lines.push_back(FormatCompact(r)); break;
        }
    }
    return joinLines(lines);
}

} // namespace search
} // namespace mdagent
