//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MdfindSearchEngine.cpp
// Purpose: mdfind/mdls subprocess search engine (query, sort, limit, attribute lookup)
//==========================================================================================================

#include "mdagent/search/MdfindSearchEngine.h"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <format>
#include <system_error>

#include "logging/Logger.h"
#include "mdagent/query/Literals.h"
#include "mdagent/query/NativeQuery.h"

namespace mdagent {
namespace search {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return std::string();
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string basename(const std::string& path) {
    const auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::vector<std::string> splitNul(const std::string& out) {
    std::vector<std::string> paths;
    std::size_t start = 0;
    while (start < out.size()) {
        std::size_t end = out.find('\0', start);
        if (end == std::string::npos) end = out.size();
        std::string p = out.substr(start, end - start);
        // mdfind -0 still ends with a newline on some releases
        while (!p.empty() && (p.back() == '\n' || p.back() == '\r')) p.pop_back();
        if (!p.empty()) paths.push_back(std::move(p));
        start = end + 1;
    }
    return paths;
}

std::optional<double> asNumber(const std::string& s) {
    if (s.empty()) return std::nullopt;
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (end == nullptr || *end != '\0') return std::nullopt;
    return v;
}

// Missing values sort after present ones in either direction
bool lessRaw(const std::optional<std::string>& a, const std::optional<std::string>& b, bool descending) {
    if (!a || !b) return a.has_value() && !b.has_value();
    const auto na = asNumber(*a);
    const auto nb = asNumber(*b);
    if (na && nb) return descending ? *na > *nb : *na < *nb;
    return descending ? *a > *b : *a < *b;
}

void truncatePaths(std::vector<std::string>& items, int64_t limit) {
    if (limit > 0 && items.size() > static_cast<std::size_t>(limit)) {
        items.resize(static_cast<std::size_t>(limit));
    }
}

std::optional<std::string> lookup(const MdlsRecord& rec, const char* key) {
    auto it = rec.find(key);
    if (it == rec.end()) return std::nullopt;
    return it->second;
}

SearchResult toResult(const std::string& path, const MdlsRecord& rec) {
    SearchResult r;
    r.path = path;
    r.kind = lookup(rec, query::Attributes::Kind);
    r.contentType = lookup(rec, query::Attributes::ContentType);
    if (auto size = lookup(rec, query::Attributes::FSSize)) {
        if (auto n = query::ParseInteger(*size)) r.size = *n;
    }
    if (auto mod = lookup(rec, query::Attributes::ContentModificationDate)) {
        r.modified = ParseMdlsDate(*mod);
    }
    if (auto created = lookup(rec, query::Attributes::FSCreationDate)) {
        r.created = ParseMdlsDate(*created);
    }
    return r;
}

} // namespace

MdlsRecord ParseMdlsOutput(const std::string& text) {
    MdlsRecord rec;
    std::size_t start = 0;
    while (start < text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string::npos) end = text.size();
        const std::string line = text.substr(start, end - start);
        start = end + 1;

        const auto eq = line.find(" = ");
        if (eq == std::string::npos) continue;
        std::string name = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 3));
        if (name.empty() || value == "(null)") continue;
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
        rec[name] = value;
    }
    return rec;
}

std::optional<TimePoint> ParseMdlsDate(const std::string& text) {
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0, off = 0;
    const int n = std::sscanf(text.c_str(), "%d-%d-%d %d:%d:%d %d", &y, &mo, &d, &h, &mi, &s, &off);
    if (n < 6) return std::nullopt;
    std::tm tm{};
    tm.tm_year = y - 1900;
    tm.tm_mon = mo - 1;
    tm.tm_mday = d;
    tm.tm_hour = h;
    tm.tm_min = mi;
    tm.tm_sec = s;
    std::time_t t = ::timegm(&tm);
    if (n == 7) {
        // +HHMM east of UTC
        const int sign = off < 0 ? -1 : 1;
        const int mag = off * sign;
        t -= sign * ((mag / 100) * 3600 + (mag % 100) * 60);
    }
    return std::chrono::system_clock::from_time_t(t);
}

MdfindSearchEngine::MdfindSearchEngine(std::shared_ptr<IProcessRunner> runner, MdfindConfig config)
    : runner_(std::move(runner)), config_(std::move(config)) {}

ProcessOutput MdfindSearchEngine::runMdfind(const std::vector<std::string>& flags, const std::string& query,
                                            const std::vector<std::string>& scopes) {
    std::vector<std::string> argv{config_.mdfindPath};
    argv.insert(argv.end(), flags.begin(), flags.end());
    for (const auto& s : scopes) {
        argv.push_back("-onlyin");
        argv.push_back(s);
    }
    argv.push_back(query);

    ProcessOutput out;
    try {
        out = runner_->Run(argv);
    } catch (const std::system_error& e) {
        throw SearchError(std::format("Search engine unavailable: {}", e.what()));
    }
    if (out.exitCode != 0 || out.err.find("Failed to create query") != std::string::npos) {
        const std::string detail = trim(out.err);
        LOG_WARN("mdfind failed (exit={}): {}", out.exitCode, detail);
        throw SearchError(detail.empty() ? std::format("mdfind exited with status {}", out.exitCode)
                                         : std::format("Query failed: {}", detail));
    }
    return out;
}

MdlsRecord MdfindSearchEngine::fetchAttributes(const std::string& path, const std::optional<std::string>& extra) {
    std::vector<std::string> argv{config_.mdlsPath};
    for (const char* attr : {query::Attributes::Kind, query::Attributes::FSSize,
                             query::Attributes::ContentModificationDate, query::Attributes::FSCreationDate,
                             query::Attributes::ContentType}) {
        argv.push_back("-name");
        argv.push_back(attr);
    }
    if (extra && !extra->empty()) {
        argv.push_back("-name");
        argv.push_back(*extra);
    }
    argv.push_back(path);

    ProcessOutput out;
    try {
        out = runner_->Run(argv);
    } catch (const std::system_error& e) {
        throw SearchError(std::format("Search engine unavailable: {}", e.what()));
    }
    if (out.exitCode != 0) {
        // Files can vanish between mdfind and mdls; keep the path without attributes
        LOG_DEBUG("mdls failed for {} (exit={})", path, out.exitCode);
        return {};
    }
    return ParseMdlsOutput(out.out);
}

std::vector<SearchResult> MdfindSearchEngine::Execute(const SearchRequest& request) {
    FUNC_SCOPE();
    ProcessOutput out = runMdfind({"-0"}, request.query, request.scopes);
    std::vector<std::string> paths = splitNul(out.out);
    LOG_DEBUG("mdfind matched {} paths", paths.size());

    const bool sorting = request.sortBy.has_value() && !request.sortBy->empty();
    std::vector<SearchResult> results;

    if (!sorting || *request.sortBy == query::Attributes::FSName) {
        if (sorting) {
            const bool desc = request.descending;
            std::stable_sort(paths.begin(), paths.end(), [desc](const std::string& a, const std::string& b) {
                return desc ? basename(a) > basename(b) : basename(a) < basename(b);
            });
        }
        truncatePaths(paths, request.limit);
        results.reserve(paths.size());
        for (const auto& p : paths) {
            results.push_back(toResult(p, fetchAttributes(p, std::nullopt)));
        }
        return results;
    }

    const std::string& attr = *request.sortBy;
    std::vector<std::pair<SearchResult, std::optional<std::string>>> keyed;
    keyed.reserve(paths.size());
    for (const auto& p : paths) {
        MdlsRecord rec = fetchAttributes(p, attr);
        keyed.emplace_back(toResult(p, rec), lookup(rec, attr.c_str()));
    }
    const bool desc = request.descending;
    std::stable_sort(keyed.begin(), keyed.end(), [desc](const auto& a, const auto& b) {
        return lessRaw(a.second, b.second, desc);
    });
    if (request.limit > 0 && keyed.size() > static_cast<std::size_t>(request.limit)) {
        keyed.resize(static_cast<std::size_t>(request.limit));
    }
    results.reserve(keyed.size());
    for (auto& k : keyed) results.push_back(std::move(k.first));
    return results;
}

int64_t MdfindSearchEngine::Count(const std::string& query, const std::vector<std::string>& scopes) {
    ProcessOutput out = runMdfind({"-count"}, query, scopes);
    auto n = query::ParseInteger(trim(out.out));
    if (!n) {
        throw SearchError(std::format("Unexpected mdfind -count output: {}", trim(out.out)));
    }
    return *n;
}

std::string MdfindSearchEngine::Metadata(const std::string& path) {
    ProcessOutput out;
    try {
        out = runner_->Run({config_.mdlsPath, path});
    } catch (const std::system_error& e) {
        throw SearchError(std::format("Search engine unavailable: {}", e.what()));
    }
    const std::string err = trim(out.err);
    if (out.exitCode != 0 || err.find("could not find") != std::string::npos) {
        LOG_WARN("mdls failed for {} (exit={}): {}", path, out.exitCode, err);
        throw SearchError(err.empty() ? std::format("No metadata for {}", path) : err);
    }
    std::string text = out.out;
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) text.pop_back();
    return text;
}

} // namespace search
} // namespace mdagent
