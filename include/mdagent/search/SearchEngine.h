//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SearchEngine.h
// Purpose: Search collaborator interface (indexed query execution, counting, metadata lookup)
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mdagent {
namespace search {

using TimePoint = std::chrono::system_clock::time_point;

//==========================================================================================================
// SearchResult
// Purpose: One matched file. Only path is guaranteed; the other attributes are present when the index
//          reports them.
//==========================================================================================================
struct SearchResult {
    std::string path;
    std::optional<std::string> kind;
    std::optional<int64_t> size;
    std::optional<TimePoint> modified;
    std::optional<TimePoint> created;
    std::optional<std::string> contentType;
};

//==========================================================================================================
// SearchRequest
// Fields:
//   query: Native query expression.
//   scopes: Directories to restrict the search to; empty searches everywhere.
//   limit: Maximum results; <= 0 means unlimited.
//   sortBy: Native attribute to sort on; unset or empty leaves the engine's order.
//   descending: Sort direction when sortBy is set.
//==========================================================================================================
struct SearchRequest {
    std::string query;
    std::vector<std::string> scopes;
    int64_t limit{100};
    std::optional<std::string> sortBy;
    bool descending{true};
};

//==========================================================================================================
// SortSpec
// Purpose: Parsed "sort" argument. A leading '-' selects descending order; "name", "date", "size" and
//          "created" map to Spotlight attributes and anything else is used verbatim as an attribute name.
//==========================================================================================================
struct SortSpec {
    std::string attribute;
    bool descending{false};
};

SortSpec ParseSortSpec(const std::string& text);

// Splits the comma-separated "in" argument, dropping empty entries and surrounding blanks.
std::vector<std::string> ParseScopes(const std::string& commaSeparated);

//==========================================================================================================
// SearchError
// Purpose: Raised by collaborators for query syntax errors, non-indexed paths or an unavailable engine.
//==========================================================================================================
class SearchError : public std::runtime_error {
public:
    explicit SearchError(const std::string& what) : std::runtime_error(what) {}
};

//==========================================================================================================
// ISearchEngine
// Purpose: Seam between the tools and the platform index. Implementations throw SearchError on failure.
//==========================================================================================================
class ISearchEngine {
public:
    virtual ~ISearchEngine() = default;

    // Runs a query and returns ordered, limited results.
    virtual std::vector<SearchResult> Execute(const SearchRequest& request) = 0;

    // Number of matches for a query within the scopes.
    virtual int64_t Count(const std::string& query, const std::vector<std::string>& scopes) = 0;

    // Formatted attribute dump for an indexed path.
    virtual std::string Metadata(const std::string& path) = 0;
};

} // namespace search
} // namespace mdagent
