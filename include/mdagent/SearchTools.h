//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SearchTools.h
// Purpose: The search, count and meta tools wired to a search collaborator
//==========================================================================================================

#pragma once

#include <memory>
#include <set>
#include <string>
#include <vector>

#include "mdagent/ToolRegistry.h"
#include "mdagent/search/SearchEngine.h"

namespace mdagent {

namespace ToolNames {
    constexpr const char* Search = "search";
    constexpr const char* Count = "count";
    constexpr const char* Meta = "meta";
}

// Default result cap when the search tool gets no "n"
constexpr int64_t DEFAULT_SEARCH_LIMIT = 100;

// Static descriptors in tools/list order: search, count, meta
std::vector<Tool> BuiltinToolDescriptors();

//==========================================================================================================
// SearchTools
// Purpose: Tool handlers. Optional arguments with the wrong JSON type are treated as absent.
//==========================================================================================================
class SearchTools {
public:
    explicit SearchTools(std::shared_ptr<search::ISearchEngine> engine);

    // q (required), in, n, sort, fmt
    std::string Search(const JSONValue& args) const;

    // q (required), in; decimal count
    std::string Count(const JSONValue& args) const;

    // path (required)
    std::string Meta(const JSONValue& args) const;

private:
    std::shared_ptr<search::ISearchEngine> engine_;
};

// Registry over the builtin tools, filtered to the enabled names (empty = all)
ToolRegistry MakeDefaultToolRegistry(std::shared_ptr<search::ISearchEngine> engine,
                                     const std::set<std::string>& enabled = {});

} // namespace mdagent
