//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SearchEngine.cpp
// Purpose: Sort and scope argument parsing shared by search collaborators
//==========================================================================================================

#include "mdagent/search/SearchEngine.h"

#include "mdagent/query/NativeQuery.h"

namespace mdagent {
namespace search {

SortSpec ParseSortSpec(const std::string& text) {
    SortSpec out;
    std::string key = text;
    if (!key.empty() && key.front() == '-') {
        out.descending = true;
        key.erase(0, 1);
    }

    if (key == "name") out.attribute = query::Attributes::FSName;
    else if (key == "date") out.attribute = query::Attributes::ContentModificationDate;
    else if (key == "size") out.attribute = query::Attributes::FSSize;
    else if (key == "created") out.attribute = query::Attributes::FSCreationDate;
    else out.attribute = key;
    return out;
}

std::vector<std::string> ParseScopes(const std::string& commaSeparated) {
    std::vector<std::string> scopes;
    std::size_t start = 0;
    while (start <= commaSeparated.size()) {
        std::size_t comma = commaSeparated.find(',', start);
        if (comma == std::string::npos) comma = commaSeparated.size();
        std::string part = commaSeparated.substr(start, comma - start);
        const auto first = part.find_first_not_of(" \t");
        if (first != std::string::npos) {
            const auto last = part.find_last_not_of(" \t");
            scopes.push_back(part.substr(first, last - first + 1));
        }
        start = comma + 1;
    }
    return scopes;
}

} // namespace search
} // namespace mdagent
