//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: NativeQuery.h
// Purpose: Builders for Spotlight (MDQuery) predicate fragments and attribute names
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace mdagent {
namespace query {

// Spotlight metadata attribute names
namespace Attributes {
    constexpr const char* FSName = "kMDItemFSName";
    constexpr const char* TextContent = "kMDItemTextContent";
    constexpr const char* Kind = "kMDItemKind";
    constexpr const char* ContentType = "kMDItemContentType";
    constexpr const char* ContentTypeTree = "kMDItemContentTypeTree";
    constexpr const char* ContentModificationDate = "kMDItemContentModificationDate";
    constexpr const char* FSCreationDate = "kMDItemFSCreationDate";
    constexpr const char* FSSize = "kMDItemFSSize";
}

// Input starting with this is already a native expression
constexpr const char* NativePrefix = "kMD";

// Fragment matching every file name
constexpr const char* MatchAll = "kMDItemFSName == \"*\"";

// Backslash-escapes '"' and '\' so a value can sit inside a quoted MDQuery string.
std::string QuoteValue(const std::string& value);

std::string Filename(const std::string& pattern);
std::string Content(const std::string& text);
std::string Kind(const std::string& kind);
std::string ContentType(const std::string& uti);
std::string ContentTypeTree(const std::string& uti);
std::string ModifiedWithinDays(int64_t days);
std::string CreatedWithinDays(int64_t days);
std::string Size(char op, int64_t bytes);

//==========================================================================================================
// And
// Purpose: Conjunction of fragments. A single fragment is returned unchanged; several are joined with
//          " && " inside one pair of parentheses. An empty list yields MatchAll.
//==========================================================================================================
std::string And(const std::vector<std::string>& fragments);

} // namespace query
} // namespace mdagent
