//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Literals.h
// Purpose: Parsers for the size and relative-day literals used by shorthand query predicates
//==========================================================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace mdagent {
namespace query {

//==========================================================================================================
// SizePredicate
// Purpose: Comparison parsed from an @size: value.
// Fields:
//   op: '>' or '<'.
//   bytes: Right-hand side in bytes.
//==========================================================================================================
struct SizePredicate {
    char op{'>'};
    int64_t bytes{0};
};

//==========================================================================================================
// ParseInteger
// Purpose: Parses a whole string as a base-10 signed integer (optional leading '+' or '-').
// Returns:
//   The value, or std::nullopt when any character is not part of the number or it overflows.
//==========================================================================================================
std::optional<int64_t> ParseInteger(const std::string& text);

//==========================================================================================================
// ParseSizeLiteral
// Purpose: Converts "10K", "2mb", "1G", "512B" or "300" to a byte count. Case-insensitive; suffixes
//          KB/MB/GB are matched before K/M/G/B and scale by powers of 1024.
// Returns:
//   Byte count; 0 when the numeric part does not parse. Results beyond int64 saturate.
//==========================================================================================================
int64_t ParseSizeLiteral(const std::string& text);

//==========================================================================================================
// ParseSizePredicate
// Purpose: Splits an optional leading '>' or '<' (default '>') from a size literal.
//==========================================================================================================
SizePredicate ParseSizePredicate(const std::string& text);

//==========================================================================================================
// ParseDayOffset
// Purpose: Parses the day count of an @mod:/@created: value.
// Returns:
//   Number of days, or std::nullopt when the value is not an integer.
//==========================================================================================================
std::optional<int64_t> ParseDayOffset(const std::string& text);

} // namespace query
} // namespace mdagent
