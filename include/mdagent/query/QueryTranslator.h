//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: QueryTranslator.h
// Purpose: Shorthand query language ("@name:*.txt @size:>1M") to native Spotlight expression translation
//==========================================================================================================

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mdagent {
namespace query {

// Recognized shorthand prefixes. Declaration order is the order fragments appear in the output.
enum class ShorthandKind {
    Name,      // @name:
    Content,   // @content:
    Kind,      // @kind:
    Type,      // @type:
    Tree,      // @tree:
    Modified,  // @mod:
    Created,   // @created:
    Size       // @size:
};

// Prefix text including '@' and ':' for a kind
const char* PrefixFor(ShorthandKind kind);

//==========================================================================================================
// ShorthandToken
// Purpose: One "@prefix:value" occurrence.
// Fields:
//   kind: Which prefix matched.
//   value: Text after the prefix up to the next space or end of input (may be empty).
//   offset: Byte offset of the prefix in the text still unconsumed when its pass found it.
//==========================================================================================================
struct ShorthandToken {
    ShorthandKind kind;
    std::string value;
    std::size_t offset{0};
};

//==========================================================================================================
// TokenizedQuery
// Purpose: Result of the prefix-by-prefix scan.
// Fields:
//   tokens: Grouped in ShorthandKind order; input order within a kind.
//   remainder: Input with every token span removed (a span also swallows the single space after its
//              value), untrimmed.
//==========================================================================================================
struct TokenizedQuery {
    std::vector<ShorthandToken> tokens;
    std::string remainder;
};

//==========================================================================================================
// Tokenize
// Purpose: One pass per prefix in ShorthandKind order. Each pass repeatedly takes the first occurrence of
//          its prefix, captures the value up to the next space, and removes the span before looking again.
//          Earlier prefixes are consumed before a later prefix's value is cut, so glued tokens such as
//          "@kind:folder@name:foo" still yield both a name and a kind token. Prefixes are recognised
//          anywhere, including inside a word ("foo@kind:folder" yields remainder "foo").
//==========================================================================================================
TokenizedQuery Tokenize(std::string_view input);

//==========================================================================================================
// TranslateToken
// Purpose: Native fragment for one token. Non-integer @mod:/@created: values yield MatchAll.
//==========================================================================================================
std::string TranslateToken(const ShorthandToken& token);

// True when the input already starts with the native attribute prefix ("kMD").
bool IsNativeQuery(const std::string& input);

//==========================================================================================================
// Translate
// Purpose: Full shorthand translation.
//   1. Native input is returned unchanged.
//   2. Tokens with a non-empty value become fragments in Tokenize order.
//   3. Leftover text, trimmed of spaces and tabs, is appended as one more file-name glob fragment even
//      when other fragments exist ("notes @kind:folder" matches folders named "notes").
//   4. Fragments are combined with And(); no fragments yields MatchAll.
//==========================================================================================================
std::string Translate(const std::string& input);

} // namespace query
} // namespace mdagent
