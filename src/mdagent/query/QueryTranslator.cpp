//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: QueryTranslator.cpp
// Purpose: Shorthand tokenizer and translator
//==========================================================================================================

#include "mdagent/query/QueryTranslator.h"

#include <array>

#include "logging/Logger.h"
#include "mdagent/query/Literals.h"
#include "mdagent/query/NativeQuery.h"

namespace mdagent {
namespace query {

namespace {

constexpr std::array<ShorthandKind, 8> kAllKinds{
    ShorthandKind::Name, ShorthandKind::Content, ShorthandKind::Kind, ShorthandKind::Type,
    ShorthandKind::Tree, ShorthandKind::Modified, ShorthandKind::Created, ShorthandKind::Size,
};

std::string trimBlanks(const std::string& s) {
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return std::string();
    const auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

} // namespace

const char* PrefixFor(ShorthandKind kind) {
    switch (kind) {
        case ShorthandKind::Name: return "@name:";
        case ShorthandKind::Content: return "@content:";
        case ShorthandKind::Kind: return "@kind:";
        case ShorthandKind::Type: return "@type:";
        case ShorthandKind::Tree: return "@tree:";
        case ShorthandKind::Modified: return "@mod:";
        case ShorthandKind::Created: return "@created:";
        case ShorthandKind::Size: return "@size:";
    }
    return "";
}

TokenizedQuery Tokenize(std::string_view input) {
    TokenizedQuery out;
    std::string remaining(input);
    for (ShorthandKind kind : kAllKinds) {
        const std::string prefix(PrefixFor(kind));
        std::size_t pos;
        while ((pos = remaining.find(prefix)) != std::string::npos) {
            const std::size_t valueStart = pos + prefix.size();
            std::size_t valueEnd = remaining.find(' ', valueStart);
            if (valueEnd == std::string::npos) valueEnd = remaining.size();

            out.tokens.push_back(ShorthandToken{kind, remaining.substr(valueStart, valueEnd - valueStart), pos});
            // The span takes the delimiting space with it
            const std::size_t spanEnd = (valueEnd < remaining.size()) ? valueEnd + 1 : valueEnd;
            remaining.erase(pos, spanEnd - pos);
        }
    }
    out.remainder = std::move(remaining);
    return out;
}

std::string TranslateToken(const ShorthandToken& token) {
    switch (token.kind) {
        case ShorthandKind::Name: return Filename(token.value);
        case ShorthandKind::Content: return Content(token.value);
        case ShorthandKind::Kind: return Kind(token.value);
        case ShorthandKind::Type: return ContentType(token.value);
        case ShorthandKind::Tree: return ContentTypeTree(token.value);
        case ShorthandKind::Modified:
        case ShorthandKind::Created: {
            auto days = ParseDayOffset(token.value);
            if (!days.has_value()) {
                LOG_DEBUG("Ignoring non-integer day count '{}'", token.value);
                return MatchAll;
            }
            return token.kind == ShorthandKind::Modified ? ModifiedWithinDays(*days) : CreatedWithinDays(*days);
        }
        case ShorthandKind::Size: {
            const SizePredicate pred = ParseSizePredicate(token.value);
            return Size(pred.op, pred.bytes);
        }
    }
    return MatchAll;
}

bool IsNativeQuery(const std::string& input) {
    return input.rfind(NativePrefix, 0) == 0;
}

std::string Translate(const std::string& input) {
    if (IsNativeQuery(input)) {
        return input;
    }

    const TokenizedQuery tq = Tokenize(input);

    std::vector<std::string> fragments;
    fragments.reserve(tq.tokens.size() + 1);
    for (const auto& token : tq.tokens) {
        if (token.value.empty()) continue;
        fragments.push_back(TranslateToken(token));
    }

    const std::string leftover = trimBlanks(tq.remainder);
    if (!leftover.empty()) {
        fragments.push_back(Filename(leftover));
    }

    std::string native = And(fragments);
    LOG_DEBUG("Translated query '{}' -> '{}'", input, native);
    return native;
}

} // namespace query
} // namespace mdagent
