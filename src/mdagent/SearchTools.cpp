//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SearchTools.cpp
// Purpose: Argument extraction, defaults, delegation and formatting for the builtin tools
//==========================================================================================================

#include "mdagent/SearchTools.h"

#include <format>

#include "logging/Logger.h"
#include "mdagent/errors/Errors.h"
#include "mdagent/query/QueryTranslator.h"
#include "mdagent/search/ResultFormatter.h"

namespace mdagent {

namespace {

std::string requireString(const JSONValue& args, const char* key) {
    const JSONValue* v = args.Member(key);
    auto s = v ? v->AsString() : std::nullopt;
    if (!s) {
        throw errors::ToolError(JSONRPCErrorCodes::InvalidParams, std::format("Missing required argument: {}", key));
    }
    return *s;
}

std::optional<std::string> optionalString(const JSONValue& args, const char* key) {
    const JSONValue* v = args.Member(key);
    return v ? v->AsString() : std::nullopt;
}

std::vector<std::string> scopesFrom(const JSONValue& args) {
    auto in = optionalString(args, "in");
    return in ? search::ParseScopes(*in) : std::vector<std::string>{};
}

} // namespace

std::vector<Tool> BuiltinToolDescriptors() {
    return {
        Tool(ToolNames::Search,
             "Spotlight search. Query: @name:*.swift @content:TODO @kind:folder @type:public.swift-source "
             "@mod:7 @size:>1M (or raw MDQuery). Returns path|size|date.",
             {{"q", "string"}, {"in", "string"}, {"n", "integer"}, {"sort", "string"}, {"fmt", "string"}},
             {"q"}),
        Tool(ToolNames::Count,
             "Count matching files. Same query syntax as search.",
             {{"q", "string"}, {"in", "string"}},
             {"q"}),
        Tool(ToolNames::Meta,
             "Get file metadata via Spotlight.",
             {{"path", "string"}},
             {"path"}),
    };
}

SearchTools::SearchTools(std::shared_ptr<search::ISearchEngine> engine) : engine_(std::move(engine)) {}

std::string SearchTools::Search(const JSONValue& args) const {
    search::SearchRequest req;
    req.query = query::Translate(requireString(args, "q"));
    req.scopes = scopesFrom(args);

    req.limit = DEFAULT_SEARCH_LIMIT;
    if (const JSONValue* n = args.Member("n")) {
        if (auto limit = n->AsInt()) req.limit = *limit;
    }

    if (auto sort = optionalString(args, "sort")) {
        search::SortSpec spec = search::ParseSortSpec(*sort);
        if (!spec.attribute.empty()) {
            req.sortBy = spec.attribute;
            req.descending = spec.descending;
        }
    }

    const auto format = search::ParseOutputFormat(optionalString(args, "fmt").value_or("compact"));
    LOG_DEBUG("search: query={} scopes={} limit={}", req.query, req.scopes.size(), req.limit);
    return search::FormatResults(engine_->Execute(req), format);
}

std::string SearchTools::Count(const JSONValue& args) const {
    const std::string native = query::Translate(requireString(args, "q"));
    return std::to_string(engine_->Count(native, scopesFrom(args)));
}

std::string SearchTools::Meta(const JSONValue& args) const {
    return engine_->Metadata(requireString(args, "path"));
}

ToolRegistry MakeDefaultToolRegistry(std::shared_ptr<search::ISearchEngine> engine,
                                     const std::set<std::string>& enabled) {
    // Handlers outlive this call, so the tool set shares ownership with them
    auto tools = std::make_shared<SearchTools>(std::move(engine));
    std::vector<RegisteredTool> registered;
    for (auto& t : BuiltinToolDescriptors()) {
        ToolHandler h;
        if (t.name == ToolNames::Search) h = [tools](const JSONValue& a) { return tools->Search(a); };
        else if (t.name == ToolNames::Count) h = [tools](const JSONValue& a) { return tools->Count(a); };
        else h = [tools](const JSONValue& a) { return tools->Meta(a); };
        registered.push_back(RegisteredTool{std::move(t), std::move(h)});
    }
    return ToolRegistry(std::move(registered), enabled);
}

} // namespace mdagent
