//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.cpp
// Purpose: Tool descriptor JSON forms, enabled-subset filtering and argument validation
//==========================================================================================================

#include "mdagent/ToolRegistry.h"

#include <algorithm>

#include "logging/Logger.h"
#include "mdagent/errors/Errors.h"
#include "mdagent/search/SearchEngine.h"

namespace mdagent {

JSONValue Tool::InputSchema() const {
    JSONValue::Object props;
    for (const auto& p : properties) {
        JSONValue::Object prop;
        prop["type"] = std::make_shared<JSONValue>(p.type);
        props[p.name] = std::make_shared<JSONValue>(std::move(prop));
    }
    JSONValue::Array req;
    for (const auto& r : required) req.push_back(std::make_shared<JSONValue>(r));

    JSONValue::Object schema;
    schema["type"] = std::make_shared<JSONValue>("object");
    schema["properties"] = std::make_shared<JSONValue>(std::move(props));
    schema["required"] = std::make_shared<JSONValue>(std::move(req));
    return JSONValue{std::move(schema)};
}

JSONValue Tool::ToJSON() const {
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(name);
    obj["description"] = std::make_shared<JSONValue>(description);
    obj["inputSchema"] = std::make_shared<JSONValue>(InputSchema());
    return JSONValue{std::move(obj)};
}

ToolRegistry::ToolRegistry(std::vector<RegisteredTool> tools, const std::set<std::string>& enabled) {
    for (const auto& name : enabled) {
        const bool known = std::any_of(tools.begin(), tools.end(),
                                       [&name](const RegisteredTool& t) { return t.tool.name == name; });
        if (!known) {
            LOG_WARN("Ignoring unknown tool in filter: {}", name);
        }
    }
    for (auto& t : tools) {
        if (enabled.empty() || enabled.count(t.tool.name) > 0) {
            tools_.push_back(std::move(t));
        }
    }
    LOG_DEBUG("Tool registry: {} tool(s) enabled", tools_.size());
}

const RegisteredTool* ToolRegistry::Find(const std::string& name) const {
    for (const auto& t : tools_) {
        if (t.tool.name == name) return &t;
    }
    return nullptr;
}

JSONValue ToolRegistry::ListJSON() const {
    JSONValue::Array arr;
    for (const auto& t : tools_) arr.push_back(std::make_shared<JSONValue>(t.tool.ToJSON()));
    JSONValue::Object obj;
    obj["tools"] = std::make_shared<JSONValue>(std::move(arr));
    return JSONValue{std::move(obj)};
}

void ToolRegistry::ValidateArguments(const Tool& tool, const JSONValue& arguments) {
    if (!arguments.AsObject()) {
        throw errors::ToolError(JSONRPCErrorCodes::InvalidParams, "Tool arguments must be an object");
    }
    for (const auto& key : tool.required) {
        const JSONValue* v = arguments.Member(key);
        if (!v) {
            throw errors::ToolError(JSONRPCErrorCodes::InvalidParams, "Missing required argument: " + key);
        }
        auto prop = std::find_if(tool.properties.begin(), tool.properties.end(),
                                 [&key](const ToolProperty& p) { return p.name == key; });
        if (prop == tool.properties.end()) continue;
        const bool ok = (prop->type == "string" && v->AsString().has_value()) ||
                        (prop->type == "integer" && v->AsInt().has_value()) ||
                        (prop->type != "string" && prop->type != "integer");
        if (!ok) {
            throw errors::ToolError(JSONRPCErrorCodes::InvalidParams,
                                    "Argument " + key + " must be of type " + prop->type);
        }
    }
}

std::string ToolRegistry::Call(const std::string& name, const JSONValue& arguments) const {
    const RegisteredTool* t = Find(name);
    if (!t) {
        throw errors::ToolError(JSONRPCErrorCodes::MethodNotFound, "Method not found: Unknown tool: " + name);
    }
    ValidateArguments(t->tool, arguments);
    LOG_DEBUG("Calling tool {}", name);
    return t->handler(arguments);
}

std::set<std::string> ParseToolFilter(const std::string& commaSeparated) {
    auto parts = search::ParseScopes(commaSeparated);
    return std::set<std::string>(parts.begin(), parts.end());
}

} // namespace mdagent
