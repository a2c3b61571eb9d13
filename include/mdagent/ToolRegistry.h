//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.h
// Purpose: Fixed, filterable set of named tools with declared input schemas
//==========================================================================================================

#pragma once

#include <functional>
#include <set>
#include <string>
#include <vector>

#include "mdagent/Protocol.h"

namespace mdagent {

// Tool handlers receive the (already validated) arguments object and return the text result.
// They throw errors::ToolError for argument problems and search::SearchError for collaborator failures.
using ToolHandler = std::function<std::string(const JSONValue&)>;

struct RegisteredTool {
    Tool tool;
    ToolHandler handler;
};

//==========================================================================================================
// ToolRegistry
// Purpose: Read-only after construction. Keeps registration order for tools/list.
// Args (ctor):
//   tools: Every tool the process knows about.
//   enabled: Names to expose; an empty set exposes all. Unknown names are logged and ignored.
//==========================================================================================================
class ToolRegistry {
public:
    ToolRegistry(std::vector<RegisteredTool> tools, const std::set<std::string>& enabled = {});

    // nullptr when the name is unknown or filtered out
    const RegisteredTool* Find(const std::string& name) const;

    const std::vector<RegisteredTool>& Enabled() const { return tools_; }

    // { tools: [ { name, description, inputSchema }, ... ] }
    JSONValue ListJSON() const;

    //==========================================================================================================
    // Call
    // Purpose: Validates arguments against the tool's schema, then runs its handler.
    // Throws:
    //   errors::ToolError(MethodNotFound) for an unknown tool, errors::ToolError(InvalidParams) for bad
    //   arguments, plus whatever the handler throws.
    //==========================================================================================================
    std::string Call(const std::string& name, const JSONValue& arguments) const;

    //==========================================================================================================
    // ValidateArguments
    // Purpose: arguments must be an object; every required property must be present with its declared
    //          type ("string" or "integer"). Optional properties are not checked here.
    //==========================================================================================================
    static void ValidateArguments(const Tool& tool, const JSONValue& arguments);

private:
    std::vector<RegisteredTool> tools_;
};

// Parses "search,meta" into a name set (blanks trimmed, empty entries dropped)
std::set<std::string> ParseToolFilter(const std::string& commaSeparated);

} // namespace mdagent
