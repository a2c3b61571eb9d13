//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: Protocol data structures, tool descriptors, and method names served by mdagent
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <string>
#include <vector>
#include <optional>

namespace mdagent {
//==========================================================================================================
// Protocol types and constants
// Purpose: Shared protocol structures, tool descriptors, and method names.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
constexpr const char* PROTOCOL_VERSION = "2024-11-05";
constexpr const char* SERVER_NAME = "mdagent";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
// One declared argument of a tool: property name and its JSON Schema type ("string", "integer", ...)
struct ToolProperty {
    std::string name;
    std::string type;
};

// Static description of a tool as advertised by tools/list
struct Tool {
    std::string name;
    std::string description;
    std::vector<ToolProperty> properties;
    std::vector<std::string> required;

    Tool() = default;
    Tool(std::string name, std::string description,
         std::vector<ToolProperty> properties, std::vector<std::string> required)
        : name(std::move(name)), description(std::move(description)),
          properties(std::move(properties)), required(std::move(required)) {}

    // JSON Schema form: { type: "object", properties: { p: { type } }, required: [...] }
    JSONValue InputSchema() const;

    // { name, description, inputSchema }
    JSONValue ToJSON() const;
};

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";

    // Notification-shaped; acknowledged with an empty object
    constexpr const char* InitializedLegacy = "initialized";
    constexpr const char* Initialized = "notifications/initialized";
}

} // namespace mdagent
