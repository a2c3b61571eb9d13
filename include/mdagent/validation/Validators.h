//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Validators.h
// Purpose: Lightweight validators for the initialize, tools/list and tools/call result shapes
//==========================================================================================================

#pragma once

#include <string>
#include "mdagent/Protocol.h"

namespace mdagent {
namespace validation {

//------------------------------ Primitive checks ------------------------------
inline bool hasStringMember(const JSONValue& v, const std::string& key) {
    const JSONValue* m = v.Member(key);
    return m != nullptr && m->AsString().has_value();
}

inline bool hasObjectMember(const JSONValue& v, const std::string& key) {
    const JSONValue* m = v.Member(key);
    return m != nullptr && m->AsObject() != nullptr;
}

inline bool isTextContentItem(const JSONValue& v) {
    const JSONValue* type = v.Member("type");
    if (!type || type->AsString() != std::optional<std::string>("text")) return false;
    return hasStringMember(v, "text");
}

//------------------------------ Result validators ------------------------------
// { protocolVersion, serverInfo: { name, version }, capabilities: { tools: {} } }
inline bool validateInitializeResultJson(const JSONValue& v) {
    if (!hasStringMember(v, "protocolVersion")) return false;
    const JSONValue* info = v.Member("serverInfo");
    if (!info || !hasStringMember(*info, "name") || !hasStringMember(*info, "version")) return false;
    const JSONValue* caps = v.Member("capabilities");
    return caps != nullptr && hasObjectMember(*caps, "tools");
}

inline bool isToolDescriptor(const JSONValue& v) {
    if (!hasStringMember(v, "name") || !hasStringMember(v, "description")) return false;
    const JSONValue* schema = v.Member("inputSchema");
    if (!schema || !hasObjectMember(*schema, "properties")) return false;
    const JSONValue* type = schema->Member("type");
    if (!type || type->AsString() != std::optional<std::string>("object")) return false;
    const JSONValue* required = schema->Member("required");
    if (!required || !required->AsArray()) return false;
    for (const auto& r : *required->AsArray()) {
        if (!r || !r->AsString()) return false;
    }
    return true;
}

// { tools: [ descriptor, ... ] }
inline bool validateToolsListResultJson(const JSONValue& v) {
    const JSONValue* tools = v.Member("tools");
    if (!tools || !tools->AsArray()) return false;
    for (const auto& t : *tools->AsArray()) {
        if (!t || !isToolDescriptor(*t)) return false;
    }
    return true;
}

// { content: [ { type: "text", text }, ... ] }
inline bool validateCallToolResultJson(const JSONValue& v) {
    const JSONValue* content = v.Member("content");
    if (!content || !content->AsArray()) return false;
    for (const auto& p : *content->AsArray()) {
        if (!p) return false;
        if (!isTextContentItem(*p)) return false;
    }
    return true;
}

} // namespace validation
} // namespace mdagent
