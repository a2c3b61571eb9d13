//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structure, tool exception, and JSON-RPC error response helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "mdagent/JSONRPCTypes.h"

namespace mdagent {
namespace errors {

// Typed error representation used at dispatch sites.
struct RpcError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
};

//==========================================================================================================
// ToolError
// Purpose: Exception raised by tool handlers and argument validation. Carries the JSON-RPC code the
//          dispatcher should answer with (InvalidParams for argument problems).
//==========================================================================================================
class ToolError : public std::runtime_error {
public:
    ToolError(int code, const std::string& message) : std::runtime_error(message), code_(code) {}
    int code() const noexcept { return code_; }

private:
    int code_;
};

// Convenience: Create a JSONRPCResponse error from RpcError and id.
//
// Args:
//   id: JSON-RPC id to echo in the response.
//   err: Typed error to map.
//
// Returns:
//   std::unique_ptr<JSONRPCResponse> containing an error.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const RpcError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

// Shorthand used at dispatch sites: { code, message } without data.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, int code, const std::string& message) {
    RpcError e; e.code = code; e.message = message;
    return makeErrorResponse(id, e);
}

} // namespace errors
} // namespace mdagent
