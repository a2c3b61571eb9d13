//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.h
// Purpose: JSON-RPC method dispatcher (initialize, tools/list, tools/call, initialized acknowledgements)
//==========================================================================================================

#pragma once

#include <memory>
#include <string>

#include "mdagent/Protocol.h"
#include "mdagent/ToolRegistry.h"
#include "mdagent/validation/Validation.h"

namespace mdagent {

//==========================================================================================================
// ServerConfig
// Purpose: Immutable settings fixed at startup.
// Fields:
//   info: serverInfo reported by initialize.
//   validationMode: Strict checks every result shape before it is returned.
//==========================================================================================================
struct ServerConfig {
    Implementation info;
    validation::ValidationMode validationMode{validation::ValidationMode::Off};
};

//==========================================================================================================
// Server
// Purpose: Stateless routing table keyed by exact method name. Every request, notifications included,
//          gets exactly one response.
//==========================================================================================================
class Server {
public:
    Server(ServerConfig config, ToolRegistry registry);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    //==========================================================================================================
    // HandleJSONRPC
    // Purpose: Dispatches one decoded request. Never throws for request-level problems; they become error
    //          responses carrying the request id.
    //==========================================================================================================
    std::unique_ptr<JSONRPCResponse> HandleJSONRPC(const JSONRPCRequest& req);

    const ToolRegistry& Registry() const;
    validation::ValidationMode GetValidationMode() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mdagent
