//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Transport interface: owns the read/dispatch/write loop and hands requests to a handler
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <string>

namespace mdagent {

class JSONRPCRequest;
class JSONRPCResponse;

//==========================================================================================================
// ITransport
// Purpose: Synchronous request/response transport. One request is fully handled before the next is read.
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    //==========================================================================================================
    // Runs the loop until end of input.
    // Returns:
    //   Number of responses written.
    //==========================================================================================================
    virtual size_t Run() = 0;

    //==========================================================================================================
    // Registers the handler invoked per decoded request. It must return a response; exceptions it throws
    // are answered with an internal error.
    //==========================================================================================================
    using RequestHandler = std::function<std::unique_ptr<JSONRPCResponse>(const JSONRPCRequest&)>;
    virtual void SetRequestHandler(RequestHandler handler) = 0;

    //==========================================================================================================
    // Registers a callback for recoverable transport problems (parse failures, handler exceptions).
    //==========================================================================================================
    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

} // namespace mdagent
