//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LineTransport.hpp
// Purpose: Newline-delimited JSON-RPC transport over a pair of streams (stdin/stdout in production)
//==========================================================================================================

#pragma once

#include <iosfwd>
#include <string>

#include "mdagent/Transport.h"

namespace mdagent {

// Written when even an error response cannot be encoded
constexpr const char* LAST_RESORT_ERROR_LINE =
    "{\"jsonrpc\":\"2.0\",\"id\":null,\"error\":{\"code\":-32603,\"message\":\"Encoding error\"}}";

//==========================================================================================================
// LineTransport
// Purpose: One JSON document per line in, one per line out.
// Notes:
//   - Empty lines (after dropping a trailing '\r') are skipped without a response.
//   - Undecodable lines get an id:null -32700 response.
//   - Every response is flushed before the next line is read.
//==========================================================================================================
class LineTransport : public ITransport {
public:
    LineTransport(std::istream& in, std::ostream& out);

    size_t Run() override;
    void SetRequestHandler(RequestHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    //==========================================================================================================
    // HandleLine
    // Purpose: Processes one input line.
    // Returns:
    //   The encoded response, or an empty string when the line is skipped.
    //==========================================================================================================
    std::string HandleLine(const std::string& line);

private:
    std::string encode(const JSONRPCResponse& resp) const;
    void reportError(const std::string& err) const;

    std::istream& in_;
    std::ostream& out_;
    RequestHandler requestHandler_;
    ErrorHandler errorHandler_;
};

} // namespace mdagent
