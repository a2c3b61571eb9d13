//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LineTransport.cpp
// Purpose: Read-decode-dispatch-encode-write loop for newline-delimited JSON-RPC
//==========================================================================================================

#include "mdagent/LineTransport.hpp"

#include <istream>
#include <ostream>

#include "logging/Logger.h"
#include "mdagent/JSONRPCTypes.h"
#include "mdagent/errors/Errors.h"

namespace mdagent {

LineTransport::LineTransport(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

void LineTransport::SetRequestHandler(RequestHandler handler) {
    requestHandler_ = std::move(handler);
}

void LineTransport::SetErrorHandler(ErrorHandler handler) {
    errorHandler_ = std::move(handler);
}

void LineTransport::reportError(const std::string& err) const {
    if (!errorHandler_) return;
    try { errorHandler_(err); }
    catch (const std::exception& e) { LOG_ERROR("LineTransport: error callback exception: {}", e.what()); }
}

std::string LineTransport::encode(const JSONRPCResponse& resp) const {
    try {
        return resp.Serialize();
    } catch (const std::exception& e) {
        LOG_ERROR("LineTransport: failed to encode response: {}", e.what());
        reportError(e.what());
        return LAST_RESORT_ERROR_LINE;
    }
}

std::string LineTransport::HandleLine(const std::string& raw) {
    std::string line = raw;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) return std::string();

    JSONRPCRequest req;
    try {
        req = JSONRPCRequest::Decode(line);
    } catch (const JSONDecodeError& e) {
        LOG_WARN("LineTransport: failed to parse message: {}", e.what());
        reportError(e.what());
        auto resp = errors::makeErrorResponse(JSONRPCId{nullptr}, JSONRPCErrorCodes::ParseError, std::string("Parse error: ") + e.what());
        return encode(*resp);
    }

    LOG_DEBUG("LineTransport: dispatching {}", req.method);
    std::unique_ptr<JSONRPCResponse> resp;
    if (!requestHandler_) {
        resp = errors::makeErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + req.method);
    } else {
        try {
            resp = requestHandler_(req);
        } catch (const std::exception& e) {
            LOG_ERROR("LineTransport: request handler exception: {}", e.what());
            reportError(e.what());
            resp = errors::makeErrorResponse(req.id, JSONRPCErrorCodes::InternalError, e.what());
        }
        if (!resp) {
            resp = errors::makeErrorResponse(req.id, JSONRPCErrorCodes::InternalError, "No response produced");
        }
    }
    return encode(*resp);
}

size_t LineTransport::Run() {
    LOG_INFO("LineTransport: started");
    size_t written = 0;
    std::string line;
    while (std::getline(in_, line)) {
        const std::string payload = HandleLine(line);
        if (payload.empty()) continue;
        out_ << payload << '\n' << std::flush;
        if (!out_) {
            LOG_ERROR("LineTransport: output stream failed; stopping");
            break;
        }
        ++written;
    }
    LOG_INFO("LineTransport: end of input after {} response(s)", written);
    return written;
}

} // namespace mdagent
