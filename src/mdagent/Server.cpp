//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.cpp
// Purpose: Method routing, tools/call argument handling and error mapping
//==========================================================================================================

#include "mdagent/Server.h"

#include "logging/Logger.h"
#include "mdagent/errors/Errors.h"
#include "mdagent/search/SearchEngine.h"
#include "mdagent/validation/Validators.h"

namespace mdagent {

class Server::Impl {
public:
    Impl(ServerConfig config, ToolRegistry registry)
        : config(std::move(config)), registry(std::move(registry)) {}

    ServerConfig config;
    ToolRegistry registry;

    std::unique_ptr<JSONRPCResponse> dispatchRequest(const JSONRPCRequest& req);
    std::unique_ptr<JSONRPCResponse> handleInitialize(const JSONRPCRequest& req);
    std::unique_ptr<JSONRPCResponse> handleToolsList(const JSONRPCRequest& req);
    std::unique_ptr<JSONRPCResponse> handleToolsCall(const JSONRPCRequest& req);
    std::unique_ptr<JSONRPCResponse> handleAck(const JSONRPCRequest& req);

    bool strict() const { return config.validationMode == validation::ValidationMode::Strict; }

    static std::unique_ptr<JSONRPCResponse> makeResult(const JSONRPCRequest& req, JSONValue result) {
        auto resp = std::make_unique<JSONRPCResponse>();
        resp->id = req.id; resp->result = std::move(result); return resp;
    }
};

std::unique_ptr<JSONRPCResponse> Server::Impl::handleInitialize(const JSONRPCRequest& req) {
    LOG_DEBUG("Handling initialize request");
    JSONValue::Object serverInfo;
    serverInfo["name"] = std::make_shared<JSONValue>(config.info.name);
    serverInfo["version"] = std::make_shared<JSONValue>(config.info.version);

    JSONValue::Object capabilities;
    capabilities["tools"] = std::make_shared<JSONValue>(JSONValue::Object{});

    JSONValue::Object obj;
    obj["protocolVersion"] = std::make_shared<JSONValue>(PROTOCOL_VERSION);
    obj["serverInfo"] = std::make_shared<JSONValue>(std::move(serverInfo));
    obj["capabilities"] = std::make_shared<JSONValue>(std::move(capabilities));
    JSONValue result{std::move(obj)};

    if (strict() && !validation::validateInitializeResultJson(result)) {
        LOG_ERROR("Validation failed (Strict): {} result invalid", Methods::Initialize);
        return errors::makeErrorResponse(req.id, JSONRPCErrorCodes::InternalError, "Invalid initialize result shape");
    }
    return makeResult(req, std::move(result));
}

std::unique_ptr<JSONRPCResponse> Server::Impl::handleToolsList(const JSONRPCRequest& req) {
    LOG_DEBUG("Handling tools/list request");
    JSONValue result = registry.ListJSON();
    if (strict() && !validation::validateToolsListResultJson(result)) {
        LOG_ERROR("Validation failed (Strict): {} result invalid", Methods::ListTools);
        return errors::makeErrorResponse(req.id, JSONRPCErrorCodes::InternalError, "Invalid tools/list result shape");
    }
    return makeResult(req, std::move(result));
}

std::unique_ptr<JSONRPCResponse> Server::Impl::handleToolsCall(const JSONRPCRequest& req) {
    LOG_DEBUG("Handling tools/call request");
    std::optional<std::string> name;
    JSONValue arguments{JSONValue::Object{}};
    if (req.params.has_value()) {
        if (const JSONValue* n = req.params->Member("name")) name = n->AsString();
        if (const JSONValue* a = req.params->Member("arguments"); a && !a->IsNull()) arguments = *a;
    }
    if (!name) {
        return errors::makeErrorResponse(req.id, JSONRPCErrorCodes::InvalidParams, "Missing tool name");
    }
    if (!registry.Find(*name)) {
        LOG_WARN("tools/call for unknown tool: {}", *name);
        return errors::makeErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: Unknown tool: " + *name);
    }

    std::string text;
    try {
        text = registry.Call(*name, arguments);
    } catch (const errors::ToolError& e) {
        LOG_WARN("Tool {} rejected call: {}", *name, e.what());
        return errors::makeErrorResponse(req.id, e.code(), e.what());
    } catch (const search::SearchError& e) {
        LOG_ERROR("Tool {} search failed: {}", *name, e.what());
        return errors::makeErrorResponse(req.id, JSONRPCErrorCodes::InternalError, e.what());
    }

    JSONValue::Object item;
    item["type"] = std::make_shared<JSONValue>("text");
    item["text"] = std::make_shared<JSONValue>(std::move(text));
    JSONValue::Array content;
    content.push_back(std::make_shared<JSONValue>(std::move(item)));
    JSONValue::Object obj;
    obj["content"] = std::make_shared<JSONValue>(std::move(content));
    JSONValue result{std::move(obj)};

    if (strict() && !validation::validateCallToolResultJson(result)) {
        LOG_ERROR("Validation failed (Strict): {} result invalid", Methods::CallTool);
        return errors::makeErrorResponse(req.id, JSONRPCErrorCodes::InternalError, "Invalid tool result shape");
    }
    return makeResult(req, std::move(result));
}

std::unique_ptr<JSONRPCResponse> Server::Impl::handleAck(const JSONRPCRequest& req) {
    LOG_DEBUG("Acknowledging {}", req.method);
    return makeResult(req, JSONValue{JSONValue::Object{}});
}

std::unique_ptr<JSONRPCResponse> Server::Impl::dispatchRequest(const JSONRPCRequest& req) {
    try {
        if (req.method == Methods::Initialize) {
            return this->handleInitialize(req);
        } else if (req.method == Methods::ListTools) {
            return this->handleToolsList(req);
        } else if (req.method == Methods::CallTool) {
            return this->handleToolsCall(req);
        } else if (req.method == Methods::Initialized || req.method == Methods::InitializedLegacy) {
            return this->handleAck(req);
        }
        LOG_DEBUG("Unknown method: {}", req.method);
        return errors::makeErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + req.method);
    } catch (const std::exception& e) {
        LOG_ERROR("Internal error handling {}: {}", req.method, e.what());
        return errors::makeErrorResponse(req.id, JSONRPCErrorCodes::InternalError, e.what());
    }
}

Server::Server(ServerConfig config, ToolRegistry registry)
    : pImpl(std::make_unique<Impl>(std::move(config), std::move(registry))) {}

Server::~Server() = default;

std::unique_ptr<JSONRPCResponse> Server::HandleJSONRPC(const JSONRPCRequest& req) {
    return pImpl->dispatchRequest(req);
}

const ToolRegistry& Server::Registry() const {
    return pImpl->registry;
}

validation::ValidationMode Server::GetValidationMode() const {
    return pImpl->config.validationMode;
}

} // namespace mdagent
