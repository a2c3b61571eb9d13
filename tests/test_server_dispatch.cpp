//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_server_dispatch.cpp
// Purpose: GoogleTests for method routing, id echo, tools/call envelopes and error mapping
//==========================================================================================================

#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include "mdagent/SearchTools.h"
#include "mdagent/Server.h"

using namespace mdagent;

namespace {

class FakeEngine : public search::ISearchEngine {
public:
    bool failSearch{false};
    bool throwRuntime{false};

    std::vector<search::SearchResult> Execute(const search::SearchRequest&) override {
        if (failSearch) throw search::SearchError("Query failed: bad syntax");
        if (throwRuntime) throw std::runtime_error("unexpected");
        search::SearchResult r; r.path = "/found";
        return {r};
    }
    int64_t Count(const std::string&, const std::vector<std::string>&) override { return 3; }
    std::string Metadata(const std::string& path) override { return "meta:" + path; }
};

std::unique_ptr<Server> makeServer(std::shared_ptr<FakeEngine> engine = std::make_shared<FakeEngine>(),
                                   const std::set<std::string>& enabled = {}) {
    ServerConfig cfg;
    cfg.info = Implementation{"mdagent", "1.0.0"};
    return std::make_unique<Server>(cfg, MakeDefaultToolRegistry(std::move(engine), enabled));
}

JSONRPCRequest request(JSONRPCId id, const std::string& method, const std::string& params = "") {
    JSONRPCRequest req(std::move(id), method);
    if (!params.empty()) req.params = DecodeJSON(params);
    return req;
}

int errorCode(const JSONRPCResponse& resp) {
    if (!resp.error) return 0;
    const JSONValue* code = resp.error->Member("code");
    return (code && code->AsInt()) ? static_cast<int>(*code->AsInt()) : 0;
}

std::string errorMessage(const JSONRPCResponse& resp) {
    if (!resp.error) return std::string();
    const JSONValue* message = resp.error->Member("message");
    return (message && message->AsString()) ? *message->AsString() : std::string();
}

} // namespace

TEST(ServerDispatch, InitializeReportsIdentity) {
    auto server = makeServer();
    auto resp = server->HandleJSONRPC(request(int64_t{1}, "initialize", "{}"));
    ASSERT_FALSE(resp->IsError());
    const JSONValue& r = *resp->result;
    EXPECT_EQ(r.Member("protocolVersion")->AsString(), std::optional<std::string>("2024-11-05"));
    EXPECT_EQ(r.Member("serverInfo")->Member("name")->AsString(), std::optional<std::string>("mdagent"));
    EXPECT_EQ(r.Member("serverInfo")->Member("version")->AsString(), std::optional<std::string>("1.0.0"));
    ASSERT_NE(r.Member("capabilities"), nullptr);
    EXPECT_NE(r.Member("capabilities")->Member("tools"), nullptr);
}

TEST(ServerDispatch, IdVariantIsEchoed) {
    auto server = makeServer();
    auto intResp = server->HandleJSONRPC(request(int64_t{5}, "tools/list"));
    ASSERT_TRUE(std::holds_alternative<int64_t>(intResp->id));
    EXPECT_EQ(std::get<int64_t>(intResp->id), 5);

    auto strResp = server->HandleJSONRPC(request(std::string("5"), "tools/list"));
    ASSERT_TRUE(std::holds_alternative<std::string>(strResp->id));
    EXPECT_EQ(std::get<std::string>(strResp->id), "5");

    auto errResp = server->HandleJSONRPC(request(std::string("e"), "nope"));
    ASSERT_TRUE(std::holds_alternative<std::string>(errResp->id));
}

TEST(ServerDispatch, ToolsListHonoursFilter) {
    auto server = makeServer(std::make_shared<FakeEngine>(), {"count"});
    auto resp = server->HandleJSONRPC(request(int64_t{1}, "tools/list"));
    const JSONValue* tools = resp->result->Member("tools");
    ASSERT_NE(tools, nullptr);
    ASSERT_EQ(tools->AsArray()->size(), 1u);
    EXPECT_EQ((*tools->AsArray())[0]->Member("name")->AsString(), std::optional<std::string>("count"));
}

TEST(ServerDispatch, NotificationsAreAcknowledged) {
    auto server = makeServer();
    for (const char* m : {"initialized", "notifications/initialized"}) {
        auto resp = server->HandleJSONRPC(request(nullptr, m));
        ASSERT_FALSE(resp->IsError()) << m;
        ASSERT_NE(resp->result->AsObject(), nullptr);
        EXPECT_TRUE(resp->result->AsObject()->empty());
    }
}

TEST(ServerDispatch, UnknownMethodNamesTheMethod) {
    auto server = makeServer();
    auto resp = server->HandleJSONRPC(request(int64_t{2}, "Tools/List"));
    EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(errorMessage(*resp), "Method not found: Tools/List");
}

TEST(ServerDispatch, ToolsCallWrapsTextContent) {
    auto server = makeServer();
    auto resp = server->HandleJSONRPC(request(int64_t{3}, "tools/call",
        "{\"name\":\"count\",\"arguments\":{\"q\":\"@kind:folder\"}}"));
    ASSERT_FALSE(resp->IsError());
    const JSONValue* content = resp->result->Member("content");
    ASSERT_NE(content, nullptr);
    ASSERT_EQ(content->AsArray()->size(), 1u);
    const JSONValue& item = *(*content->AsArray())[0];
    EXPECT_EQ(item.Member("type")->AsString(), std::optional<std::string>("text"));
    EXPECT_EQ(item.Member("text")->AsString(), std::optional<std::string>("3"));
}

TEST(ServerDispatch, ToolsCallArgumentsDefaultToEmptyObject) {
    auto server = makeServer();
    auto resp = server->HandleJSONRPC(request(int64_t{4}, "tools/call", "{\"name\":\"search\"}"));
    EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::InvalidParams);
}

TEST(ServerDispatch, ToolsCallMissingName) {
    auto server = makeServer();
    EXPECT_EQ(errorCode(*server->HandleJSONRPC(request(int64_t{1}, "tools/call"))), JSONRPCErrorCodes::InvalidParams);
    auto resp = server->HandleJSONRPC(request(int64_t{1}, "tools/call", "{\"name\":7}"));
    EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(errorMessage(*resp), "Missing tool name");
}

TEST(ServerDispatch, UnknownOrFilteredToolIsMethodNotFound) {
    auto server = makeServer(std::make_shared<FakeEngine>(), {"search"});
    auto resp = server->HandleJSONRPC(request(int64_t{1}, "tools/call", "{\"name\":\"meta\",\"arguments\":{\"path\":\"/x\"}}"));
    EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(errorMessage(*resp), "Method not found: Unknown tool: meta");
}

TEST(ServerDispatch, CollaboratorFailuresAreInternalErrors) {
    auto engine = std::make_shared<FakeEngine>();
    auto server = makeServer(engine);
    engine->failSearch = true;
    auto resp = server->HandleJSONRPC(request(int64_t{1}, "tools/call", "{\"name\":\"search\",\"arguments\":{\"q\":\"x\"}}"));
    EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(errorMessage(*resp), "Query failed: bad syntax");

    engine->failSearch = false;
    engine->throwRuntime = true;
    resp = server->HandleJSONRPC(request(int64_t{2}, "tools/call", "{\"name\":\"search\",\"arguments\":{\"q\":\"x\"}}"));
    EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(errorMessage(*resp), "unexpected");
}
