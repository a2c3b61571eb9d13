//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for typed error structures and JSON-RPC error response helpers
//==========================================================================================================

#include <gtest/gtest.h>
#include "mdagent/JSONRPCTypes.h"
#include "mdagent/errors/Errors.h"

using namespace mdagent;

TEST(Errors, MakeErrorResponseCarriesCodeMessageAndData) {
    errors::RpcError e;
    e.code = JSONRPCErrorCodes::InvalidParams;
    e.message = "Missing tool name";
    e.data = JSONValue{std::string("detail")};
    auto resp = errors::makeErrorResponse(JSONRPCId{int64_t{9}}, e);
    ASSERT_TRUE(resp->IsError());
    EXPECT_FALSE(resp->result.has_value());
    ASSERT_TRUE(std::holds_alternative<int64_t>(resp->id));
    EXPECT_EQ(std::get<int64_t>(resp->id), 9);

    const JSONValue& err = *resp->error;
    EXPECT_EQ(err.Member("code")->AsInt(), std::optional<int64_t>(JSONRPCErrorCodes::InvalidParams));
    EXPECT_EQ(err.Member("message")->AsString(), std::optional<std::string>("Missing tool name"));
    ASSERT_NE(err.Member("data"), nullptr);
    EXPECT_EQ(err.Member("data")->AsString(), std::optional<std::string>("detail"));
}

TEST(Errors, ShorthandMakeErrorResponseOmitsData) {
    auto resp = errors::makeErrorResponse(JSONRPCId{std::string("x")}, JSONRPCErrorCodes::InternalError, "boom");
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(resp->error->Member("code")->AsInt(), std::optional<int64_t>(JSONRPCErrorCodes::InternalError));
    EXPECT_EQ(resp->error->Member("data"), nullptr);
    ASSERT_TRUE(std::holds_alternative<std::string>(resp->id));

    JSONValue line = DecodeJSON(resp->Serialize());
    EXPECT_EQ(line.Member("id")->AsString(), std::optional<std::string>("x"));
    EXPECT_EQ(line.Member("result"), nullptr);
    EXPECT_EQ(line.Member("error")->Member("message")->AsString(), std::optional<std::string>("boom"));
}

TEST(Errors, ToolErrorCarriesCode) {
    errors::ToolError e(JSONRPCErrorCodes::InvalidParams, "Missing required argument: q");
    EXPECT_EQ(e.code(), JSONRPCErrorCodes::InvalidParams);
    EXPECT_STREQ(e.what(), "Missing required argument: q");
}
