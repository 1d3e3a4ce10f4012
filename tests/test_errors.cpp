//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for typed error structures and JSON-RPC error mapping helpers
//==========================================================================================================

#include <gtest/gtest.h>

#include <future>
#include <string>

#include "mcpbridge/JSONRPCTypes.h"
#include "mcpbridge/errors/Errors.h"

using namespace mcpbridge;
using namespace mcpbridge::errors;

TEST(Errors, CategoryMapping) {
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::ParseError), ErrorCategory::JsonRpcParse);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::InvalidRequest), ErrorCategory::JsonRpcInvalidRequest);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::MethodNotFound), ErrorCategory::JsonRpcMethodNotFound);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::InvalidParams), ErrorCategory::JsonRpcInvalidParams);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::InternalError), ErrorCategory::JsonRpcInternal);
    EXPECT_EQ(errorCategoryFromCode(12345), ErrorCategory::Unknown);
}

TEST(Errors, ErrorValueRoundTrip) {
    McpError e;
    e.code = JSONRPCErrorCodes::InvalidParams;
    e.message = "bad";
    e.data = ParseJSON(R"({"field":"name"})");
    auto parsed = mcpErrorFromErrorValue(makeErrorValue(e));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->code, -32602);
    EXPECT_EQ(parsed->message, "bad");
    EXPECT_EQ(parsed->category, ErrorCategory::JsonRpcInvalidParams);
    ASSERT_TRUE(parsed->data.has_value());
    EXPECT_EQ(parsed->data.value(), e.data.value());
}

TEST(Errors, MalformedErrorObjectIsRejected) {
    EXPECT_FALSE(mcpErrorFromErrorValue(ParseJSON(R"({"message":"no code"})")).has_value());
    EXPECT_FALSE(mcpErrorFromErrorValue(ParseJSON(R"({"code":"x","message":"m"})")).has_value());
    EXPECT_FALSE(mcpErrorFromErrorValue(ParseJSON("[]")).has_value());
}

TEST(Errors, ResponseWithoutErrorYieldsNothing) {
    JSONRPCResponse ok(std::string("1"), JSONValue{JSONValue::Object{}});
    EXPECT_FALSE(mcpErrorFromResponse(ok).has_value());
}

TEST(Errors, BackendErrorBecomesProtocolError) {
    auto resp = CreateErrorResponse(std::string("1"), JSONRPCErrorCodes::InternalError, "disk full");
    BridgeError err = protocolErrorFromResponse("tools/call", *resp);
    EXPECT_EQ(err.kind(), ErrorKind::Protocol);
    EXPECT_EQ(std::string(err.what()), "tools/call failed: disk full (code -32603)");

    JSONRPCResponse odd;
    odd.id = std::string("2");
    odd.error = ParseJSON(R"({"oops":true})");
    EXPECT_EQ(std::string(protocolErrorFromResponse("tools/list", odd).what()),
              "tools/list failed: malformed error object");
}

TEST(Errors, KindSurvivesFutureTransport) {
    std::promise<int> p;
    auto f = p.get_future();
    p.set_exception(std::make_exception_ptr(BridgeError(ErrorKind::Timeout, "late")));
    try {
        (void)f.get();
        FAIL() << "expected BridgeError";
    } catch (const BridgeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Timeout);
        EXPECT_STREQ(errorKindName(e.kind()), "Timeout");
    }
}

TEST(Errors, KindNames) {
    EXPECT_STREQ(errorKindName(ErrorKind::SpawnFailed), "SpawnFailed");
    EXPECT_STREQ(errorKindName(ErrorKind::TransportClosed), "TransportClosed");
    EXPECT_STREQ(errorKindName(ErrorKind::OAuth), "OAuth");
    EXPECT_STREQ(errorKindName(ErrorKind::ServerNotFound), "ServerNotFound");
    EXPECT_STREQ(errorKindName(ErrorKind::AlreadyConnected), "AlreadyConnected");
}
