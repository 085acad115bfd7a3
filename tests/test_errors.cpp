//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for the error taxonomy and JSON-RPC error mapping helpers
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcprt/JSONRPCTypes.h"
#include "mcprt/errors/Errors.h"

using namespace mcprt;

TEST(Errors, CategoryMapping) {
    using errors::ErrorCategory;
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ParseError), ErrorCategory::JsonRpcParse);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidRequest), ErrorCategory::JsonRpcInvalidRequest);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::MethodNotFound), ErrorCategory::JsonRpcMethodNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidParams), ErrorCategory::JsonRpcInvalidParams);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InternalError), ErrorCategory::JsonRpcInternal);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ServerError), ErrorCategory::ServerError);
    EXPECT_EQ(errors::errorCategoryFromCode(12345), ErrorCategory::Unknown);
}

TEST(Errors, ErrorObjectRoundTrip) {
    JSONValue obj = CreateErrorObject(JSONRPCErrorCodes::InvalidParams, "bad args",
                                      MakeObject({{"field", JSONValue{std::string("name")}}}));
    auto err = errors::mcpErrorFromErrorValue(obj);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(err->message, "bad args");
    ASSERT_TRUE(err->data.has_value());
    EXPECT_EQ(GetString(*err->data, "field").value_or(""), "name");
}

TEST(Errors, MalformedErrorObjectIsRejected) {
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(MakeObject({{"message", JSONValue{std::string("x")}}})).has_value());
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(JSONValue{std::string("oops")}).has_value());
}

TEST(Errors, KindsAndCancellationReasons) {
    errors::CancellationError c("stopped", errors::CancellationReason::Timeout);
    EXPECT_EQ(c.Kind(), errors::ErrorKind::Cancellation);
    EXPECT_EQ(c.Reason(), errors::CancellationReason::Timeout);
    EXPECT_TRUE(errors::isCancellationError(c));
    EXPECT_FALSE(errors::isCancellationError(errors::TimeoutError("late")));
    EXPECT_EQ(errors::ConfigError("x").Kind(), errors::ErrorKind::Config);

    for (auto r : {errors::CancellationReason::UserCancelled, errors::CancellationReason::Timeout,
                   errors::CancellationReason::ServerRequest, errors::CancellationReason::Shutdown,
                   errors::CancellationReason::Error}) {
        EXPECT_EQ(errors::cancellationReasonFromString(errors::toString(r)), r);
    }
    EXPECT_FALSE(errors::cancellationReasonFromString("bogus").has_value());
}

TEST(Errors, RemoteErrorKeepsPeerError) {
    errors::McpError e;
    e.code = JSONRPCErrorCodes::MethodNotFound;
    e.message = "Method not found: x";
    errors::RemoteError remote(e);
    EXPECT_STREQ(remote.what(), "Method not found: x");
    EXPECT_EQ(remote.Error().code, JSONRPCErrorCodes::MethodNotFound);
}
