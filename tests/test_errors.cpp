//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for typed error structures and JSON-RPC error mapping helpers
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcplink/JSONRPCTypes.h"
#include "mcplink/MessageCodec.h"
#include "mcplink/errors/Errors.h"
#include "mcplink/ClientSession.h"
#include "mcplink/InMemoryTransport.hpp"
#include "mcplink/Protocol.h"
#include "mcplink/Server.h"
#include <chrono>
#include <future>

using namespace mcplink;

TEST(Errors, CategoryMapping) {
    using mcplink::errors::ErrorCategory;
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ParseError), ErrorCategory::JsonRpcParse);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidRequest), ErrorCategory::JsonRpcInvalidRequest);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::MethodNotFound), ErrorCategory::JsonRpcMethodNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidParams), ErrorCategory::JsonRpcInvalidParams);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InternalError), ErrorCategory::JsonRpcInternal);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ToolNotFound), ErrorCategory::ToolNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ResourceNotFound), ErrorCategory::ResourceNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::PromptNotFound), ErrorCategory::PromptNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::NotInitialized), ErrorCategory::NotInitialized);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ApplicationError), ErrorCategory::Application);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ServerOverloaded), ErrorCategory::ServerOverloaded);
    EXPECT_EQ(errors::errorCategoryFromCode(12345), ErrorCategory::Unknown);
}

TEST(Errors, CodesMatchWireValues) {
    EXPECT_EQ(JSONRPCErrorCodes::ToolNotFound, -32000);
    EXPECT_EQ(JSONRPCErrorCodes::ResourceNotFound, -32001);
    EXPECT_EQ(JSONRPCErrorCodes::PromptNotFound, -32002);
    EXPECT_EQ(JSONRPCErrorCodes::NotInitialized, -32003);
    EXPECT_EQ(JSONRPCErrorCodes::ApplicationError, -32004);
    EXPECT_EQ(JSONRPCErrorCodes::ServerOverloaded, -32005);
}

TEST(Errors, MakeErrorSetsCategory) {
    auto e = errors::makeError(JSONRPCErrorCodes::ResourceNotFound, "gone");
    EXPECT_EQ(e.category, errors::ErrorCategory::ResourceNotFound);
    EXPECT_TRUE(e.IsCapabilityNotFound());
    EXPECT_FALSE(e.data.has_value());

    auto app = errors::makeError(JSONRPCErrorCodes::ApplicationError, "nope");
    EXPECT_FALSE(app.IsCapabilityNotFound());
}

TEST(Errors, FromErrorValue_Valid) {
    JSONValue data = MakeObject();
    data.Set("foo", JSONValue("bar"));
    JSONValue errVal = CreateErrorObject(JSONRPCErrorCodes::MethodNotFound, "Method not found", data);

    auto parsed = errors::mcpErrorFromErrorValue(errVal);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->code, JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(parsed->message, std::string("Method not found"));
    EXPECT_EQ(parsed->category, errors::ErrorCategory::JsonRpcMethodNotFound);
    ASSERT_TRUE(parsed->data.has_value());
    EXPECT_EQ(parsed->data->GetString("foo").value(), "bar");
}

TEST(Errors, FromErrorValue_InvalidShape) {
    // Not an object
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(JSONValue(nullptr)).has_value());

    // Missing code
    JSONValue missCode = MakeObject();
    missCode.Set("message", JSONValue("m"));
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(missCode).has_value());

    // Missing message
    JSONValue missMsg = MakeObject();
    missMsg.Set("code", JSONValue(-1));
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(missMsg).has_value());

    // Wrong types
    JSONValue wrongTypes = MakeObject();
    wrongTypes.Set("code", JSONValue("-32601"));
    wrongTypes.Set("message", JSONValue(123));
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(wrongTypes).has_value());
}

TEST(Errors, FromResponse) {
    JSONRPCResponse resp(std::string("1"), CreateErrorObject(JSONRPCErrorCodes::InvalidParams, "bad args"), true);
    auto parsed = errors::mcpErrorFromResponse(resp);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->code, JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(parsed->message, std::string("bad args"));
    EXPECT_FALSE(parsed->data.has_value());

    JSONRPCResponse success(static_cast<int64_t>(1), MakeObject());
    EXPECT_FALSE(errors::mcpErrorFromResponse(success).has_value());
}

TEST(Errors, MakeErrorValue_RoundTrip) {
    JSONValue data = MakeObject();
    data.Set("uri", JSONValue("mem://x"));
    auto e = errors::makeError(JSONRPCErrorCodes::ResourceNotFound, "missing", data);

    JSONValue v = errors::makeErrorValue(e);
    auto parsed = errors::mcpErrorFromErrorValue(v);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->code, e.code);
    EXPECT_EQ(parsed->message, e.message);
    ASSERT_TRUE(parsed->data.has_value());
    EXPECT_EQ(parsed->data->GetString("uri").value(), "mem://x");
}

TEST(Errors, DecodedErrorReplyMapsToTypedError) {
    auto e = errors::makeError(JSONRPCErrorCodes::ToolNotFound, "no such tool");
    std::string frame = MessageCodec::Encode(Envelope{JSONRPCResponse(std::string("7"), errors::makeErrorValue(e), true)});
    DecodeResult decoded = MessageCodec::Decode(frame);
    ASSERT_TRUE(decoded.Ok());
    const auto* envelope = std::get_if<Envelope>(&decoded.message.value());
    ASSERT_NE(envelope, nullptr);
    const auto* resp = std::get_if<JSONRPCResponse>(envelope);
    ASSERT_NE(resp, nullptr);
    EXPECT_TRUE(resp->IsError());
    auto parsed = errors::mcpErrorFromResponse(*resp);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->code, e.code);
    EXPECT_EQ(parsed->message, e.message);
    EXPECT_EQ(parsed->category, errors::ErrorCategory::ToolNotFound);
}

TEST(Errors, ExceptionTypesCarryPayload) {
    errors::DuplicateNameError dup("tool", "echo");
    EXPECT_EQ(dup.name(), "echo");
    EXPECT_NE(std::string(dup.what()).find("echo"), std::string::npos);

    JSONValue detail = MakeObject();
    detail.Set("field", JSONValue("name"));
    errors::ProtocolError proto(JSONRPCErrorCodes::InvalidParams, "missing name", detail);
    EXPECT_EQ(proto.code(), JSONRPCErrorCodes::InvalidParams);
    ASSERT_TRUE(proto.data().has_value());
    EXPECT_EQ(proto.data()->GetString("field").value(), "name");

    errors::ApplicationError app("quota");
    EXPECT_STREQ(app.what(), "quota");
    EXPECT_FALSE(app.data().has_value());
}

//=============================== E2E negative-path tests =================================

TEST(ErrorsE2E, ToolsCall_InvalidParams_ErrorShape) {
    auto acceptor = std::make_unique<InMemoryAcceptor>();
    auto provider = acceptor->MakeProvider();
    Server server;
    ASSERT_NO_THROW(server.Start(std::move(acceptor)).get());

    SessionConfig cfg;
    cfg.heartbeatInterval = std::chrono::milliseconds(0);
    cfg.autoReconnect = false;
    ClientSession session(cfg);
    ASSERT_NO_THROW(session.Connect(provider).get());

    // tools/call without a name -> InvalidParams
    auto fut = session.Invoke(Methods::CallTool, MakeObject());
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    CallOutcome out = fut.get();
    EXPECT_EQ(out.status, CallStatus::ApplicationError);
    ASSERT_TRUE(out.error.has_value());
    EXPECT_EQ(out.error->code, JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(out.error->category, errors::ErrorCategory::JsonRpcInvalidParams);

    ASSERT_NO_THROW(session.Disconnect().get());
    ASSERT_NO_THROW(server.Stop().get());
}

TEST(ErrorsE2E, HandlerProtocolErrorKeepsCodeAndData) {
    auto acceptor = std::make_unique<InMemoryAcceptor>();
    auto provider = acceptor->MakeProvider();
    Server server;
    server.RegisterTool("strict", "", std::nullopt, [](const JSONValue&, const InvocationContext&) -> JSONValue {
        JSONValue data = MakeObject();
        data.Set("hint", JSONValue("pass x"));
        throw errors::ProtocolError(JSONRPCErrorCodes::InvalidParams, "x is required", data);
    });
    ASSERT_NO_THROW(server.Start(std::move(acceptor)).get());

    SessionConfig cfg;
    cfg.heartbeatInterval = std::chrono::milliseconds(0);
    cfg.autoReconnect = false;
    ClientSession session(cfg);
    ASSERT_NO_THROW(session.Connect(provider).get());

    auto fut = session.CallTool("strict", MakeObject());
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    CallOutcome out = fut.get();
    ASSERT_TRUE(out.error.has_value());
    EXPECT_EQ(out.error->code, JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(out.error->message, "x is required");
    ASSERT_TRUE(out.error->data.has_value());
    EXPECT_EQ(out.error->data->GetString("hint").value(), "pass x");

    ASSERT_NO_THROW(session.Disconnect().get());
    ASSERT_NO_THROW(server.Stop().get());
}
