//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_capability_registry.cpp
// Purpose: Tests for capability registration, lookup, ordering and listing shapes
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "mcplink/CapabilityRegistry.h"
#include "mcplink/errors/Errors.h"

using namespace mcplink;

namespace {

CapabilityDescriptor describe(const std::string& name, const std::string& reply = "ok") {
    CapabilityDescriptor d;
    d.name = name;
    d.description = "returns " + reply;
    d.handler = MakeHandler([reply](const JSONValue&, const InvocationContext&) { return JSONValue(reply); });
    return d;
}

} // namespace

TEST(CapabilityRegistry, RegisterAndInvokeThroughLookup) {
    CapabilityRegistry registry;
    registry.Register(CapabilityKind::Tool, describe("echo", "pong"));
    auto found = registry.Get(CapabilityKind::Tool, "echo");
    ASSERT_TRUE(found.has_value());
    InvocationContext ctx;
    EXPECT_EQ(found->handler->Invoke(MakeObject(), ctx), JSONValue("pong"));
    EXPECT_FALSE(registry.Get(CapabilityKind::Tool, "missing").has_value());
}

TEST(CapabilityRegistry, DuplicateNameInSameNamespaceIsRejected) {
    CapabilityRegistry registry;
    registry.Register(CapabilityKind::Tool, describe("echo", "first"));
    try {
        registry.Register(CapabilityKind::Tool, describe("echo", "second"));
        FAIL() << "expected DuplicateNameError";
    } catch (const errors::DuplicateNameError& e) {
        EXPECT_EQ(e.name(), "echo");
    }
    // The original registration is untouched
    InvocationContext ctx;
    EXPECT_EQ(registry.Get(CapabilityKind::Tool, "echo")->handler->Invoke(MakeObject(), ctx), JSONValue("first"));
    EXPECT_EQ(registry.Size(CapabilityKind::Tool), 1u);
}

TEST(CapabilityRegistry, SetEnabledTogglesLookupFlagOnly) {
    CapabilityRegistry registry;
    std::atomic<int> changes{0};
    registry.Register(CapabilityKind::Tool, describe("switchable"));
    registry.SetChangeListener([&](CapabilityKind) { ++changes; });

    EXPECT_TRUE(registry.Get(CapabilityKind::Tool, "switchable")->enabled);
    EXPECT_TRUE(registry.SetEnabled(CapabilityKind::Tool, "switchable", false));
    EXPECT_FALSE(registry.Get(CapabilityKind::Tool, "switchable")->enabled);
    ASSERT_EQ(registry.List(CapabilityKind::Tool).size(), 1u);
    EXPECT_FALSE(registry.List(CapabilityKind::Tool)[0].enabled);

    EXPECT_TRUE(registry.SetEnabled(CapabilityKind::Tool, "switchable", true));
    EXPECT_TRUE(registry.Get(CapabilityKind::Tool, "switchable")->enabled);

    EXPECT_FALSE(registry.SetEnabled(CapabilityKind::Tool, "missing", false));
    EXPECT_FALSE(registry.SetEnabled(CapabilityKind::Prompt, "switchable", false));
    EXPECT_EQ(changes.load(), 0);
}

TEST(CapabilityRegistry, NamespacesAreIndependent) {
    CapabilityRegistry registry;
    registry.Register(CapabilityKind::Tool, describe("shared"));
    EXPECT_NO_THROW(registry.Register(CapabilityKind::Prompt, describe("shared")));
    EXPECT_NO_THROW(registry.Register(CapabilityKind::Resource, describe("shared")));
    EXPECT_EQ(registry.Size(CapabilityKind::Tool), 1u);
    EXPECT_EQ(registry.Size(CapabilityKind::Prompt), 1u);
    EXPECT_EQ(registry.Size(CapabilityKind::Resource), 1u);
}

TEST(CapabilityRegistry, RejectsEmptyNameAndMissingHandler) {
    CapabilityRegistry registry;
    EXPECT_THROW(registry.Register(CapabilityKind::Tool, describe("")), std::invalid_argument);
    CapabilityDescriptor noHandler;
    noHandler.name = "bare";
    EXPECT_THROW(registry.Register(CapabilityKind::Tool, noHandler), std::invalid_argument);
    EXPECT_THROW(MakeHandler(HandlerFunction{}), std::invalid_argument);
}

TEST(CapabilityRegistry, ListPreservesRegistrationOrder) {
    CapabilityRegistry registry;
    for (const char* n : {"zeta", "alpha", "mid"}) {
        registry.Register(CapabilityKind::Tool, describe(n));
    }
    auto listed = registry.List(CapabilityKind::Tool);
    ASSERT_EQ(listed.size(), 3u);
    EXPECT_EQ(listed[0].name, "zeta");
    EXPECT_EQ(listed[1].name, "alpha");
    EXPECT_EQ(listed[2].name, "mid");

    EXPECT_TRUE(registry.Unregister(CapabilityKind::Tool, "alpha"));
    registry.Register(CapabilityKind::Tool, describe("alpha"));
    listed = registry.List(CapabilityKind::Tool);
    EXPECT_EQ(listed[2].name, "alpha");
}

TEST(CapabilityRegistry, UnregisterUnknownReturnsFalse) {
    CapabilityRegistry registry;
    EXPECT_FALSE(registry.Unregister(CapabilityKind::Resource, "file:///nope"));
}

TEST(CapabilityRegistry, LookupKeepsHandlerAliveAcrossUnregister) {
    CapabilityRegistry registry;
    registry.Register(CapabilityKind::Tool, describe("ephemeral", "still here"));
    auto held = registry.Get(CapabilityKind::Tool, "ephemeral");
    ASSERT_TRUE(registry.Unregister(CapabilityKind::Tool, "ephemeral"));
    InvocationContext ctx;
    EXPECT_EQ(held->handler->Invoke(MakeObject(), ctx), JSONValue("still here"));
}

TEST(CapabilityRegistry, ChangeListenerSeesEachMutation) {
    CapabilityRegistry registry;
    std::vector<CapabilityKind> changes;
    registry.SetChangeListener([&](CapabilityKind k) { changes.push_back(k); });

    registry.Register(CapabilityKind::Tool, describe("a"));
    registry.Register(CapabilityKind::Prompt, describe("b"));
    EXPECT_THROW(registry.Register(CapabilityKind::Tool, describe("a")), errors::DuplicateNameError);
    registry.Unregister(CapabilityKind::Tool, "a");
    registry.Unregister(CapabilityKind::Tool, "a");

    ASSERT_EQ(changes.size(), 3u);
    EXPECT_EQ(changes[0], CapabilityKind::Tool);
    EXPECT_EQ(changes[1], CapabilityKind::Prompt);
    EXPECT_EQ(changes[2], CapabilityKind::Tool);
}

TEST(CapabilityRegistry, ConcurrentRegistrationAdmitsExactlyOneWinner) {
    CapabilityRegistry registry;
    std::atomic<int> winners{0};
    std::atomic<int> losers{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            try {
                registry.Register(CapabilityKind::Tool, describe("contended"));
                ++winners;
            } catch (const errors::DuplicateNameError&) {
                ++losers;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(losers.load(), 7);
}

TEST(CapabilityDescriptor, ToolListingDefaultsInputSchema) {
    CapabilityDescriptor d = describe("echo");
    JSONValue listed = d.ToJSONValue(CapabilityKind::Tool);
    EXPECT_EQ(listed.GetString("name").value(), "echo");
    EXPECT_EQ(listed.GetString("description").value(), "returns ok");
    const JSONValue* schema = listed.Find("inputSchema");
    ASSERT_NE(schema, nullptr);
    EXPECT_EQ(schema->GetString("type").value(), "object");
    EXPECT_EQ(listed.Find("outputSchema"), nullptr);
}

TEST(CapabilityDescriptor, ResourceListingUsesUri) {
    CapabilityDescriptor d = describe("file:///readme.md");
    d.title = "README";
    d.mimeType = "text/markdown";
    JSONValue listed = d.ToJSONValue(CapabilityKind::Resource);
    EXPECT_EQ(listed.GetString("uri").value(), "file:///readme.md");
    EXPECT_EQ(listed.GetString("name").value(), "README");
    EXPECT_EQ(listed.GetString("mimeType").value(), "text/markdown");
}

TEST(CapabilityDescriptor, PromptListingCarriesArguments) {
    CapabilityDescriptor d = describe("greet");
    JSONValue arg = MakeObject();
    arg.Set("name", JSONValue("who"));
    arg.Set("required", JSONValue(true));
    d.inputSchema = MakeArray({arg});
    JSONValue listed = d.ToJSONValue(CapabilityKind::Prompt);
    const JSONValue* args = listed.Find("arguments");
    ASSERT_NE(args, nullptr);
    ASSERT_TRUE(args->IsArray());
    EXPECT_EQ(std::get<JSONValue::Array>(args->value).size(), 1u);
}
