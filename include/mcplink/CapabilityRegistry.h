//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CapabilityRegistry.h
// Purpose: Thread-safe registry of tools, resources, and prompts with their handlers
//==========================================================================================================

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "mcplink/JSONRPCTypes.h"

namespace mcplink {

// The three independent capability namespaces.
enum class CapabilityKind {
    Tool,
    Resource,
    Prompt
};

const char* ToString(CapabilityKind kind);

//==========================================================================================================
// InvocationContext
// Purpose: Per-dispatch context handed to a capability handler.
// Fields:
//   requestId: Id of the request being served.
//   sessionId: Transport session id of the calling connection.
//   stopToken: Signalled when the caller cancels, the connection closes, or the server stops.
//==========================================================================================================
struct InvocationContext {
    JSONRPCId requestId{nullptr};
    std::string sessionId;
    std::stop_token stopToken;
};

//==========================================================================================================
// ICapabilityHandler
// Purpose: Executes one capability. The returned value becomes the response result verbatim.
// Throws:
//   errors::ApplicationError to report a failure with optional structured data;
//   errors::ProtocolError to answer with a specific wire code (e.g. InvalidParams).
//==========================================================================================================
class ICapabilityHandler {
public:
    virtual ~ICapabilityHandler() = default;
    virtual JSONValue Invoke(const JSONValue& params, const InvocationContext& context) = 0;
};

using HandlerFunction = std::function<JSONValue(const JSONValue&, const InvocationContext&)>;

// Adapts a callable to ICapabilityHandler.
std::shared_ptr<ICapabilityHandler> MakeHandler(HandlerFunction fn);

//==========================================================================================================
// CapabilityDescriptor
// Purpose: Registration record for one capability.
// Fields:
//   name: Tool name, resource URI, or prompt name (unique within its namespace).
//   description: Human description.
//   inputSchema: JSON schema for tool arguments; argument list (array) for prompts.
//   outputSchema: Optional JSON schema of the tool result.
//   title: Optional display name (resources list it as "name").
//   mimeType: Optional MIME type for resources.
//   handler: Executes the capability.
//   enabled: A disabled capability stays listed but cannot be invoked.
//==========================================================================================================
struct CapabilityDescriptor {
    std::string name;
    std::string description;
    std::optional<JSONValue> inputSchema;
    std::optional<JSONValue> outputSchema;
    std::optional<std::string> title;
    std::optional<std::string> mimeType;
    std::shared_ptr<ICapabilityHandler> handler;
    bool enabled{true};

    // Listing form used by tools/list, resources/list, and prompts/list.
    JSONValue ToJSONValue(CapabilityKind kind) const;
};

//==========================================================================================================
// CapabilityRegistry
// Purpose: Read-mostly store shared by all dispatches of a server. Get/List take a shared lock;
//          Register/Unregister take an exclusive lock. List preserves registration order.
//==========================================================================================================
class CapabilityRegistry {
public:
    using ChangeListener = std::function<void(CapabilityKind)>;

    CapabilityRegistry();
    ~CapabilityRegistry();

    CapabilityRegistry(const CapabilityRegistry&) = delete;
    CapabilityRegistry& operator=(const CapabilityRegistry&) = delete;

    //==========================================================================================================
    // Register
    // Purpose: Adds a capability to its namespace. Never replaces an existing entry.
    // Throws:
    //   errors::DuplicateNameError when the name is already registered in that namespace.
    //   std::invalid_argument when the name is empty or the handler is missing.
    //==========================================================================================================
    void Register(CapabilityKind kind, CapabilityDescriptor descriptor);

    // Removes a capability. Returns false when the name was not registered.
    bool Unregister(CapabilityKind kind, const std::string& name);

    //==========================================================================================================
    // SetEnabled
    // Purpose: Enables or disables a registered capability. Dispatches that already hold the descriptor
    //          finish; later lookups see the new flag. Listings are unchanged, so no change listener fires.
    // Returns:
    //   false when the name is not registered in that namespace.
    //==========================================================================================================
    bool SetEnabled(CapabilityKind kind, const std::string& name, bool enabled);

    //==========================================================================================================
    // Get
    // Purpose: Looks up a capability. The copy shares the handler, so a dispatch in flight keeps it alive
    //          across a concurrent Unregister.
    //==========================================================================================================
    std::optional<CapabilityDescriptor> Get(CapabilityKind kind, const std::string& name) const;

    std::vector<CapabilityDescriptor> List(CapabilityKind kind) const;
    std::size_t Size(CapabilityKind kind) const;

    // Called after each successful Register/Unregister, outside the registry lock.
    void SetChangeListener(ChangeListener listener);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcplink
