//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CapabilityRegistry.cpp
// Purpose: Thread-safe capability registry implementation
//==========================================================================================================

#include <array>
#include <cstdint>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <unordered_map>
#include <utility>

#include "logging/Logger.h"
#include "mcplink/CapabilityRegistry.h"
#include "mcplink/errors/Errors.h"

namespace mcplink {

const char* ToString(CapabilityKind kind) {
    switch (kind) {
        case CapabilityKind::Tool: return "tool";
        case CapabilityKind::Resource: return "resource";
        case CapabilityKind::Prompt: return "prompt";
    }
    return "unknown";
}

namespace {

class FunctionHandler : public ICapabilityHandler {
public:
    explicit FunctionHandler(HandlerFunction f) : fn(std::move(f)) {}

    JSONValue Invoke(const JSONValue& params, const InvocationContext& context) override {
        return fn(params, context);
    }

private:
    HandlerFunction fn;
};

} // namespace

std::shared_ptr<ICapabilityHandler> MakeHandler(HandlerFunction fn) {
    if (!fn) {
        throw std::invalid_argument("MakeHandler: empty function");
    }
    return std::make_shared<FunctionHandler>(std::move(fn));
}

JSONValue CapabilityDescriptor::ToJSONValue(CapabilityKind kind) const {
    JSONValue obj = MakeObject();
    switch (kind) {
        case CapabilityKind::Tool: {
            obj.Set("name", JSONValue(name));
            if (!description.empty()) {
                obj.Set("description", JSONValue(description));
            }
            if (inputSchema.has_value()) {
                obj.Set("inputSchema", inputSchema.value());
            } else {
                JSONValue schema = MakeObject();
                schema.Set("type", JSONValue("object"));
                obj.Set("inputSchema", std::move(schema));
            }
            if (outputSchema.has_value()) {
                obj.Set("outputSchema", outputSchema.value());
            }
            if (title.has_value()) {
                obj.Set("title", JSONValue(title.value()));
            }
            break;
        }
        case CapabilityKind::Resource: {
            obj.Set("uri", JSONValue(name));
            obj.Set("name", JSONValue(title.has_value() ? title.value() : name));
            if (!description.empty()) {
                obj.Set("description", JSONValue(description));
            }
            if (mimeType.has_value()) {
                obj.Set("mimeType", JSONValue(mimeType.value()));
            }
            break;
        }
        case CapabilityKind::Prompt: {
            obj.Set("name", JSONValue(name));
            if (!description.empty()) {
                obj.Set("description", JSONValue(description));
            }
            if (inputSchema.has_value() && inputSchema->IsArray()) {
                obj.Set("arguments", inputSchema.value());
            }
            if (title.has_value()) {
                obj.Set("title", JSONValue(title.value()));
            }
            break;
        }
    }
    return obj;
}

class CapabilityRegistry::Impl {
public:
    struct Namespace {
        std::map<std::uint64_t, CapabilityDescriptor> ordered; // registration sequence -> descriptor
        std::unordered_map<std::string, std::uint64_t> index;  // name -> registration sequence
    };

    mutable std::shared_mutex mutex;
    std::array<Namespace, 3> namespaces;
    std::uint64_t nextSeq{0};

    std::mutex listenerMutex;
    ChangeListener listener;

    Namespace& ns(CapabilityKind kind) { return namespaces[static_cast<std::size_t>(kind)]; }
    const Namespace& ns(CapabilityKind kind) const { return namespaces[static_cast<std::size_t>(kind)]; }

    void notify(CapabilityKind kind) {
        ChangeListener l;
        {
            std::lock_guard<std::mutex> lk(listenerMutex);
            l = listener;
        }
        if (l) {
            l(kind);
        }
    }
};

CapabilityRegistry::CapabilityRegistry() : pImpl(std::make_unique<Impl>()) {}

CapabilityRegistry::~CapabilityRegistry() = default;

void CapabilityRegistry::Register(CapabilityKind kind, CapabilityDescriptor descriptor) {
    if (descriptor.name.empty()) {
        throw std::invalid_argument(std::string("cannot register ") + ToString(kind) + " with an empty name");
    }
    if (!descriptor.handler) {
        throw std::invalid_argument(std::string(ToString(kind)) + " '" + descriptor.name + "' has no handler");
    }
    {
        std::unique_lock<std::shared_mutex> lk(pImpl->mutex);
        auto& space = pImpl->ns(kind);
        if (space.index.count(descriptor.name) != 0) {
            throw errors::DuplicateNameError(ToString(kind), descriptor.name);
        }
        const std::uint64_t seq = pImpl->nextSeq++;
        space.index.emplace(descriptor.name, seq);
        LOG_DEBUG("Registered {} '{}'", ToString(kind), descriptor.name);
        space.ordered.emplace(seq, std::move(descriptor));
    }
    pImpl->notify(kind);
}

bool CapabilityRegistry::Unregister(CapabilityKind kind, const std::string& name) {
    {
        std::unique_lock<std::shared_mutex> lk(pImpl->mutex);
        auto& space = pImpl->ns(kind);
        auto it = space.index.find(name);
        if (it == space.index.end()) {
            return false;
        }
        space.ordered.erase(it->second);
        space.index.erase(it);
        LOG_DEBUG("Unregistered {} '{}'", ToString(kind), name);
    }
    pImpl->notify(kind);
    return true;
}

bool CapabilityRegistry::SetEnabled(CapabilityKind kind, const std::string& name, bool enabled) {
    std::unique_lock<std::shared_mutex> lk(pImpl->mutex);
    auto& space = pImpl->ns(kind);
    auto it = space.index.find(name);
    if (it == space.index.end()) {
        return false;
    }
    space.ordered.at(it->second).enabled = enabled;
    LOG_DEBUG("{} {} '{}'", enabled ? "Enabled" : "Disabled", ToString(kind), name);
    return true;
}

std::optional<CapabilityDescriptor> CapabilityRegistry::Get(CapabilityKind kind, const std::string& name) const {
    std::shared_lock<std::shared_mutex> lk(pImpl->mutex);
    const auto& space = pImpl->ns(kind);
    auto it = space.index.find(name);
    if (it == space.index.end()) {
        return std::nullopt;
    }
    return space.ordered.at(it->second);
}

std::vector<CapabilityDescriptor> CapabilityRegistry::List(CapabilityKind kind) const {
    std::shared_lock<std::shared_mutex> lk(pImpl->mutex);
    const auto& space = pImpl->ns(kind);
    std::vector<CapabilityDescriptor> out;
    out.reserve(space.ordered.size());
    for (const auto& kv : space.ordered) {
        out.push_back(kv.second);
    }
    return out;
}

std::size_t CapabilityRegistry::Size(CapabilityKind kind) const {
    std::shared_lock<std::shared_mutex> lk(pImpl->mutex);
    return pImpl->ns(kind).index.size();
}

void CapabilityRegistry::SetChangeListener(ChangeListener listener) {
    std::lock_guard<std::mutex> lk(pImpl->listenerMutex);
    pImpl->listener = std::move(listener);
}

} // namespace mcplink
