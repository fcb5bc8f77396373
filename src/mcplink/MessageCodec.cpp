//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageCodec.cpp
// Purpose: Envelope classification and batch handling for JSON-RPC 2.0 payloads
//==========================================================================================================

#include <stdexcept>

#include "mcplink/MessageCodec.h"

namespace mcplink {

namespace {

JSONRPCId recoverId(const JSONValue& value) {
    const JSONValue* idVal = value.Find("id");
    if (!idVal) {
        return nullptr;
    }
    if (const auto* s = std::get_if<std::string>(&idVal->value)) return *s;
    if (const auto* n = std::get_if<int64_t>(&idVal->value)) return *n;
    return nullptr;
}

DecodeError invalid(JSONRPCId id, std::string detail) {
    DecodeError e;
    e.status = DecodeStatus::InvalidEnvelope;
    e.id = std::move(id);
    e.detail = std::move(detail);
    return e;
}

bool isStructuredParams(const JSONValue& v) {
    return v.IsObject() || v.IsArray();
}

} // namespace

EnvelopeKind KindOf(const Envelope& envelope) {
    if (std::holds_alternative<JSONRPCRequest>(envelope)) {
        return EnvelopeKind::Request;
    }
    if (const auto* r = std::get_if<JSONRPCResponse>(&envelope)) {
        return r->IsError() ? EnvelopeKind::ErrorResponse : EnvelopeKind::Response;
    }
    return EnvelopeKind::Notification;
}

int DecodeError::Code() const {
    return status == DecodeStatus::ParseError ? JSONRPCErrorCodes::ParseError : JSONRPCErrorCodes::InvalidRequest;
}

bool operator==(const Batch& lhs, const Batch& rhs) {
    if (!(lhs.members == rhs.members) || lhs.invalid.size() != rhs.invalid.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.invalid.size(); ++i) {
        if (lhs.invalid[i].status != rhs.invalid[i].status || lhs.invalid[i].id != rhs.invalid[i].id) {
            return false;
        }
    }
    return true;
}

std::string MessageCodec::Encode(const Envelope& envelope) {
    return std::visit([](const auto& msg) { return msg.Serialize(); }, envelope);
}

std::string MessageCodec::Encode(const Batch& batch) {
    JSONValue::Array arr;
    arr.reserve(batch.members.size());
    for (const auto& member : batch.members) {
        JSONValue v = std::visit([](const auto& msg) { return msg.ToJSONValue(); }, member);
        arr.push_back(std::make_shared<JSONValue>(std::move(v)));
    }
    return SerializeJSONValue(JSONValue{std::move(arr)});
}

std::string MessageCodec::Encode(const Message& message) {
    return std::visit([](const auto& m) { return Encode(m); }, message);
}

std::variant<Envelope, DecodeError> MessageCodec::DecodeEnvelope(const JSONValue& value) {
    if (!value.IsObject()) {
        return invalid(nullptr, "envelope must be a JSON object");
    }
    JSONRPCId id = recoverId(value);

    auto version = value.GetString("jsonrpc");
    if (!version.has_value() || version.value() != "2.0") {
        return invalid(id, "missing or unsupported jsonrpc version");
    }

    const JSONValue* idVal = value.Find("id");
    const JSONValue* methodVal = value.Find("method");
    const JSONValue* paramsVal = value.Find("params");
    const JSONValue* resultVal = value.Find("result");
    const JSONValue* errorVal = value.Find("error");

    if (idVal && !idVal->IsString() && !idVal->IsInteger() && !idVal->IsNull()) {
        return invalid(nullptr, "id must be a string or an integer");
    }

    if (methodVal) {
        if (!methodVal->IsString() || std::get<std::string>(methodVal->value).empty()) {
            return invalid(id, "method must be a non-empty string");
        }
        if (resultVal || errorVal) {
            return invalid(id, "request carries result or error");
        }
        if (paramsVal && !isStructuredParams(*paramsVal)) {
            return invalid(id, "params must be an object or an array");
        }
        std::optional<JSONValue> params;
        if (paramsVal) {
            params = *paramsVal;
        }
        const std::string& method = std::get<std::string>(methodVal->value);
        if (!idVal) {
            return Envelope{JSONRPCNotification(method, std::move(params))};
        }
        if (idVal->IsNull()) {
            return invalid(nullptr, "request id must not be null");
        }
        return Envelope{JSONRPCRequest(id, method, std::move(params))};
    }

    if (resultVal || errorVal) {
        if (!idVal) {
            return invalid(nullptr, "response without id");
        }
        if (resultVal && errorVal) {
            return invalid(id, "response carries both result and error");
        }
        JSONRPCResponse response;
        response.id = id;
        if (resultVal) {
            if (idVal->IsNull()) {
                return invalid(nullptr, "successful response with null id");
            }
            response.result = *resultVal;
        } else {
            if (!errorVal->GetInteger("code").has_value() || !errorVal->GetString("message").has_value()) {
                return invalid(id, "error member must carry an integer code and a string message");
            }
            response.error = *errorVal;
        }
        return Envelope{std::move(response)};
    }

    return invalid(id, "envelope has neither method nor result/error");
}

DecodeResult MessageCodec::Decode(const std::string& payload) {
    DecodeResult out;
    JSONValue root;
    try {
        root = ParseJSON(payload);
    } catch (const std::exception& e) {
        out.status = DecodeStatus::ParseError;
        out.error.status = DecodeStatus::ParseError;
        out.error.id = nullptr;
        out.error.detail = e.what();
        return out;
    }

    if (const auto* arr = std::get_if<JSONValue::Array>(&root.value)) {
        if (arr->empty()) {
            out.status = DecodeStatus::InvalidEnvelope;
            out.error = invalid(nullptr, "empty batch");
            return out;
        }
        Batch batch;
        for (const auto& item : *arr) {
            const JSONValue nullValue;
            auto decoded = DecodeEnvelope(item ? *item : nullValue);
            if (auto* env = std::get_if<Envelope>(&decoded)) {
                batch.members.push_back(std::move(*env));
            } else {
                batch.invalid.push_back(std::get<DecodeError>(std::move(decoded)));
            }
        }
        out.message = Message{std::move(batch)};
        return out;
    }

    auto decoded = DecodeEnvelope(root);
    if (auto* env = std::get_if<Envelope>(&decoded)) {
        out.message = Message{std::move(*env)};
        return out;
    }
    out.error = std::get<DecodeError>(std::move(decoded));
    out.status = out.error.status;
    return out;
}

JSONRPCResponse MessageCodec::MakeErrorReply(const DecodeError& error) {
    const char* message = error.status == DecodeStatus::ParseError ? "Parse error" : "Invalid Request";
    JSONValue data = MakeObject();
    data.Set("detail", JSONValue(error.detail));
    return JSONRPCResponse(error.id, CreateErrorObject(error.Code(), message, data), true);
}

} // namespace mcplink
