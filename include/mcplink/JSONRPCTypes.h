//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON value model and JSON-RPC 2.0 envelope types
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <variant>
#include <optional>
#include <unordered_map>
#include <vector>

namespace mcplink {

//==========================================================================================================
// JSONValue
// Purpose: JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
// Notes:
//   Integers and doubles are distinct alternatives; equality never treats 1 and 1.0 as the same value.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&) noexcept;
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&) noexcept;
    ~JSONValue();

    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(int v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    auto& get() { return value; }
    const auto& get() const { return value; }

    bool IsNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool IsObject() const { return std::holds_alternative<Object>(value); }
    bool IsArray() const { return std::holds_alternative<Array>(value); }
    bool IsString() const { return std::holds_alternative<std::string>(value); }
    bool IsInteger() const { return std::holds_alternative<int64_t>(value); }

    //==========================================================================================================
    // Looks up a member of an object value.
    // Args:
    //   key: Member name.
    // Returns:
    //   Pointer to the member, or nullptr when this is not an object or the member is absent/null-pointer.
    //==========================================================================================================
    const JSONValue* Find(const std::string& key) const;

    //==========================================================================================================
    // Typed member accessors; std::nullopt when absent or of another type.
    //==========================================================================================================
    std::optional<std::string> GetString(const std::string& key) const;
    std::optional<int64_t> GetInteger(const std::string& key) const;

    //==========================================================================================================
    // Sets a member on an object value (converts a null value to an empty object first).
    //==========================================================================================================
    JSONValue& Set(const std::string& key, JSONValue member);
};

bool operator==(const JSONValue& lhs, const JSONValue& rhs);
inline bool operator!=(const JSONValue& lhs, const JSONValue& rhs) { return !(lhs == rhs); }

//==========================================================================================================
// MakeObject / MakeArray
// Purpose: Convenience builders for object and array values.
//==========================================================================================================
JSONValue MakeObject();
JSONValue MakeArray(std::vector<JSONValue> items = {});

//==========================================================================================================
// ParseJSON
// Purpose: Parses a complete JSON document.
// Args:
//   text: JSON text; surrounding whitespace is allowed, trailing garbage is not.
// Returns:
//   The parsed value.
// Throws:
//   std::runtime_error with a position-bearing message on malformed input.
//==========================================================================================================
JSONValue ParseJSON(const std::string& text);

//==========================================================================================================
// SerializeJSONValue
// Purpose: Serializes a value to compact JSON text (no insignificant whitespace).
//==========================================================================================================
std::string SerializeJSONValue(const JSONValue& value);

//==========================================================================================================
// JSONRPCId
// Purpose: JSON-RPC 2.0 id variant: string, integer, or null.
//==========================================================================================================
using JSONRPCId = std::variant<std::string, int64_t, std::nullptr_t>;

//==========================================================================================================
// IdToString
// Purpose: Diagnostic/lookup key for an id. Strings and integers never collide ("s:1" vs "i:1").
//==========================================================================================================
std::string IdToString(const JSONRPCId& id);

// JSON value form of an id (string, integer, or null).
JSONValue IdToJSONValue(const JSONRPCId& id);

//==========================================================================================================
// JSONRPCMessage
// Purpose: Abstract base for JSON-RPC 2.0 messages providing serialization APIs.
// Methods:
//   ToJSONValue(): Structured form of the message.
//   Serialize(): Compact JSON string for the message.
// Notes:
//   Decoding goes through MessageCodec::Decode, which validates the envelope.
//==========================================================================================================
class JSONRPCMessage {
public:
    std::string jsonrpc = "2.0";

    virtual ~JSONRPCMessage() = default;
    virtual JSONValue ToJSONValue() const = 0;

    std::string Serialize() const;
};

//==========================================================================================================
// JSONRPCRequest
// Purpose: JSON-RPC 2.0 request message with id, method, and optional params.
//==========================================================================================================
class JSONRPCRequest : public JSONRPCMessage {
public:
    JSONRPCId id;
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCRequest() = default;
    JSONRPCRequest(JSONRPCId id, std::string method, std::optional<JSONValue> params = std::nullopt)
        : id(std::move(id)), method(std::move(method)), params(std::move(params)) {}

    JSONValue ToJSONValue() const override;
};

//==========================================================================================================
// JSONRPCResponse
// Purpose: JSON-RPC 2.0 response message carrying either result or error.
// Ctors:
//   JSONRPCResponse(id, result): Success response with result set.
//   JSONRPCResponse(id, error, /*isError*/): Error response with error set.
//==========================================================================================================
class JSONRPCResponse : public JSONRPCMessage {
public:
    JSONRPCId id;
    std::optional<JSONValue> result;
    std::optional<JSONValue> error;

    JSONRPCResponse() = default;
    JSONRPCResponse(JSONRPCId id, JSONValue result)
        : id(std::move(id)), result(std::move(result)) {}
    JSONRPCResponse(JSONRPCId id, JSONValue error, bool /*isError*/)
        : id(std::move(id)), error(std::move(error)) {}

    JSONValue ToJSONValue() const override;

    bool IsError() const { return error.has_value(); }
};

//==========================================================================================================
// JSONRPCNotification
// Purpose: JSON-RPC 2.0 notification (no id, no response).
//==========================================================================================================
class JSONRPCNotification : public JSONRPCMessage {
public:
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCNotification() = default;
    JSONRPCNotification(std::string method, std::optional<JSONValue> params = std::nullopt)
        : method(std::move(method)), params(std::move(params)) {}

    JSONValue ToJSONValue() const override;
};

bool operator==(const JSONRPCRequest& lhs, const JSONRPCRequest& rhs);
bool operator==(const JSONRPCResponse& lhs, const JSONRPCResponse& rhs);
bool operator==(const JSONRPCNotification& lhs, const JSONRPCNotification& rhs);

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC error codes plus the protocol-specific codes in the -320xx range.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;

    constexpr int ToolNotFound = -32000;
    constexpr int ResourceNotFound = -32001;
    constexpr int PromptNotFound = -32002;
    constexpr int NotInitialized = -32003;
    constexpr int ApplicationError = -32004;
    constexpr int ServerOverloaded = -32005;
}

//==========================================================================================================
// CreateErrorObject
// Purpose: Build a JSON error object with shape { code, message, data? }.
//==========================================================================================================
JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data = std::nullopt);

} // namespace mcplink
