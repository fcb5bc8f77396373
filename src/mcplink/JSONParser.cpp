//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Recursive-descent JSON parser, compact serializer, and JSON-RPC message (de)serialization
//==========================================================================================================

#include <cmath>
#include <cctype>
#include <stdexcept>
#include <fmt/format.h>

#include "mcplink/JSONRPCTypes.h"

namespace mcplink {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) noexcept = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) noexcept = default;
JSONValue::~JSONValue() = default;

JSONValue::JSONValue(std::nullptr_t) : value(nullptr) {}
JSONValue::JSONValue(bool v) : value(v) {}
JSONValue::JSONValue(int64_t v) : value(v) {}
JSONValue::JSONValue(int v) : value(static_cast<int64_t>(v)) {}
JSONValue::JSONValue(double v) : value(v) {}
JSONValue::JSONValue(const char* s) : value(std::string(s ? s : "")) {}
JSONValue::JSONValue(const std::string& s) : value(s) {}
JSONValue::JSONValue(std::string&& s) : value(std::move(s)) {}
JSONValue::JSONValue(const Array& a) : value(a) {}
JSONValue::JSONValue(Array&& a) : value(std::move(a)) {}
JSONValue::JSONValue(const Object& o) : value(o) {}
JSONValue::JSONValue(Object&& o) : value(std::move(o)) {}

const JSONValue* JSONValue::Find(const std::string& key) const {
    const auto* obj = std::get_if<Object>(&value);
    if (!obj) {
        return nullptr;
    }
    auto it = obj->find(key);
    if (it == obj->end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

std::optional<std::string> JSONValue::GetString(const std::string& key) const {
    const JSONValue* v = Find(key);
    if (!v || !v->IsString()) {
        return std::nullopt;
    }
    return std::get<std::string>(v->value);
}

std::optional<int64_t> JSONValue::GetInteger(const std::string& key) const {
    const JSONValue* v = Find(key);
    if (!v || !v->IsInteger()) {
        return std::nullopt;
    }
    return std::get<int64_t>(v->value);
}

JSONValue& JSONValue::Set(const std::string& key, JSONValue member) {
    if (IsNull()) {
        value = Object{};
    }
    auto* obj = std::get_if<Object>(&value);
    if (!obj) {
        throw std::logic_error("JSONValue::Set called on a non-object value");
    }
    (*obj)[key] = std::make_shared<JSONValue>(std::move(member));
    return *this;
}

JSONValue MakeObject() {
    return JSONValue{JSONValue::Object{}};
}

JSONValue MakeArray(std::vector<JSONValue> items) {
    JSONValue::Array arr;
    arr.reserve(items.size());
    for (auto& item : items) {
        arr.push_back(std::make_shared<JSONValue>(std::move(item)));
    }
    return JSONValue{std::move(arr)};
}

bool operator==(const JSONValue& lhs, const JSONValue& rhs) {
    if (lhs.value.index() != rhs.value.index()) {
        return false;
    }
    return std::visit([&rhs](const auto& l) -> bool {
        using T = std::decay_t<decltype(l)>;
        const auto& r = std::get<T>(rhs.value);
        if constexpr (std::is_same_v<T, JSONValue::Array>) {
            if (l.size() != r.size()) return false;
            for (std::size_t i = 0; i < l.size(); ++i) {
                const JSONValue nullValue;
                const JSONValue& a = l[i] ? *l[i] : nullValue;
                const JSONValue& b = r[i] ? *r[i] : nullValue;
                if (!(a == b)) return false;
            }
            return true;
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            if (l.size() != r.size()) return false;
            for (const auto& [key, val] : l) {
                auto it = r.find(key);
                if (it == r.end()) return false;
                const JSONValue nullValue;
                const JSONValue& a = val ? *val : nullValue;
                const JSONValue& b = it->second ? *it->second : nullValue;
                if (!(a == b)) return false;
            }
            return true;
        } else {
            return l == r;
        }
    }, lhs.value);
}

// -------------------------------
// Recursive JSON parser
// -------------------------------
namespace {
constexpr int MaxNestingDepth = 256;

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    int depth{0};

    explicit JsonParser(const std::string& str, std::size_t start = 0) : s(str), i(start) {}

    [[noreturn]] void fail(const char* what) const {
        throw std::runtime_error(fmt::format("{} at offset {}", what, i));
    }

    void skipWs() {
        while (i < s.size()) {
            char c = s[i];
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') { ++i; } else { break; }
        }
    }

    bool match(char c) {
        skipWs();
        if (i < s.size() && s[i] == c) { ++i; return true; }
        return false;
    }

    unsigned int parseHex4() {
        if (i + 4 > s.size()) fail("Truncated unicode escape");
        unsigned int code = 0;
        for (int k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += static_cast<unsigned int>(10 + (h - 'a'));
            else if (h >= 'A' && h <= 'F') code += static_cast<unsigned int>(10 + (h - 'A'));
            else fail("Invalid hex digit in unicode escape");
        }
        return code;
    }

    static void appendUtf8(std::string& out, unsigned int code) {
        if (code <= 0x7F) {
            out.push_back(static_cast<char>(code));
        } else if (code <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else if (code <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
    }

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') fail("Expected '\"' at string start");
        ++i;
        std::string out;
        while (true) {
            if (i >= s.size()) fail("Unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("Control character in string");
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (i >= s.size()) fail("Invalid escape");
            char e = s[i++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    unsigned int code = parseHex4();
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        // High surrogate must be followed by an escaped low surrogate
                        if (i + 2 > s.size() || s[i] != '\\' || s[i + 1] != 'u') fail("Unpaired surrogate");
                        i += 2;
                        unsigned int low = parseHex4();
                        if (low < 0xDC00 || low > 0xDFFF) fail("Invalid low surrogate");
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        fail("Unpaired surrogate");
                    }
                    appendUtf8(out, code);
                    break;
                }
                default: fail("Unknown escape");
            }
        }
        return out;
    }

    JSONValue parseNumber() {
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("Invalid number");
        if (s[i] == '0') {
            ++i;
        } else {
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("Invalid fraction");
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("Invalid exponent");
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        std::string num = s.substr(start, i - start);
        if (!isFloat) {
            try {
                return JSONValue(static_cast<int64_t>(std::stoll(num)));
            } catch (const std::out_of_range&) {
                // Integers beyond int64 degrade to double precision
                return JSONValue(std::stod(num));
            }
        }
        try {
            return JSONValue(std::stod(num));
        } catch (const std::out_of_range&) {
            fail("Number out of range");
        }
    }

    JSONValue parseArray() {
        if (!match('[')) fail("Expected '['");
        if (++depth > MaxNestingDepth) fail("Nesting too deep");
        JSONValue::Array arr;
        if (match(']')) { --depth; return JSONValue(std::move(arr)); }
        while (true) {
            JSONValue val = parseValue();
            arr.push_back(std::make_shared<JSONValue>(std::move(val)));
            if (match(']')) break;
            if (!match(',')) fail("Expected ',' in array");
        }
        --depth;
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) fail("Expected '{'");
        if (++depth > MaxNestingDepth) fail("Nesting too deep");
        JSONValue::Object obj;
        if (match('}')) { --depth; return JSONValue(std::move(obj)); }
        while (true) {
            std::string key = parseString();
            if (!match(':')) fail("Expected ':' after key");
            JSONValue val = parseValue();
            obj[key] = std::make_shared<JSONValue>(std::move(val));
            if (match('}')) break;
            if (!match(',')) fail("Expected ',' in object");
        }
        --depth;
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("Unexpected end of JSON");
        char c = s[i];
        if (c == '"') return JSONValue(parseString());
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
        if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
        if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parseNumber();
        fail("Unexpected character");
    }
};

void appendEscapedString(std::string& out, const std::string& v) {
    out.push_back('"');
    for (char c : v) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<unsigned int>(static_cast<unsigned char>(c)));
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
}

void appendValue(std::string& out, const JSONValue& value) {
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out += std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            if (!std::isfinite(v)) {
                out += "null";
                return;
            }
            // Shortest round-trip form, always carrying a fraction or exponent so it parses back as a double
            std::string num = fmt::format("{}", v);
            if (num.find_first_of(".eE") == std::string::npos) {
                num += ".0";
            }
            out += num;
        } else if constexpr (std::is_same_v<T, std::string>) {
            appendEscapedString(out, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            out.push_back('[');
            for (std::size_t k = 0; k < v.size(); ++k) {
                if (k > 0) out.push_back(',');
                if (v[k]) appendValue(out, *v[k]); else out += "null";
            }
            out.push_back(']');
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            out.push_back('{');
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) out.push_back(',');
                first = false;
                appendEscapedString(out, key);
                out.push_back(':');
                if (val) appendValue(out, *val); else out += "null";
            }
            out.push_back('}');
        }
    }, value.get());
}

} // namespace

JSONValue ParseJSON(const std::string& text) {
    JsonParser p(text);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != text.size()) {
        p.fail("Trailing characters after JSON value");
    }
    return v;
}

std::string SerializeJSONValue(const JSONValue& value) {
    std::string out;
    appendValue(out, value);
    return out;
}

std::string IdToString(const JSONRPCId& id) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "s:" + v;
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return "i:" + std::to_string(v);
        } else {
            return "null";
        }
    }, id);
}

JSONValue IdToJSONValue(const JSONRPCId& id) {
    return std::visit([](const auto& v) -> JSONValue { return JSONValue(v); }, id);
}

std::string JSONRPCMessage::Serialize() const {
    return SerializeJSONValue(ToJSONValue());
}

// JSONRPCRequest implementation
JSONValue JSONRPCRequest::ToJSONValue() const {
    JSONValue obj = MakeObject();
    obj.Set("jsonrpc", JSONValue(jsonrpc));
    obj.Set("id", IdToJSONValue(id));
    obj.Set("method", JSONValue(method));
    if (params.has_value()) {
        obj.Set("params", params.value());
    }
    return obj;
}

// JSONRPCResponse implementation
JSONValue JSONRPCResponse::ToJSONValue() const {
    JSONValue obj = MakeObject();
    obj.Set("jsonrpc", JSONValue(jsonrpc));
    obj.Set("id", IdToJSONValue(id));
    if (error.has_value()) {
        obj.Set("error", error.value());
    } else {
        obj.Set("result", result.value_or(MakeObject()));
    }
    return obj;
}

// JSONRPCNotification implementation
JSONValue JSONRPCNotification::ToJSONValue() const {
    JSONValue obj = MakeObject();
    obj.Set("jsonrpc", JSONValue(jsonrpc));
    obj.Set("method", JSONValue(method));
    if (params.has_value()) {
        obj.Set("params", params.value());
    }
    return obj;
}

bool operator==(const JSONRPCRequest& lhs, const JSONRPCRequest& rhs) {
    return lhs.jsonrpc == rhs.jsonrpc && lhs.id == rhs.id && lhs.method == rhs.method && lhs.params == rhs.params;
}

bool operator==(const JSONRPCResponse& lhs, const JSONRPCResponse& rhs) {
    return lhs.jsonrpc == rhs.jsonrpc && lhs.id == rhs.id && lhs.result == rhs.result && lhs.error == rhs.error;
}

bool operator==(const JSONRPCNotification& lhs, const JSONRPCNotification& rhs) {
    return lhs.jsonrpc == rhs.jsonrpc && lhs.method == rhs.method && lhs.params == rhs.params;
}

// Utility functions
JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data) {
    JSONValue errorObj = MakeObject();
    errorObj.Set("code", JSONValue(static_cast<int64_t>(code)));
    errorObj.Set("message", JSONValue(message));
    if (data.has_value()) {
        errorObj.Set("data", data.value());
    }
    return errorObj;
}

} // namespace mcplink
