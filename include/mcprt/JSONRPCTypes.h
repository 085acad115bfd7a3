//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON value model and JSON-RPC 2.0 message types used by the MCP runtime
//==========================================================================================================

#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <memory>
#include <variant>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mcprt {

//==========================================================================================================
// JSONValue
// Purpose: JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
// Notes:
//   Copies share child nodes. Use DeepCopy() when a value crosses an ownership boundary
//   (history records, query results) and must not alias the caller's graph.
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

    // Constructors and special members (defined out-of-line)
    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&);
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&);
    ~JSONValue();

    // Explicit constructors for supported types
    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    // Access the underlying variant
    auto& get() { return value; }
    const auto& get() const { return value; }

    bool IsNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool IsBool() const { return std::holds_alternative<bool>(value); }
    bool IsNumber() const { return std::holds_alternative<int64_t>(value) || std::holds_alternative<double>(value); }
    bool IsString() const { return std::holds_alternative<std::string>(value); }
    bool IsArray() const { return std::holds_alternative<Array>(value); }
    bool IsObject() const { return std::holds_alternative<Object>(value); }

    // Recursively clones the graph so the result shares no nodes with this value.
    JSONValue DeepCopy() const;
};

//==========================================================================================================
// JSON text codec
//==========================================================================================================
// Parses a complete JSON document. Throws errors::ParseError on malformed input or trailing garbage.
JSONValue ParseJSON(const std::string& text);

// Serializes to compact JSON text.
std::string SerializeJSON(const JSONValue& value);

//==========================================================================================================
// Object accessors
// Purpose: Null-safe lookups on object members. All return empty/null when the value is not an object,
//          the key is missing, or the member has a different type.
//==========================================================================================================
const JSONValue* FindMember(const JSONValue& object, const std::string& key);
std::optional<std::string> GetString(const JSONValue& object, const std::string& key);
std::optional<double> GetNumber(const JSONValue& object, const std::string& key);
std::optional<int64_t> GetInteger(const JSONValue& object, const std::string& key);
std::optional<bool> GetBool(const JSONValue& object, const std::string& key);

// Numeric value of an int64 or double node.
std::optional<double> AsNumber(const JSONValue& value);

// Builds an object from key/value pairs.
JSONValue MakeObject(std::initializer_list<std::pair<std::string, JSONValue>> members);

// Builds an array from values.
JSONValue MakeArray(const std::vector<JSONValue>& items);

//==========================================================================================================
// JSONRPCId
// Purpose: JSON-RPC 2.0 id variant: string, integer, or null.
//==========================================================================================================
using JSONRPCId = std::variant<std::string, int64_t, std::nullptr_t>;

// Canonical key used for id-keyed tables ("42" and 42 map to distinct keys: "s:42" / "n:42").
std::string IdKey(const JSONRPCId& id);

// Human-readable id for logs and error messages.
std::string IdToString(const JSONRPCId& id);

JSONValue IdToJSON(const JSONRPCId& id);

// Reads an id node: string, integer or null. Any other JSON type yields std::nullopt.
std::optional<JSONRPCId> IdFromJSON(const JSONValue& v);

//==========================================================================================================
// JSONRPCMessage
// Purpose: Abstract base for JSON-RPC 2.0 messages providing serialization APIs.
// Methods:
//   Serialize(): Returns JSON string for the message.
//   FromJSON(value) on each message type fills it from a parsed object; returns true on success.
//   ToJSON(): Returns the message as a JSONValue object.
//==========================================================================================================
class JSONRPCMessage {
public:
    std::string jsonrpc = "2.0";

    virtual ~JSONRPCMessage() = default;
    virtual JSONValue ToJSON() const = 0;
    std::string Serialize() const { return SerializeJSON(ToJSON()); }
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

    JSONValue ToJSON() const override;
    bool FromJSON(const JSONValue& value);
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

    JSONValue ToJSON() const override;
    bool FromJSON(const JSONValue& value);

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

    JSONValue ToJSON() const override;
    bool FromJSON(const JSONValue& value);
};

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC error codes plus the generic server error used by MCP peers.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;
    constexpr int ServerError = -32000;
}

//==========================================================================================================
// CreateErrorObject
// Purpose: Build a JSON error object with shape { code, message, data? }.
// Args:
//   code: Integer error code.
//   message: Human-readable description.
//   data: Optional structured payload.
// Returns:
//   JSONValue object representing the error.
//==========================================================================================================
JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data = std::nullopt);

//==========================================================================================================
// CreateErrorResponse
// Purpose: Convenience to wrap an error object into a JSONRPCResponse with the given id.
//==========================================================================================================
std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data = std::nullopt);

} // namespace mcprt
