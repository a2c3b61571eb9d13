//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: Dynamic JSON value model and JSON-RPC 2.0 envelope types for the mdagent line protocol
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <variant>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace mdagent {

//==========================================================================================================
// JSONValue
// Purpose: Closed tagged union over the JSON shapes, backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object (unique keys).
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
// Notes:
//   The As*/Member accessors never throw: a shape mismatch yields an empty result, so callers can treat
//   "wrong shape" and "not provided" the same way.
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

    bool IsNull() const;
    std::optional<bool> AsBool() const;
    std::optional<int64_t> AsInt() const;
    // Integers widen to double; every other shape is absent.
    std::optional<double> AsDouble() const;
    std::optional<std::string> AsString() const;
    const Array* AsArray() const;
    const Object* AsObject() const;

    //==========================================================================================================
    // Member
    // Purpose: Keyed lookup on an object value.
    // Returns:
    //   Pointer to the member value, or nullptr when this is not an object or the key is absent.
    //==========================================================================================================
    const JSONValue* Member(const std::string& key) const;
};

//==========================================================================================================
// JSONDecodeError
// Purpose: Raised by DecodeJSON and JSONRPCRequest::Decode when the text is not acceptable input.
//==========================================================================================================
class JSONDecodeError : public std::runtime_error {
public:
    explicit JSONDecodeError(const std::string& what) : std::runtime_error(what) {}
};

//==========================================================================================================
// DecodeJSON
// Purpose: Parses a complete JSON document. Numbers resolve in trial order int64 then double, so "7" and
//          "7.0" both decode as int64 while "7.5" and out-of-range integers decode as double.
// Throws:
//   JSONDecodeError on malformed input, trailing garbage, or nesting deeper than 512 levels.
//==========================================================================================================
JSONValue DecodeJSON(const std::string& text);

//==========================================================================================================
// EncodeJSON
// Purpose: Compact (no whitespace) serialization. Total: non-finite doubles encode as null.
//==========================================================================================================
std::string EncodeJSON(const JSONValue& value);

//==========================================================================================================
// JSONRPCId
// Purpose: JSON-RPC 2.0 id variant: string, integer, or null (absent). The alternative a request arrived
//          with is the one echoed back.
//==========================================================================================================
using JSONRPCId = std::variant<std::string, int64_t, std::nullptr_t>;

//==========================================================================================================
// JSONRPCMessage
// Purpose: Common base for JSON-RPC 2.0 messages; carries the protocol tag.
//==========================================================================================================
class JSONRPCMessage {
public:
    std::string jsonrpc = "2.0";

    virtual ~JSONRPCMessage() = default;
};

//==========================================================================================================
// JSONRPCRequest
// Purpose: JSON-RPC 2.0 request with optional id (null when absent), method, and optional params.
// Methods:
//   Decode(json): Strict decode; throws JSONDecodeError describing the first problem found.
//==========================================================================================================
class JSONRPCRequest : public JSONRPCMessage {
public:
    JSONRPCId id{nullptr};
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCRequest() = default;
    JSONRPCRequest(JSONRPCId id, std::string method, std::optional<JSONValue> params = std::nullopt)
        : id(std::move(id)), method(std::move(method)), params(std::move(params)) {}

    static JSONRPCRequest Decode(const std::string& json);
};

//==========================================================================================================
// JSONRPCResponse
// Purpose: JSON-RPC 2.0 response carrying exactly one of result or error.
// Ctors:
//   JSONRPCResponse(id, result): Success response with result set.
//   JSONRPCResponse(id, error, /*isError*/): Error response with error set.
// Methods:
//   Serialize(): Compact line form; id is always written, then error or result.
//   IsError(): True when error is present.
//==========================================================================================================
class JSONRPCResponse : public JSONRPCMessage {
public:
    JSONRPCId id{nullptr};
    std::optional<JSONValue> result;
    std::optional<JSONValue> error;

    JSONRPCResponse() = default;
    JSONRPCResponse(JSONRPCId id, JSONValue result)
        : id(std::move(id)), result(std::move(result)) {}
    JSONRPCResponse(JSONRPCId id, JSONValue error, bool /*isError*/)
        : id(std::move(id)), error(std::move(error)) {}

    std::string Serialize() const;

    bool IsError() const { return error.has_value(); }
};

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC 2.0 reserved error codes. Application conditions map onto these and never
//          redefine them.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;
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
// Args:
//   id: Request id to echo in the response (string | int64 | null).
//   code: Integer error code.
//   message: Error message.
//   data: Optional structured payload.
// Returns:
//   unique_ptr<JSONRPCResponse> with error populated.
//==========================================================================================================
std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data = std::nullopt);

} // namespace mdagent
