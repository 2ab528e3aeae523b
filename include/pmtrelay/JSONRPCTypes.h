//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON value tree and JSON-RPC 2.0 message types for the stdio relay
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <stdexcept>
#include <variant>
#include <optional>
#include <unordered_map>
#include <vector>

namespace pmtrelay {

//==========================================================================================================
// JSONValue
// Purpose: JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
//   numberText: Source text of a parsed number the double in value cannot reproduce (integers beyond
//               int64, exponents beyond double range); the serializer writes it back verbatim.
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
    std::string numberText;

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
    bool IsObject() const { return std::holds_alternative<Object>(value); }
};

//==========================================================================================================
// JSONParseError
// Purpose: Thrown by ParseJSON for any syntax violation, including trailing content after the document.
//==========================================================================================================
class JSONParseError : public std::runtime_error {
public:
    JSONParseError(const std::string& what, std::size_t offset)
        : std::runtime_error(what + " at offset " + std::to_string(offset)), offset(offset) {}
    std::size_t offset;
};

//==========================================================================================================
// ParseJSON
// Purpose: Strict RFC 8259 parse of a complete JSON document. Integers that fit int64 are stored as
//          int64_t, all other numbers as double. Nesting deeper than 512 levels is rejected.
// Throws:
//   JSONParseError on malformed input.
//==========================================================================================================
JSONValue ParseJSON(const std::string& text);

//==========================================================================================================
// SerializeJSON
// Purpose: Compact single-line serialization. Object members are emitted in key order so that output is
//          deterministic. Non-finite doubles are emitted as null.
//==========================================================================================================
std::string SerializeJSON(const JSONValue& value);

// Member lookup helpers; return nullptr when v is not an object or the member is missing.
const JSONValue* FindMember(const JSONValue& v, const std::string& key);
const std::string* FindString(const JSONValue& v, const std::string& key);
std::optional<bool> FindBool(const JSONValue& v, const std::string& key);

//==========================================================================================================
// JSONRPCId
// Purpose: JSON-RPC 2.0 id variant: string, integer, fractional number, or null.
//==========================================================================================================
using JSONRPCId = std::variant<std::string, int64_t, double, std::nullptr_t>;

std::string JSONRPCIdToString(const JSONRPCId& id);

//==========================================================================================================
// JSONRPCRequest
// Purpose: Inbound JSON-RPC 2.0 message with optional id, method, and optional params.
// Notes:
//   id absent means the message is a notification. hasMethod is false when the "method" member was
//   missing; Deserialize still succeeds so the dispatcher can answer with InvalidRequest.
//   Deserialize fails when the text is not a JSON object, "method" is present but not a string, or "id"
//   is not a string, number, or null.
//==========================================================================================================
class JSONRPCRequest {
public:
    std::string jsonrpc = "2.0";
    std::optional<JSONRPCId> id;
    std::string method;
    bool hasMethod{false};
    std::optional<JSONValue> params;

    JSONRPCRequest() = default;
    JSONRPCRequest(JSONRPCId id, std::string method, std::optional<JSONValue> params = std::nullopt)
        : id(std::move(id)), method(std::move(method)), hasMethod(true), params(std::move(params)) {}

    bool IsNotification() const { return !id.has_value(); }

    // Parses one input line into this object; returns false when the line is not a usable request.
    bool Deserialize(const std::string& json);
};

//==========================================================================================================
// JSONRPCResponse
// Purpose: Outbound JSON-RPC 2.0 response carrying either result or error.
// Notes:
//   id mirrors the request: an explicit null is echoed as null, and a request that had no id gets a
//   response without an "id" member.
//==========================================================================================================
class JSONRPCResponse {
public:
    std::optional<JSONRPCId> id;
    std::optional<JSONValue> result;
    std::optional<JSONValue> error;

    JSONRPCResponse() = default;
    JSONRPCResponse(JSONRPCId id, JSONValue result)
        : id(std::move(id)), result(std::move(result)) {}

    // Single-line JSON: "jsonrpc", then "id" when present, then "result" or "error".
    std::string Serialize() const;

    bool IsError() const { return error.has_value(); }
};

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC 2.0 error codes.
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
//==========================================================================================================
JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data = std::nullopt);

//==========================================================================================================
// CreateErrorResponse
// Purpose: Wraps an error object into a JSONRPCResponse with the given id.
//==========================================================================================================
std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const std::optional<JSONRPCId>& id, int code, const std::string& message,
    const std::optional<JSONValue>& data = std::nullopt);

} // namespace pmtrelay
