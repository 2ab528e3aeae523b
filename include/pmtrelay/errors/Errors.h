//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed JSON-RPC error objects and the exception types raised inside the relay
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "pmtrelay/JSONRPCTypes.h"

namespace pmtrelay {
namespace errors {

// Protocol-level failure carried in a response's "error" member.
struct RpcError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
};

inline RpcError makeRpcError(int code, std::string message, std::optional<JSONValue> data = std::nullopt) {
    RpcError e;
    e.code = code;
    e.message = std::move(message);
    e.data = std::move(data);
    return e;
}

// Wraps err as { code, message, data? } in a response for id (absent id stays absent).
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const std::optional<JSONRPCId>& id, const RpcError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

//==========================================================================================================
// ApiError
// Purpose: Failure of an upstream API call. what() carries "<operation> <endpoint>: <detail>" while
//          detail() returns the bare upstream-facing message used in tool results.
// Fields:
//   operation: "fetch tools", "purchase", or "stream purchase".
//   endpoint: HTTP method and path, e.g. "POST /products/purchase".
//   status: HTTP status when a response was received.
//   cancelled: true when the call was aborted through its stop token.
//==========================================================================================================
class ApiError : public std::runtime_error {
public:
    ApiError(std::string operation, std::string endpoint, std::string detail,
             std::optional<int> status = std::nullopt, bool cancelled = false)
        : std::runtime_error(operation + " " + endpoint + ": " + detail),
          op(std::move(operation)), ep(std::move(endpoint)), msg(std::move(detail)),
          httpStatus(status), wasCancelled(cancelled) {}

    const std::string& operation() const { return op; }
    const std::string& endpoint() const { return ep; }
    const std::string& detail() const { return msg; }
    std::optional<int> status() const { return httpStatus; }
    bool cancelled() const { return wasCancelled; }

private:
    std::string op;
    std::string ep;
    std::string msg;
    std::optional<int> httpStatus;
    bool wasCancelled;
};

// Fatal failure of the line transport (read error or oversized line).
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Missing or invalid startup configuration.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace errors
} // namespace pmtrelay
