//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Dispatcher.h
// Purpose: JSON-RPC method table for the relay (initialize, tools, resources, notifications)
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <unordered_map>

#include "pmtrelay/IApiClient.h"
#include "pmtrelay/JSONRPCTypes.h"
#include "pmtrelay/NameMapper.h"
#include "pmtrelay/Protocol.h"

namespace pmtrelay {

//==========================================================================================================
// Dispatcher
// Purpose: Maps method names to handlers and turns each request into at most one response.
// Notes:
//   Dispatch returns nullptr when nothing must be written: notifications/initialized, and any other
//   "notifications/..." message that carries no id. Unknown methods yield MethodNotFound, a missing
//   method yields InvalidRequest, and a handler exception yields InternalError. Upstream failures during
//   tools/call are tool-level results (isError: true) inside a successful response.
//   Responses echo the request id unchanged; a request without an id that still gets an error response
//   is answered without an "id" member.
//==========================================================================================================
class Dispatcher {
public:
    using Handler = std::function<std::unique_ptr<JSONRPCResponse>(const JSONRPCRequest&, std::stop_token)>;

    Dispatcher(std::shared_ptr<IApiClient> api, NameMapper& names, Implementation serverInfo);

    // Built-in handlers capture this.
    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // Adds or replaces the handler for method.
    void Register(const std::string& method, Handler handler);

    bool HasMethod(const std::string& method) const;

    std::unique_ptr<JSONRPCResponse> Dispatch(const JSONRPCRequest& request, std::stop_token stop = {});

private:
    std::unique_ptr<JSONRPCResponse> handleInitialize(const JSONRPCRequest& request);
    std::unique_ptr<JSONRPCResponse> handleToolsList(const JSONRPCRequest& request, std::stop_token stop);
    std::unique_ptr<JSONRPCResponse> handleToolsCall(const JSONRPCRequest& request, std::stop_token stop);
    std::unique_ptr<JSONRPCResponse> handleResourcesList(const JSONRPCRequest& request);

    std::shared_ptr<IApiClient> api;
    NameMapper& names;
    Implementation serverInfo;
    std::unordered_map<std::string, Handler> handlers;
};

} // namespace pmtrelay
