//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RelayServer.h
// Purpose: Per-process relay: decodes lines, dispatches them, encodes replies
//==========================================================================================================
#pragma once

#include <memory>
#include <optional>
#include <stop_token>
#include <string>

#include "pmtrelay/Dispatcher.h"
#include "pmtrelay/IApiClient.h"
#include "pmtrelay/NameMapper.h"
#include "pmtrelay/Protocol.h"

namespace pmtrelay {

class StdioTransport;

//==========================================================================================================
// RelayServer
// Purpose: Owns the name mapper and dispatcher for one client connection and the stop source that
//          cancels in-flight upstream calls on shutdown.
//==========================================================================================================
class RelayServer {
public:
    explicit RelayServer(std::shared_ptr<IApiClient> api);
    RelayServer(std::shared_ptr<IApiClient> api, Implementation serverInfo);

    RelayServer(const RelayServer&) = delete;
    RelayServer& operator=(const RelayServer&) = delete;

    //==========================================================================================================
    // HandleLine
    // Purpose: Processes one input line.
    // Returns:
    //   The encoded response, or std::nullopt when the line is undecodable or is a notification.
    //==========================================================================================================
    std::optional<std::string> HandleLine(const std::string& line);

    //==========================================================================================================
    // Run
    // Purpose: Serves transport until EOF or Close(). TransportError propagates to the caller.
    //==========================================================================================================
    void Run(StdioTransport& transport);

    // Cancels the upstream call in flight, if any, and every later one.
    void RequestStop();

    bool StopRequested() const;

    Dispatcher& GetDispatcher() { return dispatcher; }
    const NameMapper& GetNameMapper() const { return names; }

private:
    std::shared_ptr<IApiClient> api;
    NameMapper names;
    Dispatcher dispatcher;
    std::stop_source stopSource;
};

} // namespace pmtrelay
