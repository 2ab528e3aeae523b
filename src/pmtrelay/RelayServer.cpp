//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RelayServer.cpp
// Purpose: Per-process relay: decodes lines, dispatches them, encodes replies
//==========================================================================================================

#include "logging/Logger.h"
#include "pmtrelay/RelayServer.h"
#include "pmtrelay/StdioTransport.hpp"
#include "pmtrelay/version.h"

namespace pmtrelay {

RelayServer::RelayServer(std::shared_ptr<IApiClient> apiClient)
    : RelayServer(std::move(apiClient), Implementation("pmtrelay", getVersionString())) {
}

RelayServer::RelayServer(std::shared_ptr<IApiClient> apiClient, Implementation serverInfo)
    : api(std::move(apiClient)), names(), dispatcher(api, names, std::move(serverInfo)) {
}

std::optional<std::string> RelayServer::HandleLine(const std::string& line) {
    JSONRPCRequest request;
    if (!request.Deserialize(line)) {
        LOG_DEBUG("Skipping undecodable line ({} bytes)", line.size());
        return std::nullopt;
    }
    LOG_DEBUG("Received {} (id {})", request.method,
              request.id.has_value() ? JSONRPCIdToString(*request.id) : std::string("none"));

    std::unique_ptr<JSONRPCResponse> response = dispatcher.Dispatch(request, stopSource.get_token());
    if (!response) {
        return std::nullopt;
    }
    return response->Serialize();
}

void RelayServer::Run(StdioTransport& transport) {
    LOG_INFO("Relay serving on stdio");
    transport.Run([this](const std::string& line) { return HandleLine(line); });
    LOG_INFO("Relay loop finished");
}

void RelayServer::RequestStop() {
    if (stopSource.request_stop()) {
        LOG_INFO("Stop requested; cancelling upstream calls");
    }
}

bool RelayServer::StopRequested() const {
    return stopSource.stop_requested();
}

} // namespace pmtrelay
