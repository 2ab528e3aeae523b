//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP method names and the relay's upstream catalog/execution data structures
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <string>
#include <vector>

namespace pmtrelay {
//==========================================================================================================
// MCP Protocol types and constants
// Purpose: Protocol version advertised on initialize and the method names the relay answers.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
constexpr const char* PROTOCOL_VERSION = "2025-03-26";

namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* NotificationPrefix = "notifications/";
}

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information reported as serverInfo
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Upstream catalog ///////////////////////////////////////////
//==========================================================================================================
// ToolDescriptor
// Purpose: One entry of the upstream catalog.
// Fields:
//   id: Upstream product identifier used for execution.
//   description: Free text; the public tool name is derived from it.
//   parameters: JSON Schema for the tool arguments, passed through to the client unmodified.
//==========================================================================================================
struct ToolDescriptor {
    std::string id;
    std::string description;
    JSONValue parameters;
};

///////////////////////////////////////// Execution ///////////////////////////////////////////
struct ExecutionRequest {
    std::string productId;
    JSONValue parameters;  // caller arguments, forwarded unchanged
};

struct ExecutionResult {
    bool success = false;
    std::string output;
    std::string error;
};

} // namespace pmtrelay
