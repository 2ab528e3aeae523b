//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Startup configuration: upstream credentials from config.json and the environment
//==========================================================================================================
#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace pmtrelay {

constexpr const char* kDefaultApiUrl = "https://api.agentpmt.com";
constexpr const char* kConfigFileName = "config.json";

//==========================================================================================================
// RelayConfig
// Purpose: Everything main() needs to build the client, transport, and logger.
// Fields:
//   apiUrl/apiKey/budgetKey: Upstream endpoint and credentials (file keys APIURL, APIKey, BudgetKey).
//   configPath: File the values were read from; empty when none was found.
//   logLevel/logFile: PMTRELAY_LOG_LEVEL and PMTRELAY_LOG_FILE.
//   caFile: PMTRELAY_CA_FILE trust store override.
//   *TimeoutMs, maxLineBytes: PMTRELAY_* tuning values.
//==========================================================================================================
struct RelayConfig {
    std::string apiUrl{kDefaultApiUrl};
    std::string apiKey;
    std::string budgetKey;
    std::string configPath;
    std::string logLevel{"INFO"};
    std::string logFile;
    std::string caFile;
    unsigned int connectTimeoutMs{10000};
    unsigned int requestTimeoutMs{60000};
    unsigned int streamIdleTimeoutMs{60000};
    std::size_t maxLineBytes{1024u * 1024u};

    // Copy with apiKey and budgetKey masked by RedactSecret, for diagnostics.
    RelayConfig Sanitized() const;
};

//==========================================================================================================
// FindConfigFile
// Purpose: Locates config.json in the current directory, then beside the running executable.
//==========================================================================================================
std::optional<std::string> FindConfigFile();

//==========================================================================================================
// LoadConfig
// Purpose: Reads explicitPath (or the file FindConfigFile locates), then applies AGENTPMT_API_URL,
//          AGENTPMT_API_KEY, AGENTPMT_BUDGET_KEY and the PMTRELAY_* tuning variables.
// Throws:
//   errors::ConfigError when explicitPath cannot be read, a config file is not a JSON object or holds a
//   non-string credential, or the API key or budget key is missing after all sources are applied.
//==========================================================================================================
RelayConfig LoadConfig(const std::optional<std::string>& explicitPath = std::nullopt);

} // namespace pmtrelay
