//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.cpp
// Purpose: Startup configuration: upstream credentials from config.json and the environment
//==========================================================================================================

#include <unistd.h>
#include <sys/stat.h>
#include <errno.h>
#include <climits>
#include <cstring>

#include <fstream>
#include <limits>
#include <sstream>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "logging/RedactingWriter.h"
#include "pmtrelay/Config.h"
#include "pmtrelay/JSONRPCTypes.h"
#include "pmtrelay/errors/Errors.h"

namespace pmtrelay {

namespace {
bool isRegularFile(const std::string& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

std::optional<std::string> executableDir() {
    char buf[PATH_MAX];
    ssize_t n = ::readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n <= 0) {
        LOG_DEBUG("Cannot resolve executable path (errno={} msg={})", errno, ::strerror(errno));
        return std::nullopt;
    }
    std::string exe(buf, static_cast<std::size_t>(n));
    std::size_t slash = exe.rfind('/');
    if (slash == std::string::npos) {
        return std::nullopt;
    }
    return exe.substr(0, slash == 0 ? 1 : slash);
}

// Copies a string member into out; an absent member leaves out unchanged.
void readStringKey(const JSONValue& doc, const char* key, const std::string& path, std::string& out) {
    const JSONValue* v = FindMember(doc, key);
    if (!v || v->IsNull()) {
        return;
    }
    const std::string* s = std::get_if<std::string>(&v->value);
    if (!s) {
        throw errors::ConfigError("failed to load config file " + path + ": " + key + " must be a string");
    }
    out = *s;
}

void loadFromFile(const std::string& path, RelayConfig& cfg) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        throw errors::ConfigError("failed to load config file " + path + ": " + ::strerror(errno));
    }
    std::ostringstream ss;
    ss << in.rdbuf();

    JSONValue doc;
    try {
        doc = ParseJSON(ss.str());
    } catch (const JSONParseError& e) {
        throw errors::ConfigError("failed to load config file " + path + ": invalid JSON: " + e.what());
    }
    if (!doc.IsObject()) {
        throw errors::ConfigError("failed to load config file " + path + ": expected a JSON object");
    }
    readStringKey(doc, "APIURL", path, cfg.apiUrl);
    readStringKey(doc, "APIKey", path, cfg.apiKey);
    readStringKey(doc, "BudgetKey", path, cfg.budgetKey);
    cfg.configPath = path;
}

template <typename T>
void applyUnsigned(const char* name, T& out) {
    if (!GetEnvIfSet(name)) {
        return;
    }
    auto v = GetEnvUnsigned(name);
    if (!v || *v > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
        LOG_WARN("Ignoring malformed {}={}", name, GetEnvOrDefault(name, ""));
        return;
    }
    out = static_cast<T>(*v);
}
} // namespace

RelayConfig RelayConfig::Sanitized() const {
    RelayConfig copy = *this;
    copy.apiKey = RedactSecret(apiKey);
    copy.budgetKey = RedactSecret(budgetKey);
    return copy;
}

std::optional<std::string> FindConfigFile() {
    if (isRegularFile(kConfigFileName)) {
        return std::string(kConfigFileName);
    }
    if (auto dir = executableDir()) {
        std::string candidate = (*dir == "/" ? std::string() : *dir) + "/" + kConfigFileName;
        if (isRegularFile(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

RelayConfig LoadConfig(const std::optional<std::string>& explicitPath) {
    RelayConfig cfg;

    if (explicitPath.has_value()) {
        loadFromFile(*explicitPath, cfg);
    } else if (auto found = FindConfigFile()) {
        loadFromFile(*found, cfg);
    } else {
        LOG_DEBUG("No {} found; using environment only", kConfigFileName);
    }

    if (auto v = GetEnvIfSet("AGENTPMT_API_URL")) cfg.apiUrl = *v;
    if (auto v = GetEnvIfSet("AGENTPMT_API_KEY")) cfg.apiKey = *v;
    if (auto v = GetEnvIfSet("AGENTPMT_BUDGET_KEY")) cfg.budgetKey = *v;
    if (cfg.apiUrl.empty()) {
        cfg.apiUrl = kDefaultApiUrl;
    }

    if (auto v = GetEnvIfSet("PMTRELAY_LOG_LEVEL")) cfg.logLevel = *v;
    if (auto v = GetEnvIfSet("PMTRELAY_LOG_FILE")) cfg.logFile = *v;
    if (auto v = GetEnvIfSet("PMTRELAY_CA_FILE")) cfg.caFile = *v;
    applyUnsigned("PMTRELAY_CONNECT_TIMEOUT_MS", cfg.connectTimeoutMs);
    applyUnsigned("PMTRELAY_HTTP_TIMEOUT_MS", cfg.requestTimeoutMs);
    applyUnsigned("PMTRELAY_STREAM_IDLE_TIMEOUT_MS", cfg.streamIdleTimeoutMs);
    applyUnsigned("PMTRELAY_MAX_LINE_BYTES", cfg.maxLineBytes);

    if (cfg.apiKey.empty()) {
        throw errors::ConfigError("APIKey is required (set in config.json or AGENTPMT_API_KEY env var)");
    }
    if (cfg.budgetKey.empty()) {
        throw errors::ConfigError("BudgetKey is required (set in config.json or AGENTPMT_BUDGET_KEY env var)");
    }
    return cfg;
}

} // namespace pmtrelay
