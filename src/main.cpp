//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: pmtrelay entry point: stdio JSON-RPC relay to the upstream tool API
//==========================================================================================================

#include <unistd.h>

#include <csignal>
#include <cstddef>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "logging/Logger.h"
#include "logging/RedactingWriter.h"
#include "pmtrelay/Config.h"
#include "pmtrelay/HTTPApiClient.hpp"
#include "pmtrelay/RelayServer.h"
#include "pmtrelay/StdioTransport.hpp"
#include "pmtrelay/errors/Errors.h"
#include "pmtrelay/version.h"

using namespace pmtrelay;

namespace net = boost::asio;

//==========================================================================================================
// Parses simple key=value style command-line options.
// Args:
//   argc: Argument count
//   argv: Argument values
//   key: Option name including leading dashes (e.g., "--config")
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        const char* arg = argv[i];
        if (arg == nullptr) {
            continue;
        }
        std::string a = arg;
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

static bool hasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] != nullptr && flag == argv[i]) {
            return true;
        }
    }
    return false;
}

static void printConfigHelp(const std::string& error) {
    std::cerr << "Configuration error: " << error << "\n"
              << "\nPlease ensure:\n"
              << "  1. config.json (keys APIURL, APIKey, BudgetKey) exists in the current directory,\n"
              << "     next to the binary, or at the path given with --config=<path>, OR\n"
              << "  2. Environment variables are set:\n"
              << "     AGENTPMT_API_KEY\n"
              << "     AGENTPMT_BUDGET_KEY\n"
              << "     AGENTPMT_API_URL (optional, defaults to " << kDefaultApiUrl << ")\n";
    std::cerr.flush();
}

int main(int argc, char** argv) {
    if (hasFlag(argc, argv, "--version")) {
        std::cout << "pmtrelay " << getVersionString() << std::endl;
        return 0;
    }

    RelayConfig cfg;
    try {
        cfg = LoadConfig(getArgValue(argc, argv, "--config"));
    } catch (const errors::ConfigError& e) {
        printConfigHelp(e.what());
        return 1;
    }

    // Every diagnostic byte from here on passes through redaction.
    Logger::setWriter(std::make_shared<RedactingWriter>(std::cerr, std::vector<std::string>{cfg.apiKey, cfg.budgetKey}));
    const std::string level = getArgValue(argc, argv, "--log-level").value_or(cfg.logLevel);
    if (!Logger::setLogLevel(level)) {
        LOG_WARN("Unknown log level '{}'; keeping INFO", level);
    }
    if (!cfg.logFile.empty()) {
        Logger::setLogFile(cfg.logFile);
    }

    // A closed stdout must surface as a write failure, not kill the process.
    std::signal(SIGPIPE, SIG_IGN);

    const RelayConfig shown = cfg.Sanitized();
    LOG_INFO("pmtrelay v{} starting...", getVersionString());
    LOG_INFO("API URL: {}", shown.apiUrl);
    LOG_INFO("Configuration loaded from {} (keys: {}, {})",
             shown.configPath.empty() ? std::string("environment") : shown.configPath, shown.apiKey, shown.budgetKey);

    std::shared_ptr<IApiClient> api;
    try {
        HTTPApiClient::Options opts;
        opts.baseUrl = cfg.apiUrl;
        opts.apiKey = cfg.apiKey;
        opts.budgetKey = cfg.budgetKey;
        opts.caFile = cfg.caFile;
        opts.connectTimeoutMs = cfg.connectTimeoutMs;
        opts.requestTimeoutMs = cfg.requestTimeoutMs;
        opts.streamIdleTimeoutMs = cfg.streamIdleTimeoutMs;
        api = std::make_shared<HTTPApiClient>(opts);
    } catch (const errors::ConfigError& e) {
        printConfigHelp(e.what());
        return 1;
    }

    RelayServer server(api);
    StdioTransport::Options topts;
    topts.inputFd = STDIN_FILENO;
    topts.maxLineBytes = cfg.maxLineBytes;
    StdioTransport transport(topts, std::cout);

    // SIGINT/SIGTERM: cancel the upstream call in flight and stop reading.
    net::io_context signalIoc;
    net::signal_set signals(signalIoc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec) {
            return;
        }
        LOG_INFO("Received signal {}; shutting down", signo);
        server.RequestStop();
        transport.Close();
    });
    std::thread signalThread([&signalIoc]() { signalIoc.run(); });

    int exitCode = 0;
    try {
        LOG_INFO("MCP relay ready, listening on stdio...");
        server.Run(transport);
    } catch (const errors::TransportError& e) {
        LOG_ERROR("Transport error: {}", e.what());
        exitCode = 1;
    }

    boost::system::error_code ignored;
    signals.cancel(ignored);
    signalIoc.stop();
    if (signalThread.joinable()) {
        signalThread.join();
    }

    LOG_INFO("MCP relay shutting down");
    Logger::setWriter(nullptr);
    return exitCode;
}
