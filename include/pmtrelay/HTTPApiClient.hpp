//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPApiClient.hpp
// Purpose: Coroutine-based HTTP/HTTPS client for the upstream tool API using Boost.Beast
//==========================================================================================================

#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "pmtrelay/IApiClient.h"

namespace pmtrelay {

//==========================================================================================================
// HTTPApiClient
// Purpose: IApiClient over HTTP/1.1. Requests run as coroutines on a private io_context thread owned by
//          the client; the public methods block the caller until the coroutine completes.
// Notes:
//   Every request carries User-Agent, Content-Type: application/json, X-API-Key, X-Budget-Key, and
//   Connection: close. One connection per request.
//==========================================================================================================
class HTTPApiClient : public IApiClient {
public:
    //==========================================================================================================
    // Options
    // Purpose: Upstream endpoint, credentials, and limits.
    // Fields:
    //   baseUrl: "http://" or "https://" URL; an optional path prefix is kept in front of every endpoint.
    //   apiKey/budgetKey: Sent as X-API-Key and X-Budget-Key.
    //   userAgent: User-Agent header value.
    //   caFile/caPath: Optional trust store overrides for HTTPS; system defaults otherwise.
    //   connectTimeoutMs: Bound on TCP connect plus TLS handshake.
    //   requestTimeoutMs: Bound on a whole catalog page or synchronous purchase, and on receiving the
    //                     response headers of a streamed purchase.
    //   streamIdleTimeoutMs: Longest silence tolerated between event-stream reads.
    //   pageSize: page_size query value for catalog fetches.
    //   maxPages: Catalog fetch fails once more pages than this are announced.
    //   maxBodyBytes: Largest buffered (non-stream) response body accepted.
    //==========================================================================================================
    struct Options {
        std::string baseUrl{"https://api.agentpmt.com"};
        std::string apiKey;
        std::string budgetKey;
        std::string userAgent{"AgentPMT-MCP/1.0"};
        std::string caFile;
        std::string caPath;
        unsigned int connectTimeoutMs{10000};
        unsigned int requestTimeoutMs{60000};
        unsigned int streamIdleTimeoutMs{60000};
        unsigned int pageSize{50};
        unsigned int maxPages{1000};
        std::size_t maxBodyBytes{16u * 1024u * 1024u};
    };

    // Throws errors::ConfigError when baseUrl is not a usable http(s) URL or the CA files cannot be loaded.
    explicit HTTPApiClient(const Options& opts);
    ~HTTPApiClient() override;

    HTTPApiClient(const HTTPApiClient&) = delete;
    HTTPApiClient& operator=(const HTTPApiClient&) = delete;

    ////////////////////////////////////////// IApiClient //////////////////////////////////////////
    //==========================================================================================================
    // GET {base}/products/fetch?page=N&page_size=M until details.has_next_page is false.
    //==========================================================================================================
    std::vector<ToolDescriptor> FetchTools(std::stop_token stop = {}) override;

    //==========================================================================================================
    // POST {base}/products/purchase with {product_id, parameters}.
    //==========================================================================================================
    ExecutionResult Purchase(const ExecutionRequest& request, std::stop_token stop = {}) override;

    //==========================================================================================================
    // POST {base}/products/purchase?stream=true, Accept: text/event-stream. A non-event-stream reply is
    // read as a synchronous purchase and delivered as one chunk.
    //==========================================================================================================
    void StreamPurchase(const ExecutionRequest& request, IChunkSink& sink,
                        std::stop_token stop = {}) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace pmtrelay
