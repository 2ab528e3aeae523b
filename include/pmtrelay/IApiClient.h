//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: IApiClient.h
// Purpose: Abstract boundary to the upstream tool catalog and execution API
//==========================================================================================================

#pragma once

#include <stop_token>
#include <vector>

#include "pmtrelay/ChunkSink.h"
#include "pmtrelay/Protocol.h"

namespace pmtrelay {

//==========================================================================================================
// IApiClient
// Purpose: Blocking upstream operations. All failures, including cancellation through the stop token,
//          are reported by throwing errors::ApiError.
// Methods:
//   FetchTools: Returns the complete catalog across all pages, or throws; never a partial catalog.
//   Purchase: Synchronous execution; returns only results with success == true.
//   StreamPurchase: Streamed execution; delivers output chunks to sink in order and returns at end of
//                   stream. Chunks delivered before a failure stay delivered.
//==========================================================================================================
class IApiClient {
public:
    virtual ~IApiClient() = default;

    virtual std::vector<ToolDescriptor> FetchTools(std::stop_token stop = {}) = 0;

    virtual ExecutionResult Purchase(const ExecutionRequest& request, std::stop_token stop = {}) = 0;

    virtual void StreamPurchase(const ExecutionRequest& request, IChunkSink& sink,
                                std::stop_token stop = {}) = 0;
};

} // namespace pmtrelay
