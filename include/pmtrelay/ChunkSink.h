//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ChunkSink.h
// Purpose: Ordered one-way delivery of streamed execution output
//==========================================================================================================

#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace pmtrelay {

//==========================================================================================================
// IChunkSink
// Purpose: Receives execution output chunks in arrival order. The API client calls OnChunk on its I/O
//          thread; implementations must not block for long and must not call back into the client.
//==========================================================================================================
class IChunkSink {
public:
    virtual ~IChunkSink() = default;
    virtual void OnChunk(const std::string& chunk) = 0;
};

//==========================================================================================================
// StringChunkSink
// Purpose: Collects chunks and exposes their concatenation.
//==========================================================================================================
class StringChunkSink : public IChunkSink {
public:
    void OnChunk(const std::string& chunk) override {
        std::lock_guard<std::mutex> lk(mutex);
        chunks.push_back(chunk);
    }

    std::string Joined() const {
        std::lock_guard<std::mutex> lk(mutex);
        std::string out;
        for (const auto& c : chunks) out += c;
        return out;
    }

    std::vector<std::string> Chunks() const {
        std::lock_guard<std::mutex> lk(mutex);
        return chunks;
    }

private:
    mutable std::mutex mutex;
    std::vector<std::string> chunks;
};

//==========================================================================================================
// FunctionChunkSink
// Purpose: Adapts a callable to IChunkSink.
//==========================================================================================================
class FunctionChunkSink : public IChunkSink {
public:
    using Callback = std::function<void(const std::string&)>;
    explicit FunctionChunkSink(Callback cb) : callback(std::move(cb)) {}
    void OnChunk(const std::string& chunk) override {
        if (callback) callback(chunk);
    }

private:
    Callback callback;
};

} // namespace pmtrelay
