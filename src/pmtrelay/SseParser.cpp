//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SseParser.cpp
// Purpose: Incremental decoder for text/event-stream response bodies
//==========================================================================================================

#include <stdexcept>

#include "logging/Logger.h"
#include "pmtrelay/SseParser.h"

namespace pmtrelay {

SseParser::SseParser(std::size_t maxEventBytes) : maxBytes(maxEventBytes) {}

std::vector<SseEvent> SseParser::Feed(std::string_view bytes) {
    std::vector<SseEvent> out;
    for (char c : bytes) {
        if (skipLeadingLf) {
            skipLeadingLf = false;
            if (c == '\n') continue;
        }
        if (c == '\r' || c == '\n') {
            skipLeadingLf = (c == '\r');
            processLine(line, out);
            line.clear();
            continue;
        }
        line.push_back(c);
        if (line.size() + pending.data.size() > maxBytes) {
            throw std::length_error("event stream line exceeds " + std::to_string(maxBytes) + " bytes");
        }
    }
    return out;
}

std::optional<SseEvent> SseParser::Finish() {
    // An unterminated last line can only add fields; it never dispatches by itself.
    std::vector<SseEvent> unused;
    if (!line.empty()) {
        processLine(line, unused);
        line.clear();
    }
    skipLeadingLf = false;
    return takePending();
}

std::optional<SseEvent> SseParser::takePending() {
    if (!haveData && !haveType) {
        pending = SseEvent{};
        return std::nullopt;
    }
    SseEvent ev = std::move(pending);
    pending = SseEvent{};
    haveData = false;
    haveType = false;
    return ev;
}

void SseParser::processLine(const std::string& l, std::vector<SseEvent>& out) {
    if (l.empty()) {
        auto ev = takePending();
        if (ev) out.push_back(std::move(*ev));
        return;
    }
    if (l[0] == ':') {
        return;
    }
    std::string field;
    std::string value;
    auto colon = l.find(':');
    if (colon == std::string::npos) {
        field = l;
    } else {
        field = l.substr(0, colon);
        std::size_t start = colon + 1;
        if (start < l.size() && l[start] == ' ') ++start;
        value = l.substr(start);
    }

    if (field == "data") {
        if (haveData) pending.data.push_back('\n');
        pending.data += value;
        haveData = true;
    } else if (field == "event") {
        pending.type = value;
        haveType = true;
    } else if (field == "id") {
        pending.id = value;
    } else if (field == "retry") {
        // Reconnection hints are irrelevant for a single request/response stream.
    } else {
        LOG_DEBUG("SSE: ignoring unknown field '{}'", field);
    }
}

} // namespace pmtrelay
