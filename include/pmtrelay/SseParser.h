//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SseParser.h
// Purpose: Incremental decoder for text/event-stream response bodies
//==========================================================================================================

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pmtrelay {

//==========================================================================================================
// SseEvent
// Purpose: One dispatched server-sent event.
// Fields:
//   type: value of the last "event:" field, empty when none was given.
//   data: "data:" lines joined with '\n'.
//   id: value of the last "id:" field.
//==========================================================================================================
struct SseEvent {
    std::string type;
    std::string data;
    std::string id;
};

//==========================================================================================================
// SseParser
// Purpose: Accepts arbitrary byte slices and returns every event completed by them.
// Notes:
//   Lines end in "\n", "\r\n", or "\r" (a CRLF split across two Feed calls counts once). One space after
//   the field colon is stripped. Lines starting with ':' are comments. A blank line dispatches the pending
//   event when at least one data or event field was seen.
//   Feed throws std::length_error when a single line or event grows beyond maxEventBytes.
//==========================================================================================================
class SseParser {
public:
    static constexpr std::size_t kDefaultMaxEventBytes = 16u * 1024u * 1024u;

    explicit SseParser(std::size_t maxEventBytes = kDefaultMaxEventBytes);

    std::vector<SseEvent> Feed(std::string_view bytes);

    // Flushes a partial last line and returns the pending event, if any, at end of stream.
    std::optional<SseEvent> Finish();

private:
    void processLine(const std::string& line, std::vector<SseEvent>& out);
    std::optional<SseEvent> takePending();

    std::size_t maxBytes;
    std::string line;
    bool skipLeadingLf{false};
    SseEvent pending;
    bool haveData{false};
    bool haveType{false};
};

} // namespace pmtrelay
