//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.hpp
// Purpose: Newline-delimited JSON transport over a readable fd (stdin) and an output stream (stdout)
//==========================================================================================================
#pragma once

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

namespace pmtrelay {

//==========================================================================================================
// StdioTransport
// Purpose: Reads one message per line from the input fd and writes each reply as one line.
// Notes:
//   Run() blocks the calling thread. Close() may be called from any thread (signal handling) and wakes a
//   blocked read through an eventfd. Fatal conditions (read error, oversized line, failed write) are
//   reported by throwing errors::TransportError out of Run().
//==========================================================================================================
class StdioTransport {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   inputFd: Descriptor to read from; not owned, never closed by the transport.
    //   maxLineBytes: Longest accepted line, excluding the terminator.
    //==========================================================================================================
    struct Options {
        int inputFd{0};
        std::size_t maxLineBytes{1024u * 1024u};
    };

    // Called once per non-blank line; a returned string is written as one output line.
    using LineHandler = std::function<std::optional<std::string>(const std::string& line)>;

    StdioTransport(const Options& opts, std::ostream& out);
    ~StdioTransport();

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    //==========================================================================================================
    // Run
    // Purpose: Serves lines until EOF or Close(). A final line without terminator is handled at EOF.
    // Throws:
    //   errors::TransportError on a read error, a line longer than maxLineBytes, or a failed write.
    //==========================================================================================================
    void Run(const LineHandler& handler);

    //==========================================================================================================
    // Writes line plus '\n' and flushes. Serialized against concurrent writers.
    //==========================================================================================================
    void WriteLine(const std::string& line);

    //==========================================================================================================
    // Stops Run() after the line currently being handled. Thread-safe and idempotent.
    //==========================================================================================================
    void Close();

    bool IsClosed() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace pmtrelay
