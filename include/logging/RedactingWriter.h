//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RedactingWriter.h
// Purpose: Diagnostic output sink that masks configured secrets before any byte reaches the stream.
//==========================================================================================================
#pragma once

#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

//==========================================================================================================
// RedactSecret
// Purpose: Produces the masked form of a single secret value.
// Returns:
//   first 4 chars + "***" + last 4 chars when the value is longer than 8 characters; "***" when it is
//   shorter but non-empty; empty string for an empty value.
//==========================================================================================================
std::string RedactSecret(const std::string& secret);

//==========================================================================================================
// RedactingWriter
// Purpose: Wraps an output stream and replaces every occurrence of each configured secret with its
//          masked form. Write() is serialized by an internal mutex and flushes after each call.
// Notes:
//   Empty secrets are ignored. Longer secrets are replaced first so that a secret that contains another
//   secret is masked as a whole.
//==========================================================================================================
class RedactingWriter {
public:
    RedactingWriter(std::ostream& out, std::vector<std::string> secrets);

    RedactingWriter(const RedactingWriter&) = delete;
    RedactingWriter& operator=(const RedactingWriter&) = delete;

    // Returns text with all secrets masked; does not touch the stream.
    std::string Redact(std::string_view text) const;

    // Masks and writes text, then flushes the underlying stream.
    void Write(std::string_view text);

    std::size_t SecretCount() const { return replacements.size(); }

private:
    std::ostream& out;
    std::vector<std::pair<std::string, std::string>> replacements;
    std::mutex writeMutex;
};
