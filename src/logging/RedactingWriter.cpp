//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RedactingWriter.cpp
// Purpose: Secret masking for diagnostic output.
//==========================================================================================================

#include <algorithm>

#include "logging/RedactingWriter.h"

std::string RedactSecret(const std::string& secret) {
    if (secret.empty()) {
        return std::string();
    }
    if (secret.size() > 8) {
        return secret.substr(0, 4) + "***" + secret.substr(secret.size() - 4);
    }
    return std::string("***");
}

RedactingWriter::RedactingWriter(std::ostream& o, std::vector<std::string> secrets) : out(o) {
    std::sort(secrets.begin(), secrets.end(), [](const std::string& a, const std::string& b) {
        return a.size() > b.size();
    });
    for (auto& s : secrets) {
        if (s.empty()) continue;
        auto dup = std::find_if(replacements.begin(), replacements.end(),
                                [&s](const auto& r) { return r.first == s; });
        if (dup != replacements.end()) continue;
        std::string masked = RedactSecret(s);
        replacements.emplace_back(std::move(s), std::move(masked));
    }
}

std::string RedactingWriter::Redact(std::string_view text) const {
    if (replacements.empty()) {
        return std::string(text);
    }
    // Single left-to-right pass so masked output is never rescanned.
    std::string result;
    result.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        bool matched = false;
        for (const auto& [secret, masked] : replacements) {
            if (text.compare(pos, secret.size(), secret) == 0) {
                result += masked;
                pos += secret.size();
                matched = true;
                break;
            }
        }
        if (!matched) {
            result.push_back(text[pos]);
            ++pos;
        }
    }
    return result;
}

void RedactingWriter::Write(std::string_view text) {
    const std::string masked = Redact(text);
    std::lock_guard<std::mutex> lock(writeMutex);
    out << masked;
    out.flush();
}
