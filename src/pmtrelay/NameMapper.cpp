//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: NameMapper.cpp
// Purpose: Derivation of client-safe tool names and the public name -> upstream id association
//==========================================================================================================

#include "logging/Logger.h"
#include "pmtrelay/NameMapper.h"

namespace pmtrelay {

namespace {
bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

bool isNameChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
}

std::string trimSpace(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && isSpace(s[b])) ++b;
    while (e > b && isSpace(s[e - 1])) --e;
    return s.substr(b, e - b);
}

std::string trimTrailingHyphens(std::string s) {
    while (!s.empty() && s.back() == '-') s.pop_back();
    return s;
}

std::string withSuffix(const std::string& base, int n) {
    const std::string suffix = "-" + std::to_string(n);
    std::string head = base.substr(0, kMaxToolNameLength - suffix.size());
    return trimTrailingHyphens(std::move(head)) + suffix;
}
} // namespace

std::string SanitizeToolName(const std::string& text) {
    // Join whitespace-separated fields with '-'
    std::string joined;
    bool inSpace = true;
    for (char c : trimSpace(text)) {
        if (isSpace(c)) {
            inSpace = true;
            continue;
        }
        if (inSpace && !joined.empty()) joined.push_back('-');
        inSpace = false;
        joined.push_back(c);
    }

    std::string result;
    result.reserve(joined.size());
    for (char c : joined) {
        if (isNameChar(c)) result.push_back(c);
    }
    if (result.size() > kMaxToolNameLength) {
        result.resize(kMaxToolNameLength);
    }
    return trimTrailingHyphens(std::move(result));
}

std::string DeriveToolName(const std::string& description) {
    static const char* const kDelimiters[] = {" \xE2\x80\x94 ", " - ", " \xE2\x80\x93 ", "|"};

    std::string readable;
    for (const char* delim : kDelimiters) {
        auto idx = description.find(delim);
        if (idx != std::string::npos && idx > 0) {
            readable = trimSpace(description.substr(0, idx));
            break;
        }
    }

    if (readable.empty()) {
        auto dot = description.find('.');
        if (dot != std::string::npos && dot > 0 && dot < 100) {
            readable = trimSpace(description.substr(0, dot));
        } else if (description.size() > 50) {
            readable = trimSpace(description.substr(0, 50));
        } else {
            readable = trimSpace(description);
        }
    }

    return SanitizeToolName(readable);
}

std::vector<std::string> NameMapper::Refresh(const std::vector<ToolDescriptor>& tools) {
    std::vector<std::string> names;
    names.reserve(tools.size());
    std::unordered_map<std::string, std::string> assigned;

    std::lock_guard<std::mutex> lk(mapMutex);
    for (const auto& tool : tools) {
        std::string base = DeriveToolName(tool.description);
        if (base.empty()) base = SanitizeToolName(tool.id);
        if (base.empty()) base = "tool";

        std::string name = base;
        for (int n = 2;; ++n) {
            auto it = assigned.find(name);
            if (it == assigned.end() || it->second == tool.id) break;
            name = withSuffix(base, n);
        }
        if (name != base) {
            LOG_WARN("Tool name '{}' already used in this catalog; '{}' is exposed as '{}'", base, tool.id, name);
        }

        assigned[name] = tool.id;
        nameToId[name] = tool.id;
        names.push_back(std::move(name));
    }
    LOG_DEBUG("Name map holds {} entries after refresh of {} tools", nameToId.size(), tools.size());
    return names;
}

std::optional<std::string> NameMapper::Resolve(const std::string& publicName) const {
    std::lock_guard<std::mutex> lk(mapMutex);
    auto it = nameToId.find(publicName);
    if (it == nameToId.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t NameMapper::Size() const {
    std::lock_guard<std::mutex> lk(mapMutex);
    return nameToId.size();
}

} // namespace pmtrelay
