//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read relay settings and credentials from environment variables.
//==========================================================================================================
#pragma once
#include <cstdlib>
#include <cstdint>
#include <cctype>
#include <optional>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    return v ? std::string(v) : defaultValue;
}

//==========================================================================================================
// GetEnvIfSet
// Purpose: Returns the environment value only when the variable is set and non-empty.
//==========================================================================================================
inline std::optional<std::string> GetEnvIfSet(const char* name) {
    if (name == nullptr || *name == '\0') {
        return std::nullopt;
    }
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0') {
        return std::nullopt;
    }
    return std::string(v);
}

//==========================================================================================================
// GetEnvBool
// Purpose: Interprets "1", "true", "yes", "on" (any case) as true and "0", "false", "no", "off" as false.
// Returns:
//   defaultValue when the variable is unset or holds any other text.
//==========================================================================================================
inline bool GetEnvBool(const char* name, bool defaultValue) {
    auto v = GetEnvIfSet(name);
    if (!v) return defaultValue;
    std::string s;
    s.reserve(v->size());
    for (char c : *v) s.push_back(static_cast<char>(::tolower(static_cast<unsigned char>(c))));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return defaultValue;
}

//==========================================================================================================
// GetEnvUnsigned
// Purpose: Parses a positive decimal integer from the environment.
// Returns:
//   std::nullopt when unset, empty, zero, or not entirely made of digits.
//==========================================================================================================
inline std::optional<std::uint64_t> GetEnvUnsigned(const char* name) {
    auto v = GetEnvIfSet(name);
    if (!v) return std::nullopt;
    std::uint64_t out = 0;
    for (char c : *v) {
        if (c < '0' || c > '9') return std::nullopt;
        const std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
        if (out > (UINT64_MAX - digit) / 10u) return std::nullopt;
        out = out * 10u + digit;
    }
    if (out == 0) return std::nullopt;
    return out;
}
