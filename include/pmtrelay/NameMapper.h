//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: NameMapper.h
// Purpose: Derivation of client-safe tool names and the public name -> upstream id association
//==========================================================================================================

#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "pmtrelay/Protocol.h"

namespace pmtrelay {

// Upper bound on public tool names imposed by MCP clients.
constexpr std::size_t kMaxToolNameLength = 64;

//==========================================================================================================
// DeriveToolName
// Purpose: Derives a compact name matching [A-Za-z0-9_-]{0,64} from a tool description.
// Notes:
//   The readable part is the text before the first of " — ", " - ", " – ", "|" (tried in that order,
//   only when found past position 0); otherwise the first sentence when it ends before position 100;
//   otherwise the first 50 bytes. Whitespace runs become '-', other characters are dropped, and trailing
//   '-' are trimmed after truncation. May return an empty string.
//==========================================================================================================
std::string DeriveToolName(const std::string& description);

// Applies the character filtering and length rules of DeriveToolName to an arbitrary string.
std::string SanitizeToolName(const std::string& text);

//==========================================================================================================
// NameMapper
// Purpose: Holds the public-name -> upstream-id association for the process lifetime.
// Notes:
//   Refresh() records one entry per catalog tool before returning, so every name it hands out resolves.
//   Within one catalog, a name already taken by a different upstream id gets a "-2", "-3", ... suffix.
//   Entries are overwritten by later refreshes and never removed.
//==========================================================================================================
class NameMapper {
public:
    NameMapper() = default;

    // Derives and records names for tools; returns them in catalog order.
    std::vector<std::string> Refresh(const std::vector<ToolDescriptor>& tools);

    // Returns the upstream id recorded for publicName.
    std::optional<std::string> Resolve(const std::string& publicName) const;

    std::size_t Size() const;

private:
    mutable std::mutex mapMutex;
    std::unordered_map<std::string, std::string> nameToId;
};

} // namespace pmtrelay
