//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Implements version helpers from the compile-time project version.
//==========================================================================================================
#include "pmtrelay/version.h"

#include <fmt/format.h>

#ifndef PMTRELAY_VERSION_MAJOR
#define PMTRELAY_VERSION_MAJOR 0
#endif
#ifndef PMTRELAY_VERSION_MINOR
#define PMTRELAY_VERSION_MINOR 0
#endif
#ifndef PMTRELAY_VERSION_PATCH
#define PMTRELAY_VERSION_PATCH 0
#endif

namespace pmtrelay {

VersionInfo getVersion() {
    return VersionInfo{PMTRELAY_VERSION_MAJOR, PMTRELAY_VERSION_MINOR, PMTRELAY_VERSION_PATCH};
}

std::string getVersionString() {
    const auto v = getVersion();
    return fmt::format("{}.{}.{}", v.major, v.minor, v.patch);
}

} // namespace pmtrelay
