//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Implements version helpers from the build-provided version components.
//==========================================================================================================
#include "mcpbridge/version.h"

#include <fmt/format.h>

#ifndef MCPBRIDGE_VERSION_MAJOR
#define MCPBRIDGE_VERSION_MAJOR 0
#endif
#ifndef MCPBRIDGE_VERSION_MINOR
#define MCPBRIDGE_VERSION_MINOR 1
#endif
#ifndef MCPBRIDGE_VERSION_PATCH
#define MCPBRIDGE_VERSION_PATCH 0
#endif

namespace mcpbridge {

VersionInfo getVersion() {
    return VersionInfo{MCPBRIDGE_VERSION_MAJOR, MCPBRIDGE_VERSION_MINOR, MCPBRIDGE_VERSION_PATCH};
}

std::string getVersionString() {
    const auto v = getVersion();
    return fmt::format("{}.{}.{}", v.major, v.minor, v.patch);
}

} // namespace mcpbridge
