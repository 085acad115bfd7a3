//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for the MCP runtime (semantic version helpers).
//==========================================================================================================
#pragma once

#include <string>

namespace mcprt {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

VersionInfo getVersion();

//==========================================================================================================
// getVersionString
// Purpose: Returns the semantic version string formatted as "MAJOR.MINOR.PATCH". Also used as the
//          default clientInfo.version in the initialize handshake.
//==========================================================================================================
std::string getVersionString();

} // namespace mcprt
