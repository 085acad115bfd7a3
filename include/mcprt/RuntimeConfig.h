//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RuntimeConfig.h
// Purpose: Runtime configuration loaded from JSON (mcpServers plus per-component sections)
//==========================================================================================================

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "mcprt/LifecycleManager.h"
#include "mcprt/Protocol.h"
#include "mcprt/ProtocolEngine.h"
#include "mcprt/RootsManager.h"
#include "mcprt/SamplingManager.h"
#include "mcprt/ServerLogManager.h"

namespace mcprt {

struct LoggingSettings {
    // Process logger level (DEBUG/INFO/WARN/ERROR); MCPRT_LOG_LEVEL wins when set.
    std::optional<std::string> level;
    std::optional<std::string> file;
    ServerLogOptions serverLogs;
    std::map<std::string, LoggingLevel> serverLevels;
};

//==========================================================================================================
// RuntimeConfig
// Purpose: Everything a Runtime needs. Shape:
//   {
//     "mcpServers": { "<name>": { "type": "stdio", "command": "...", "args": [], "env": {}, "dependsOn": [] } },
//     "lifecycle": { "startupTimeoutMs", "shutdownTimeoutMs", "maxRestarts", "restartDelayMs",
//                    "healthCheckIntervalMs", "maxConsecutiveFailures", "readyGraceMs", "healthFailureThreshold" },
//     "protocol": { "requestTimeoutMs" },
//     "sampling": { "timeoutMs", "maxConcurrentRequests" },
//     "notifications": { "maxHistory" },
//     "logging": { "level", "file", "serverDefaultLevel", "maxEntries", "echo", "servers": { "<name>": "<level>" } },
//     "roots": [ { "uri", "name" } ],
//     "rootsOptions": { "validatePaths", "allowDynamicRoots" },
//     "clientInfo": { "name", "version" }
//   }
// Every section is optional.
//==========================================================================================================
struct RuntimeConfig {
    std::map<std::string, ServerConfig> servers;
    LifecycleOptions lifecycle;
    ProtocolOptions protocol;
    SamplingOptions sampling;
    std::size_t maxNotificationHistory = 100;
    LoggingSettings logging;
    std::vector<Root> roots;
    // validatePaths is off here: advertised roots may name locations this host has not created.
    RootsOptions rootsOptions;
    Implementation clientInfo;

    RuntimeConfig();

    // Throws errors::ConfigError on any structural or type problem, naming the offending key.
    static RuntimeConfig FromJSON(const JSONValue& document);
    static RuntimeConfig Parse(const std::string& text);
    static RuntimeConfig LoadFile(const std::string& path);
};

} // namespace mcprt
