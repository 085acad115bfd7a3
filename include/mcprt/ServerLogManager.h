//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerLogManager.h
// Purpose: Stores notifications/message log records from servers with per-server minimum levels
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcprt/EventEmitter.h"
#include "mcprt/JSONRPCTypes.h"
#include "mcprt/Protocol.h"

namespace mcprt {

struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LoggingLevel level = LoggingLevel::Info;
    std::string serverName;
    std::optional<std::string> logger;
    std::string message;
    std::optional<JSONValue> data;
};

struct LogFilter {
    std::optional<LoggingLevel> minLevel;
    std::vector<std::string> servers;   // empty matches all
    std::vector<std::string> loggers;   // empty matches all; non-empty skips entries without a logger
    std::optional<std::chrono::system_clock::time_point> since;
    std::optional<std::chrono::system_clock::time_point> until;
};

struct ServerLogOptions {
    LoggingLevel defaultLevel = LoggingLevel::Info;
    std::size_t maxEntries = 1000;
    bool echoToLogger = true;
};

// Payload for "log", "level:default", "level:server", "level:removed", "cleared" and "cleared:server".
struct ServerLogEvent {
    std::string type;
    std::string serverName;
    std::optional<LogEntry> entry;
    std::optional<LoggingLevel> level;
    std::size_t count = 0;
};

// Renders "[<iso time>] [server] [LEVEL][logger] message <data>".
std::string FormatLogEntry(const LogEntry& entry);

class ServerLogManager : public EventEmitter<ServerLogEvent> {
public:
    explicit ServerLogManager(ServerLogOptions options = {});
    ~ServerLogManager() override;

    void SetDefaultLevel(LoggingLevel level);
    void SetServerLevel(const std::string& serverName, LoggingLevel level);
    void RemoveServerLevel(const std::string& serverName);
    LoggingLevel GetServerLevel(const std::string& serverName) const;
    void SetEchoToLogger(bool enabled);

    //==========================================================================================================
    // Records one entry when level meets the server's minimum.
    // Returns:
    //   true when the entry was stored.
    //==========================================================================================================
    bool Log(const std::string& serverName, LoggingLevel level, const std::string& message,
             const std::optional<JSONValue>& data = std::nullopt,
             const std::optional<std::string>& logger = std::nullopt);

    //==========================================================================================================
    // Maps notifications/message params ({level, logger?, data}) onto Log(). A string `data` becomes the
    // message; any other payload is serialized into the message and kept as data.
    // Returns:
    //   true when the entry was stored; false when filtered out or the params are malformed.
    //==========================================================================================================
    bool HandleLogNotification(const std::string& serverName, const std::optional<JSONValue>& params);

    std::vector<LogEntry> GetEntries(const LogFilter& filter = {}) const;
    std::vector<LogEntry> GetRecentEntries(std::size_t count, const LogFilter& filter = {}) const;
    std::vector<std::pair<LoggingLevel, std::size_t>> CountByLevel() const;
    std::vector<std::pair<std::string, std::size_t>> CountByServer() const;

    void Clear();
    std::size_t ClearServer(const std::string& serverName);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcprt
