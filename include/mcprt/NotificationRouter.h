//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: NotificationRouter.h
// Purpose: Classifies inbound server notifications, tracks progress streams and keeps a bounded history
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcprt/EventEmitter.h"
#include "mcprt/JSONRPCTypes.h"

namespace mcprt {

enum class NotificationType {
    Progress,
    Cancelled,
    ResourcesListChanged,
    ResourcesUpdated,
    ToolsListChanged,
    PromptsListChanged,
    RootsListChanged,
    Custom
};

const char* toString(NotificationType type);

// Maps a wire method (e.g. "notifications/progress") to its type; anything unrecognised is Custom.
NotificationType ClassifyNotification(const std::string& method);

//==========================================================================================================
// NotificationRecord
// Purpose: Immutable history entry. params is a deep copy independent of the inbound message.
//==========================================================================================================
struct NotificationRecord {
    NotificationType type = NotificationType::Custom;
    std::string serverName;
    std::chrono::system_clock::time_point timestamp;
    std::string method;
    std::optional<JSONValue> params;
};

//==========================================================================================================
// ProgressState
// Purpose: Live progress for one (server, token) pair. startTime survives updates.
//==========================================================================================================
struct ProgressState {
    std::string serverName;
    std::string progressToken;
    double progress = 0.0;
    std::optional<double> total;
    std::optional<std::string> message;
    std::chrono::system_clock::time_point startTime;
    std::chrono::system_clock::time_point lastUpdate;
    std::chrono::milliseconds duration{0};  // filled by queries: now - startTime
};

struct HistoryFilter {
    std::optional<std::string> serverName;
    std::optional<NotificationType> type;
    std::optional<std::chrono::system_clock::time_point> since;
    std::optional<std::chrono::system_clock::time_point> until;
    std::optional<std::size_t> limit;  // most recent N after filtering
};

struct ProgressFilter {
    std::optional<std::string> serverName;
    std::optional<std::chrono::system_clock::time_point> since;  // compared with startTime
    std::optional<std::chrono::system_clock::time_point> until;
};

struct NotificationStats {
    std::size_t totalNotifications = 0;
    std::vector<std::pair<std::string, std::size_t>> byType;
    std::vector<std::pair<std::string, std::size_t>> byServer;
    std::size_t activeProgress = 0;
    std::size_t registeredHandlers = 0;
};

//==========================================================================================================
// NotificationEvent
// Purpose: Payload for "notification", "progress", "progress:complete", "cancelled", "list:changed",
//          "resource:updated", "handler:error", "history:cleared" and "progress:cleared".
//==========================================================================================================
struct NotificationEvent {
    std::string type;
    std::string serverName;
    std::optional<NotificationRecord> record;
    std::optional<ProgressState> progress;
    std::optional<NotificationType> notificationType;
    std::optional<std::string> uri;        // resource:updated
    std::optional<JSONValue> requestId;     // cancelled
    std::optional<std::string> reason;      // cancelled
    std::string error;                      // handler:error
};

//==========================================================================================================
// NotificationRouter
// Purpose: Entry point for every inbound notification. Appends to history, emits "notification", runs
//          built-in handling for known types, then runs type handlers concurrently and waits for them.
//==========================================================================================================
class NotificationRouter : public EventEmitter<NotificationEvent> {
public:
    using Handler = std::function<void(const NotificationRecord&)>;
    using ProgressCallback = std::function<void(const ProgressState&)>;
    using HandlerId = uint64_t;

    explicit NotificationRouter(std::size_t maxHistorySize = 100);
    ~NotificationRouter() override;

    //==========================================================================================================
    // Routes one notification.
    // Args:
    //   serverName: Originating server.
    //   method: Wire method, e.g. "notifications/progress".
    //   params: Optional params; copied before storage.
    //==========================================================================================================
    void HandleNotification(const std::string& serverName, const std::string& method,
                            const std::optional<JSONValue>& params = std::nullopt);

    ////////////////////////////////////////// Handlers //////////////////////////////////////////
    HandlerId RegisterHandler(NotificationType type, Handler handler);
    bool UnregisterHandler(HandlerId id);

    // Per-server progress callback; replaces any previous one for that server.
    void OnProgress(const std::string& serverName, ProgressCallback callback);
    void OffProgress(const std::string& serverName);

    ////////////////////////////////////////// History //////////////////////////////////////////
    std::vector<NotificationRecord> GetHistory(const HistoryFilter& filter = {}) const;
    void ClearHistory();
    void ClearServerHistory(const std::string& serverName);
    void SetMaxHistorySize(std::size_t size);

    ////////////////////////////////////////// Progress //////////////////////////////////////////
    std::vector<ProgressState> GetActiveProgress(const ProgressFilter& filter = {}) const;
    std::vector<ProgressState> GetServerProgress(const std::string& serverName) const;
    // Stops tracking a token without emitting completion. Returns false when unknown.
    bool CancelProgress(const std::string& serverName, const std::string& progressToken);
    // Drops every progress entry, or only those of one server.
    void ClearProgress(const std::optional<std::string>& serverName = std::nullopt);

    NotificationStats GetStats() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;

    void handleProgress(const std::string& serverName, const std::optional<JSONValue>& params);
    void dispatchHandlers(const NotificationRecord& record);
};

} // namespace mcprt
