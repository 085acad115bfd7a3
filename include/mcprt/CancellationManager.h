//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CancellationManager.h
// Purpose: Registry of cancellable in-flight operations with manual, timeout, per-server and global cancel
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "mcprt/EventEmitter.h"
#include "mcprt/EventLoop.h"
#include "mcprt/JSONRPCTypes.h"
#include "mcprt/errors/Errors.h"

namespace mcprt {

using errors::CancellationReason;

//==========================================================================================================
// CancellationToken
// Purpose: One-shot cancellation flag shared between an operation and whoever may cancel it.
// Notes:
//   The first Cancel() wins; later calls do not change reason or timestamp. OnCancelled() callbacks run
//   once, synchronously inside the winning Cancel(), or immediately when registered after cancellation.
//==========================================================================================================
class CancellationToken : public std::enable_shared_from_this<CancellationToken> {
public:
    using Callback = std::function<void(CancellationReason)>;

    static std::shared_ptr<CancellationToken> Create();

    bool IsCancelled() const;
    std::optional<CancellationReason> Reason() const;
    std::optional<std::chrono::system_clock::time_point> Timestamp() const;

    // Returns true when this call performed the cancellation.
    bool Cancel(CancellationReason reason = CancellationReason::UserCancelled);

    void OnCancelled(Callback callback);

    // Throws errors::CancellationError when cancelled.
    void ThrowIfCancelled() const;

private:
    CancellationToken() = default;

    mutable std::mutex mutex;
    bool cancelled = false;
    std::optional<CancellationReason> reason;
    std::optional<std::chrono::system_clock::time_point> timestamp;
    std::vector<Callback> callbacks;
};

// Token cancelled as soon as any of the inputs is cancelled, with that input's reason.
std::shared_ptr<CancellationToken> CombineTokens(const std::vector<std::shared_ptr<CancellationToken>>& tokens);

struct CancellableRequestOptions {
    std::optional<std::chrono::milliseconds> timeout;
    // Abort handle; request_stop() is called on cancellation.
    std::optional<std::stop_source> abortSource;
    // Invoked once on cancellation; exceptions are reported through "cancel:error".
    std::function<void(CancellationReason)> onCancel;
};

//==========================================================================================================
// CancellableRequestInfo
// Purpose: Read-only snapshot of a registered request.
//==========================================================================================================
struct CancellableRequestInfo {
    JSONRPCId id;
    std::string serverName;
    std::string method;
    std::chrono::steady_clock::time_point startTime;
    std::optional<std::chrono::milliseconds> timeout;
    std::shared_ptr<CancellationToken> token;
};

struct CancellationResult {
    bool success = false;
    CancellationReason reason = CancellationReason::UserCancelled;
    JSONRPCId requestId;
    std::string serverName;
    std::chrono::milliseconds duration{0};
};

struct CancellationStats {
    std::size_t totalActive = 0;
    std::vector<std::pair<std::string, std::size_t>> byServer;
    std::vector<std::pair<std::string, std::size_t>> byMethod;
    std::optional<std::chrono::milliseconds> oldestRequestAge;
};

//==========================================================================================================
// CancellationEvent
// Purpose: Payload for "request:registered", "request:unregistered", "request:cancelled",
//          "cancel:error", "server:cancelled" and "all:cancelled".
//==========================================================================================================
struct CancellationEvent {
    std::string type;
    std::optional<JSONRPCId> requestId;
    std::string serverName;
    std::string method;
    std::optional<CancellationReason> reason;
    std::optional<std::chrono::milliseconds> duration;
    std::size_t count = 0;
    std::string error;
};

//==========================================================================================================
// CancellationManager
// Purpose: Owns one entry per cancellable request id. Cancelling runs the abort handle and onCancel,
//          cancels the token and removes the entry; unknown ids are a no-op.
//==========================================================================================================
class CancellationManager : public EventEmitter<CancellationEvent> {
public:
    explicit CancellationManager(EventLoop& loop);
    ~CancellationManager() override;

    //==========================================================================================================
    // Registers a cancellable request.
    // Args:
    //   id: Request id; must not already be registered.
    //   serverName, method: Bookkeeping for per-server cancel and stats.
    //   options: Optional timeout (auto-cancel with reason "timeout"), abort source and onCancel callback.
    // Returns:
    //   Token for the request. Cancelling the token cancels the request.
    // Throws:
    //   errors::ValidationError on duplicate id.
    //==========================================================================================================
    std::shared_ptr<CancellationToken> RegisterRequest(const JSONRPCId& id, const std::string& serverName,
                                                       const std::string& method,
                                                       CancellableRequestOptions options = {});

    // Normal completion: removes the entry without cancelling. Returns false for unknown ids.
    bool UnregisterRequest(const JSONRPCId& id);

    std::optional<CancellationResult> CancelRequest(const JSONRPCId& id,
                                                    CancellationReason reason = CancellationReason::UserCancelled);
    std::vector<CancellationResult> CancelServerRequests(const std::string& serverName,
                                                         CancellationReason reason = CancellationReason::Shutdown);
    std::vector<CancellationResult> CancelAll(CancellationReason reason = CancellationReason::Shutdown);

    bool HasRequest(const JSONRPCId& id) const;
    std::optional<CancellableRequestInfo> GetRequest(const JSONRPCId& id) const;
    std::vector<CancellableRequestInfo> GetAllRequests() const;
    std::vector<CancellableRequestInfo> GetServerRequests(const std::string& serverName) const;

    CancellationStats GetStats() const;
    // Elapsed time per registered request, keyed by IdToString.
    std::vector<std::pair<std::string, std::chrono::milliseconds>> GetRequestDurations() const;
    std::vector<CancellableRequestInfo> FindLongRunningRequests(std::chrono::milliseconds threshold) const;

    // Params for notifications/cancelled: { requestId, reason? }.
    static JSONValue CreateCancellationNotification(const JSONRPCId& requestId,
                                                    std::optional<std::string> reason = std::nullopt);

    // Disarms every timer and drops every entry without invoking callbacks.
    void Cleanup();

private:
    struct Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace mcprt
