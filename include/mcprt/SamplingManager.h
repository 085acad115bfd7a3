//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SamplingManager.h
// Purpose: Server-initiated sampling/createMessage requests routed to host-provided LLM callbacks
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "mcprt/EventEmitter.h"
#include "mcprt/EventLoop.h"
#include "mcprt/Protocol.h"

namespace mcprt {

//==========================================================================================================
// SamplingCallback
// Purpose: Host hook that produces a model completion. The stop_token is signalled when the request
//          times out or is cancelled; a result delivered after that is discarded.
//==========================================================================================================
using SamplingCallback =
    std::function<std::future<CreateMessageResult>(const CreateMessageParams& params, std::stop_token stop)>;

struct SamplingOptions {
    std::chrono::milliseconds defaultTimeout{60000};
    std::size_t maxConcurrentRequests = 5;
};

struct SamplingRequestInfo {
    std::string id;
    std::string serverName;
    CreateMessageParams params;
    std::chrono::system_clock::time_point timestamp;
};

struct SamplingStats {
    std::size_t registeredCallbacks = 0;
    std::size_t pendingRequests = 0;
    std::size_t maxConcurrentRequests = 0;
    // Threads still waiting on a host callback; drops back once requests settle.
    std::size_t callbackWaiters = 0;
    std::vector<std::pair<std::string, std::size_t>> byServer;
};

//==========================================================================================================
// SamplingEvent
// Purpose: Payload for "callback:registered", "callback:unregistered", "request:start",
//          "request:complete", "request:error" and "request:cancelled".
//==========================================================================================================
struct SamplingEvent {
    std::string type;
    std::string serverName;
    std::string requestId;
    std::optional<std::chrono::milliseconds> duration;
    std::string error;
};

//==========================================================================================================
// SamplingManager
// Purpose: Validates inbound sampling params, enforces a global in-flight cap, runs the server's callback
//          against a timeout and validates its result before handing it back.
//==========================================================================================================
class SamplingManager : public EventEmitter<SamplingEvent> {
public:
    explicit SamplingManager(EventLoop& loop, SamplingOptions options = {});
    ~SamplingManager() override;

    // Replaces any callback already registered for the server.
    void RegisterCallback(const std::string& serverName, SamplingCallback callback);
    bool UnregisterCallback(const std::string& serverName);
    bool HasCallback(const std::string& serverName) const;

    //==========================================================================================================
    // Handles one sampling/createMessage request.
    // Args:
    //   serverName: Requesting server; selects the callback.
    //   params: Raw request params.
    //   timeout: Overrides the default timeout.
    // Returns:
    //   Future resolving to a validated result. Fails with ProtocolError (no callback, cap reached),
    //   ValidationError (bad params or bad result), TimeoutError or CancellationError.
    //==========================================================================================================
    std::future<CreateMessageResult> HandleSamplingRequest(const std::string& serverName, const JSONValue& params,
                                                           std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    bool CancelRequest(const std::string& requestId);
    std::size_t CancelServerRequests(const std::string& serverName);

    std::size_t GetPendingCount() const;
    std::vector<SamplingRequestInfo> GetServerPendingRequests(const std::string& serverName) const;
    SamplingStats GetStats() const;

    void SetMaxConcurrentRequests(std::size_t max);
    void SetDefaultTimeout(std::chrono::milliseconds timeout);

    // Rejects every in-flight request with CancellationError and drops all callbacks.
    void Cleanup();

private:
    struct Impl;
    std::shared_ptr<Impl> pImpl;

    void settleWithResult(const std::string& requestId, CreateMessageResult result);
    void settleWithError(const std::string& requestId, std::exception_ptr error, const char* eventType);
};

} // namespace mcprt
