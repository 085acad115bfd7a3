//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Runtime.h
// Purpose: Client runtime wiring supervised servers, protocol engines and the per-concern managers
//==========================================================================================================

#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "mcprt/CancellationManager.h"
#include "mcprt/EventEmitter.h"
#include "mcprt/EventLoop.h"
#include "mcprt/LifecycleManager.h"
#include "mcprt/NotificationRouter.h"
#include "mcprt/Protocol.h"
#include "mcprt/RootsManager.h"
#include "mcprt/RuntimeConfig.h"
#include "mcprt/SamplingManager.h"
#include "mcprt/ServerLogManager.h"

namespace mcprt {

struct RequestOptions {
    // Overrides the engine's request timeout. On expiry the caller gets TimeoutError and the server is
    // told with notifications/cancelled (reason "timeout").
    std::optional<std::chrono::milliseconds> timeout;
    // Stopped when the request is cancelled for any reason.
    std::optional<std::stop_source> abortSource;
    // Explicit request id, usable with Cancellation().CancelRequest(). Generated as "<server>-<n>" when absent.
    std::optional<JSONRPCId> id;
};

//==========================================================================================================
// RuntimeEvent
// Purpose: "server:connected" (initialize handshake finished, including after a restart) and
//          "server:disconnected" (reason names the lifecycle event or "disconnect").
//==========================================================================================================
struct RuntimeEvent {
    std::string type;
    std::string serverName;
    std::string reason;
    std::optional<InitializeResult> serverInfo;
};

//==========================================================================================================
// Runtime
// Purpose: Owns the event loop and every manager. Connect() starts a server (dependencies first),
//          attaches a ProcessTransport, runs a receive pump and performs the initialize handshake.
//          The pump routes responses to the server's ProtocolEngine and notifications to the
//          NotificationRouter; server-initiated requests are answered by the runtime itself.
// Notes:
//   Requests block on their transport write, so Connect/Request/CallTool must not be called from
//   event loop callbacks (lifecycle or manager listeners). Reactions to lifecycle events run on an
//   internal worker thread for the same reason.
//==========================================================================================================
class Runtime : public EventEmitter<RuntimeEvent> {
public:
    explicit Runtime(RuntimeConfig config);
    ~Runtime() override;

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    ////////////////////////////////////////// Connections //////////////////////////////////////////
    //==========================================================================================================
    // Starts the server and its dependencies, then runs initialize / notifications/initialized.
    // Args:
    //   serverName: Name from the config's mcpServers (or RegisterServer()).
    //   clientInfo: Overrides the configured clientInfo for this server.
    // Returns:
    //   Future with the server's initialize result. Already-connected servers resolve immediately.
    //==========================================================================================================
    std::future<InitializeResult> Connect(const std::string& serverName,
                                          std::optional<Implementation> clientInfo = std::nullopt);

    // Connects every registered server; failures are aggregated into one ProtocolError.
    std::future<void> ConnectAll();

    // Cancels in-flight requests, closes the transport and stops the server process.
    std::future<void> Disconnect(const std::string& serverName);

    bool IsConnected(const std::string& serverName) const;
    std::vector<std::string> GetConnectedServers() const;
    std::optional<InitializeResult> GetServerInfo(const std::string& serverName) const;

    // Adds a server at runtime (same rules as a config entry).
    void RegisterServer(const std::string& name, const ServerConfig& config);

    ////////////////////////////////////////// Requests //////////////////////////////////////////
    //==========================================================================================================
    // Sends a request tracked by the CancellationManager.
    // Returns:
    //   Future with the result; fails with RemoteError, TimeoutError, CancellationError or TransportError.
    //==========================================================================================================
    std::future<JSONValue> Request(const std::string& serverName, const std::string& method,
                                   std::optional<JSONValue> params = std::nullopt, RequestOptions options = {});

    std::future<CallToolResult> CallTool(const std::string& serverName, const std::string& toolName,
                                         const JSONValue& arguments, RequestOptions options = {});
    std::future<std::vector<Tool>> ListTools(const std::string& serverName, RequestOptions options = {});
    std::future<void> Ping(const std::string& serverName, RequestOptions options = {});

    // Updates the minimum stored level and, when the server advertises logging, sends logging/setLevel.
    std::future<void> SetServerLogLevel(const std::string& serverName, LoggingLevel level);

    ////////////////////////////////////////// Roots //////////////////////////////////////////
    // Replaces the roots answered to roots/list and sends notifications/roots/list_changed to every
    // connected server. Throws errors::ValidationError, leaving the roots untouched, when an entry is rejected.
    // Changes made directly through Roots() notify servers the same way.
    std::future<void> SetRoots(std::vector<Root> roots);
    std::vector<Root> GetRoots() const;

    ////////////////////////////////////////// Components //////////////////////////////////////////
    EventLoop& Loop();
    LifecycleManager& Lifecycle();
    CancellationManager& Cancellation();
    NotificationRouter& Notifications();
    RootsManager& Roots();
    SamplingManager& Sampling();
    ServerLogManager& Logs();

    //==========================================================================================================
    // Cancels outstanding work and stops every server. Idempotent; also run by the destructor.
    // Must not be called from an event loop callback.
    //==========================================================================================================
    void Shutdown();

private:
    struct Impl;
    std::shared_ptr<Impl> pImpl;

    friend struct Impl;
    void emitEvent(const RuntimeEvent& ev) { Emit(ev); }
};

} // namespace mcprt
