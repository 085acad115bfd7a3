//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProtocolEngine.h
// Purpose: JSON-RPC 2.0 message construction, validation and request/response correlation for MCP
//==========================================================================================================

#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "mcprt/EventLoop.h"
#include "mcprt/JSONRPCTypes.h"
#include "mcprt/Protocol.h"
#include "mcprt/Transport.h"
#include "mcprt/errors/Errors.h"

namespace mcprt {

using ParsedMessage = std::variant<JSONRPCRequest, JSONRPCResponse, JSONRPCNotification>;

struct MessageValidation {
    bool valid = true;
    std::vector<std::string> errors;
};

struct ProtocolOptions {
    std::chrono::milliseconds requestTimeout{30000};
};

//==========================================================================================================
// ProtocolEngine
// Purpose: Builds and parses JSON-RPC messages and correlates responses with outstanding requests.
//          Every outstanding request ends exactly once: by its response, by a send failure, by its
//          timeout, or by CancelPending()/Cleanup(). Whichever removes the pending entry settles it.
// Notes:
//   Timers run on the supplied EventLoop. The engine is transport-agnostic; callers pass the transport
//   per call and feed inbound responses through HandleResponse().
//==========================================================================================================
class ProtocolEngine {
public:
    explicit ProtocolEngine(EventLoop& loop, ProtocolOptions options = {});
    ~ProtocolEngine();

    ProtocolEngine(const ProtocolEngine&) = delete;
    ProtocolEngine& operator=(const ProtocolEngine&) = delete;

    ////////////////////////////////////////// Construction //////////////////////////////////////////
    // Returns "mcp-<epochMs>-<counter>"; the counter is monotonic per engine.
    JSONRPCId GenerateId();

    JSONRPCRequest CreateRequest(const std::string& method, std::optional<JSONValue> params = std::nullopt,
                                 std::optional<JSONRPCId> id = std::nullopt);
    static JSONRPCNotification CreateNotification(const std::string& method, std::optional<JSONValue> params = std::nullopt);
    static JSONRPCResponse CreateResponse(const JSONRPCId& id, JSONValue result);
    static JSONRPCResponse CreateErrorResponse(const JSONRPCId& id, int code, const std::string& message,
                                               const std::optional<JSONValue>& data = std::nullopt);
    static JSONValue CreateError(int code, const std::string& message, const std::optional<JSONValue>& data = std::nullopt);

    ////////////////////////////////////////// Parsing //////////////////////////////////////////
    //==========================================================================================================
    // Checks a decoded value against JSON-RPC 2.0 structure rules.
    // Returns:
    //   valid=false with every violation found (not just the first).
    //==========================================================================================================
    static MessageValidation ValidateMessage(const JSONValue& message);

    //==========================================================================================================
    // Parses raw text into a request, response or notification.
    // Throws:
    //   errors::ParseError for invalid JSON; errors::ProtocolError listing every structural violation.
    //==========================================================================================================
    static ParsedMessage ParseMessage(const std::string& raw);

    ////////////////////////////////////////// Correlation //////////////////////////////////////////
    //==========================================================================================================
    // Sends a request with a generated id.
    // Returns:
    //   Future resolving to the response result; fails with RemoteError, TimeoutError,
    //   TransportError (send failure) or CancellationError.
    //==========================================================================================================
    std::future<JSONValue> SendRequest(ITransport& transport, const std::string& method,
                                       std::optional<JSONValue> params = std::nullopt);

    // Same as above with a caller-chosen id and optional per-request timeout.
    std::future<JSONValue> SendRequest(ITransport& transport, const JSONRPCId& id, const std::string& method,
                                       std::optional<JSONValue> params = std::nullopt,
                                       std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    std::future<void> SendNotification(ITransport& transport, const std::string& method,
                                       std::optional<JSONValue> params = std::nullopt);

    //==========================================================================================================
    // Delivers an inbound response to its pending request.
    // Returns:
    //   true when a pending request was settled; false (with a warning) for unknown or late ids.
    //==========================================================================================================
    bool HandleResponse(const JSONRPCResponse& response);

    // Rejects one pending request with CancellationError. A later response for it is dropped.
    bool CancelPending(const JSONRPCId& id, errors::CancellationReason reason);

    bool HasPending(const JSONRPCId& id) const;
    std::size_t PendingCount() const;

    void SetRequestTimeout(std::chrono::milliseconds timeout);
    std::chrono::milliseconds GetRequestTimeout() const;

    // Rejects every pending request with "Protocol cleanup - request cancelled" and disarms all timers.
    void Cleanup();

    ////////////////////////////////////////// MCP operations //////////////////////////////////////////
    // Fails with ProtocolError before any RPC when params.protocolVersion is unsupported.
    std::future<InitializeResult> Initialize(ITransport& transport, const InitializeParams& params);
    std::future<void> Initialized(ITransport& transport);
    std::future<void> Ping(ITransport& transport);
    std::future<std::vector<Tool>> ListTools(ITransport& transport);
    std::future<CallToolResult> CallTool(ITransport& transport, const std::string& name, const JSONValue& arguments);
    std::future<std::vector<Resource>> ListResources(ITransport& transport);
    // Resolves to the first item of contents; fails with ProtocolError when the server returned none.
    std::future<JSONValue> ReadResource(ITransport& transport, const std::string& uri);
    std::future<void> SubscribeResource(ITransport& transport, const std::string& uri);
    std::future<void> UnsubscribeResource(ITransport& transport, const std::string& uri);
    std::future<std::vector<Prompt>> ListPrompts(ITransport& transport);
    std::future<GetPromptResult> GetPrompt(ITransport& transport, const std::string& name,
                                           std::optional<JSONValue> arguments = std::nullopt);
    std::future<std::vector<Root>> ListRoots(ITransport& transport);
    std::future<void> SetLoggingLevel(ITransport& transport, LoggingLevel level);
    std::future<void> SendProgressNotification(ITransport& transport, const JSONValue& progressToken,
                                               double progress, std::optional<double> total = std::nullopt);
    std::future<void> SendCancelledNotification(ITransport& transport, const JSONRPCId& requestId,
                                                std::optional<std::string> reason = std::nullopt);
    std::future<void> Shutdown(ITransport& transport);

    ////////////////////////////////////////// Helpers //////////////////////////////////////////
    static InitializeParams CreateInitializeParams(Implementation clientInfo, ClientCapabilities capabilities = {});
    // "[<code>] <message>" for a JSON-RPC error object; "Unknown error" when malformed.
    static std::string FormatError(const JSONValue& errorObject);

private:
    struct Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace mcprt
