//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Message transport interface carrying one serialized JSON-RPC object per message
//==========================================================================================================

#pragma once

#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <string>

namespace mcprt {

//==========================================================================================================
// ITransport
// Purpose: Reliable, ordered, message-oriented channel to one MCP server. Framing is the transport's
//          concern; callers only ever see complete JSON-RPC texts.
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the transport.
    // Returns:
    //   A future that completes when the transport can send and receive.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Closes the transport. Pending Receive() futures fail with errors::TransportError.
    // Returns:
    //   A future that completes when the transport has closed.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    virtual bool IsConnected() const = 0;

    // Transport session identifier for diagnostics.
    virtual std::string GetSessionId() const = 0;

    /////////////////////////////////////////// Messaging ///////////////////////////////////////////
    //==========================================================================================================
    // Sends one serialized JSON-RPC message.
    // Args:
    //   message: Complete JSON text without framing.
    // Returns:
    //   Future completing once the message has been handed to the peer; fails with
    //   errors::TransportError when the transport is closed, or with the transport's own
    //   RuntimeError subclass when the write fails.
    //==========================================================================================================
    virtual std::future<void> Send(const std::string& message) = 0;

    //==========================================================================================================
    // Receives the next inbound message in arrival order.
    // Returns:
    //   Future resolving to the next JSON text; fails with errors::TransportError once closed.
    //==========================================================================================================
    virtual std::future<std::string> Receive() = 0;
};

//==========================================================================================================
// MessageInbox
// Purpose: Thread-safe hand-off between a transport's producer side and Receive() callers. A message
//          either satisfies the oldest waiting Receive() or is queued until one arrives.
//==========================================================================================================
class MessageInbox {
public:
    void Push(std::string message);
    std::future<std::string> Pop();

    // Fails current and future waiters with errors::TransportError(reason). Queued messages are kept
    // so already-received data can still be drained.
    void Close(const std::string& reason);
    bool IsClosed() const;
    std::size_t Size() const;

private:
    mutable std::mutex mutex;
    std::deque<std::string> messages;
    std::deque<std::promise<std::string>> waiters;
    bool closed = false;
    std::string closeReason;
};

} // namespace mcprt
