//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.hpp
// Purpose: In-memory transport for tests and embedding
//==========================================================================================================
#pragma once

#include "mcprt/Transport.h"
#include <memory>
#include <utility>

namespace mcprt {

//==========================================================================================================
// InMemoryTransport
// Purpose: In-process transport delivering messages to a paired instance without framing or I/O.
//          Messages sent before the peer is started are queued on the peer.
//==========================================================================================================
class InMemoryTransport : public ITransport {
public:
    InMemoryTransport();
    ~InMemoryTransport() override;

    //==========================================================================================================
    // CreatePair
    // Purpose: Creates two transports wired to each other.
    // Returns:
    //   pair(left,right) where sending on one delivers to the other.
    //==========================================================================================================
    static std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> CreatePair();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start() override;

    // Closes this end and the peer's inbound side; pending Receive() calls on both ends fail.
    std::future<void> Close() override;

    bool IsConnected() const override;
    std::string GetSessionId() const override;
    std::future<void> Send(const std::string& message) override;
    std::future<std::string> Receive() override;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace mcprt
