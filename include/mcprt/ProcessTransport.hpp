//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessTransport.hpp
// Purpose: Newline-delimited JSON-RPC transport over a supervised server's stdio
//==========================================================================================================
#pragma once

#include "mcprt/LifecycleManager.h"
#include "mcprt/Transport.h"

#include <memory>
#include <string>

namespace mcprt {

//==========================================================================================================
// ProcessTransport
// Purpose: Frames messages for one server managed by a LifecycleManager. Outbound messages are written
//          to the child's stdin followed by '\n'; inbound lines are assembled from server:stdout events.
//          The inbox closes when the server stops, crashes or errors, ending any receive loop.
//==========================================================================================================
class ProcessTransport : public ITransport {
public:
    // Lines longer than this are discarded with a warning.
    static constexpr std::size_t MaxLineLength = 16 * 1024 * 1024;

    ProcessTransport(LifecycleManager& lifecycle, std::string serverName);
    ~ProcessTransport() override;

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    // Subscribes to the server's output. The server must already be running or starting.
    std::future<void> Start() override;
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
