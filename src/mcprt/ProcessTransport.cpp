//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessTransport.cpp
// Purpose: Line framing on top of lifecycle stdout events and stdin writes
//==========================================================================================================

#include "mcprt/ProcessTransport.hpp"

#include <atomic>
#include <mutex>
#include <vector>

#include "logging/Logger.h"
#include "mcprt/errors/Errors.h"

namespace mcprt {

class ProcessTransport::Impl {
public:
    LifecycleManager& lifecycle;
    std::string serverName;
    std::string sessionId;
    std::atomic<bool> connected{false};
    MessageInbox inbox;
    std::mutex bufferMutex;
    std::string buffer;
    std::vector<LifecycleManager::ListenerId> listeners;

    Impl(LifecycleManager& l, std::string name) : lifecycle(l), serverName(std::move(name)) {}

    void onStdout(const std::string& chunk) {
        std::vector<std::string> lines;
        {
            std::lock_guard<std::mutex> lock(bufferMutex);
            buffer += chunk;
            std::size_t start = 0;
            for (;;) {
                std::size_t nl = buffer.find('\n', start);
                if (nl == std::string::npos) break;
                std::string line = buffer.substr(start, nl - start);
                if (!line.empty() && line.back() == '\r') line.pop_back();
                if (!line.empty()) lines.push_back(std::move(line));
                start = nl + 1;
            }
            buffer.erase(0, start);
            if (buffer.size() > MaxLineLength) {
                LOG_WARN("ProcessTransport[{}]: line exceeds {} bytes; discarding", serverName, MaxLineLength);
                buffer.clear();
            }
        }
        for (auto& line : lines) inbox.Push(std::move(line));
    }

    void onServerGone(const std::string& why) {
        if (!connected.exchange(false)) return;
        LOG_DEBUG("ProcessTransport[{}]: closing ({})", serverName, why);
        inbox.Close("Server " + serverName + " " + why);
    }

    void unsubscribe() {
        for (auto id : listeners) lifecycle.Off(id);
        listeners.clear();
    }
};

ProcessTransport::ProcessTransport(LifecycleManager& lifecycle, std::string serverName)
    : pImpl(std::make_shared<Impl>(lifecycle, std::move(serverName))) {
    FUNC_SCOPE();
    auto pid = lifecycle.GetProcess(pImpl->serverName);
    pImpl->sessionId = "process-" + pImpl->serverName + "-" +
                       (pid && pid->pid ? std::to_string(*pid->pid) : std::string("unstarted"));
}

ProcessTransport::~ProcessTransport() {
    FUNC_SCOPE();
    pImpl->unsubscribe();
    pImpl->connected = false;
    pImpl->inbox.Close("ProcessTransport destroyed");
}

std::future<void> ProcessTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> promise;
    auto fut = promise.get_future();
    ServerState state = pImpl->lifecycle.GetState(pImpl->serverName);
    if (state != ServerState::Running && state != ServerState::Starting) {
        promise.set_exception(std::make_exception_ptr(errors::TransportError(
            "Server " + pImpl->serverName + " is not running (" + toString(state) + ")")));
        return fut;
    }

    std::weak_ptr<Impl> weak = pImpl;
    const std::string name = pImpl->serverName;
    pImpl->listeners.push_back(pImpl->lifecycle.On("server:stdout", [weak, name](const LifecycleEvent& ev) {
        if (ev.serverName != name) return;
        if (auto impl = weak.lock()) impl->onStdout(ev.data);
    }));
    for (const char* type : {"server:stopped", "server:crashed", "server:error", "server:stopping"}) {
        pImpl->listeners.push_back(pImpl->lifecycle.On(type, [weak, name, type](const LifecycleEvent& ev) {
            if (ev.serverName != name) return;
            if (auto impl = weak.lock()) impl->onServerGone(std::string(type).substr(7));
        }));
    }
    if (auto proc = pImpl->lifecycle.GetProcess(name); proc && proc->pid) {
        pImpl->sessionId = "process-" + name + "-" + std::to_string(*proc->pid);
    }
    pImpl->connected = true;
    LOG_DEBUG("ProcessTransport[{}] started", name);
    promise.set_value();
    return fut;
}

std::future<void> ProcessTransport::Close() {
    FUNC_SCOPE();
    pImpl->unsubscribe();
    pImpl->connected = false;
    pImpl->inbox.Close("Transport closed");
    std::promise<void> promise;
    promise.set_value();
    return promise.get_future();
}

bool ProcessTransport::IsConnected() const {
    return pImpl->connected.load();
}

std::string ProcessTransport::GetSessionId() const {
    return pImpl->sessionId;
}

std::future<void> ProcessTransport::Send(const std::string& message) {
    std::promise<void> promise;
    auto fut = promise.get_future();
    if (!pImpl->connected.load()) {
        promise.set_exception(std::make_exception_ptr(errors::TransportError("Transport not connected")));
        return fut;
    }
    if (message.find('\n') != std::string::npos) {
        promise.set_exception(std::make_exception_ptr(
            errors::TransportError("Message contains a newline and cannot be line-framed")));
        return fut;
    }
    // Not waited on here: Send may be called from the event loop thread, which performs the write.
    return pImpl->lifecycle.WriteStdin(pImpl->serverName, message + "\n");
}

std::future<std::string> ProcessTransport::Receive() {
    return pImpl->inbox.Pop();
}

} // namespace mcprt
