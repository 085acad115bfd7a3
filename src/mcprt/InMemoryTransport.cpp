//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.cpp
// Purpose: In-memory transport implementation
//==========================================================================================================

#include <atomic>
#include <future>
#include <mutex>
#include <random>
#include <string>

#include "logging/Logger.h"
#include "mcprt/InMemoryTransport.hpp"
#include "mcprt/errors/Errors.h"

namespace mcprt {

class InMemoryTransport::Impl {
public:
    std::atomic<bool> connected{false};
    std::string sessionId;
    MessageInbox inbox;
    std::mutex peerMutex;
    std::weak_ptr<Impl> peer;

    Impl() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "memory-" + std::to_string(dis(gen));
    }

    std::shared_ptr<Impl> lockPeer() {
        std::lock_guard<std::mutex> lock(peerMutex);
        return peer.lock();
    }
};

InMemoryTransport::InMemoryTransport() : pImpl(std::make_shared<Impl>()) { FUNC_SCOPE(); }

InMemoryTransport::~InMemoryTransport() {
    FUNC_SCOPE();
    pImpl->connected = false;
    pImpl->inbox.Close("InMemoryTransport destroyed");
    if (auto p = pImpl->lockPeer()) {
        p->inbox.Close("Peer transport destroyed");
    }
}

std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> InMemoryTransport::CreatePair() {
    FUNC_SCOPE();
    auto transport1 = std::make_unique<InMemoryTransport>();
    auto transport2 = std::make_unique<InMemoryTransport>();
    transport1->pImpl->peer = transport2->pImpl;
    transport2->pImpl->peer = transport1->pImpl;
    return std::make_pair(std::move(transport1), std::move(transport2));
}

std::future<void> InMemoryTransport::Start() {
    FUNC_SCOPE();
    LOG_DEBUG("Starting InMemoryTransport {}", pImpl->sessionId);
    pImpl->connected = true;
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

std::future<void> InMemoryTransport::Close() {
    FUNC_SCOPE();
    LOG_DEBUG("Closing InMemoryTransport {}", pImpl->sessionId);
    pImpl->connected = false;
    pImpl->inbox.Close("Transport closed");
    if (auto p = pImpl->lockPeer()) {
        p->inbox.Close("Peer transport closed");
    }
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

bool InMemoryTransport::IsConnected() const {
    return pImpl->connected.load();
}

std::string InMemoryTransport::GetSessionId() const {
    return pImpl->sessionId;
}

std::future<void> InMemoryTransport::Send(const std::string& message) {
    FUNC_SCOPE();
    std::promise<void> promise;
    auto fut = promise.get_future();
    auto p = pImpl->lockPeer();
    if (!pImpl->connected.load() || !p || p->inbox.IsClosed()) {
        LOG_WARN("InMemoryTransport: peer not connected; dropping message");
        promise.set_exception(std::make_exception_ptr(errors::TransportError("Transport not connected")));
        return fut;
    }
    p->inbox.Push(message);
    promise.set_value();
    return fut;
}

std::future<std::string> InMemoryTransport::Receive() {
    return pImpl->inbox.Pop();
}

} // namespace mcprt
