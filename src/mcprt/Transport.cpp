//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.cpp
// Purpose: MessageInbox shared by the transport implementations
//==========================================================================================================

#include "mcprt/Transport.h"
#include "mcprt/errors/Errors.h"

namespace mcprt {

void MessageInbox::Push(std::string message) {
    std::promise<std::string> waiter;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed) {
            return;
        }
        if (waiters.empty()) {
            messages.push_back(std::move(message));
            return;
        }
        waiter = std::move(waiters.front());
        waiters.pop_front();
    }
    waiter.set_value(std::move(message));
}

std::future<std::string> MessageInbox::Pop() {
    std::lock_guard<std::mutex> lock(mutex);
    std::promise<std::string> p;
    auto fut = p.get_future();
    if (!messages.empty()) {
        p.set_value(std::move(messages.front()));
        messages.pop_front();
    } else if (closed) {
        p.set_exception(std::make_exception_ptr(errors::TransportError(closeReason)));
    } else {
        waiters.push_back(std::move(p));
    }
    return fut;
}

void MessageInbox::Close(const std::string& reason) {
    std::deque<std::promise<std::string>> pending;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed) {
            return;
        }
        closed = true;
        closeReason = reason;
        pending.swap(waiters);
    }
    for (auto& w : pending) {
        w.set_exception(std::make_exception_ptr(errors::TransportError(reason)));
    }
}

bool MessageInbox::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex);
    return closed;
}

std::size_t MessageInbox::Size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return messages.size();
}

} // namespace mcprt
