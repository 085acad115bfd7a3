//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EventEmitter.h
// Purpose: Typed observer lists keyed by event name with synchronous, in-order delivery
//==========================================================================================================

#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "logging/Logger.h"

namespace mcprt {

//==========================================================================================================
// EventEmitter
// Purpose: Base for managers that publish lifecycle events. Listeners subscribe to one event name or to
//          "*" for every event. Emit() snapshots the listener list under the lock and invokes listeners
//          outside it, so a listener may subscribe, unsubscribe or call back into the emitter.
// Notes:
//   TEvent must expose a std::string member named `type` carrying the event name.
//   A listener that throws is logged and skipped; remaining listeners still run.
//==========================================================================================================
template <typename TEvent>
class EventEmitter {
public:
    using Listener = std::function<void(const TEvent&)>;
    using ListenerId = uint64_t;

    static constexpr const char* kAnyEvent = "*";

    virtual ~EventEmitter() = default;

    //==========================================================================================================
    // Subscribes a listener.
    // Args:
    //   event: Event name (e.g. "server:started") or "*" for all events.
    //   listener: Callback invoked synchronously on the emitting thread.
    // Returns:
    //   Id to pass to Off().
    //==========================================================================================================
    ListenerId On(const std::string& event, Listener listener) {
        std::lock_guard<std::mutex> lock(listenersMutex);
        ListenerId id = ++nextListenerId;
        listeners.push_back(Entry{id, event, std::move(listener)});
        return id;
    }

    // Removes a listener; returns false when the id is unknown.
    bool Off(ListenerId id) {
        std::lock_guard<std::mutex> lock(listenersMutex);
        auto it = std::find_if(listeners.begin(), listeners.end(), [id](const Entry& e) { return e.id == id; });
        if (it == listeners.end()) return false;
        listeners.erase(it);
        return true;
    }

    void RemoveAllListeners() {
        std::lock_guard<std::mutex> lock(listenersMutex);
        listeners.clear();
    }

    std::size_t ListenerCount(const std::string& event) const {
        std::lock_guard<std::mutex> lock(listenersMutex);
        return static_cast<std::size_t>(std::count_if(listeners.begin(), listeners.end(),
            [&event](const Entry& e) { return e.event == event; }));
    }

protected:
    void Emit(const TEvent& ev) const {
        std::vector<Listener> snapshot;
        {
            std::lock_guard<std::mutex> lock(listenersMutex);
            for (const auto& e : listeners) {
                if (e.event == ev.type || e.event == kAnyEvent) snapshot.push_back(e.listener);
            }
        }
        for (const auto& l : snapshot) {
            try {
                l(ev);
            } catch (const std::exception& ex) {
                LOG_ERROR("Listener for '{}' threw: {}", ev.type, ex.what());
            }
        }
    }

private:
    struct Entry {
        ListenerId id;
        std::string event;
        Listener listener;
    };

    mutable std::mutex listenersMutex;
    std::vector<Entry> listeners;
    ListenerId nextListenerId{0};
};

} // namespace mcprt
