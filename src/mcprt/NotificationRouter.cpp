//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: NotificationRouter.cpp
// Purpose: Notification classification, progress inference and handler fan-out
//==========================================================================================================

#include "mcprt/NotificationRouter.h"

#include <algorithm>
#include <deque>
#include <future>
#include <map>
#include <mutex>
#include <unordered_map>

#include "logging/Logger.h"
#include "mcprt/Protocol.h"

namespace mcprt {

using namespace std::chrono;

const char* toString(NotificationType type) {
    switch (type) {
        case NotificationType::Progress: return "progress";
        case NotificationType::Cancelled: return "cancelled";
        case NotificationType::ResourcesListChanged: return "resources/list_changed";
        case NotificationType::ResourcesUpdated: return "resources/updated";
        case NotificationType::ToolsListChanged: return "tools/list_changed";
        case NotificationType::PromptsListChanged: return "prompts/list_changed";
        case NotificationType::RootsListChanged: return "roots/list_changed";
        case NotificationType::Custom: return "custom";
    }
    return "custom";
}

NotificationType ClassifyNotification(const std::string& method) {
    static const std::unordered_map<std::string, NotificationType> known{
        {Methods::Progress, NotificationType::Progress},
        {Methods::Cancelled, NotificationType::Cancelled},
        {Methods::ResourceListChanged, NotificationType::ResourcesListChanged},
        {Methods::ResourceUpdated, NotificationType::ResourcesUpdated},
        {Methods::ToolListChanged, NotificationType::ToolsListChanged},
        {Methods::PromptListChanged, NotificationType::PromptsListChanged},
        {Methods::RootsListChanged, NotificationType::RootsListChanged},
    };
    auto it = known.find(method);
    return it == known.end() ? NotificationType::Custom : it->second;
}

namespace {
bool isListChanged(NotificationType t) {
    return t == NotificationType::ResourcesListChanged || t == NotificationType::ToolsListChanged
        || t == NotificationType::PromptsListChanged || t == NotificationType::RootsListChanged;
}

std::optional<std::string> tokenToString(const JSONValue& token) {
    if (token.IsString()) return std::get<std::string>(token.value);
    if (token.IsNumber()) return SerializeJSON(token);
    return std::nullopt;
}

std::string progressKey(const std::string& server, const std::string& token) {
    return server + ":" + token;
}

NotificationRecord copyRecord(const NotificationRecord& r) {
    NotificationRecord out = r;
    if (r.params) out.params = r.params->DeepCopy();
    return out;
}

ProgressState withDuration(ProgressState s, system_clock::time_point now) {
    s.duration = duration_cast<milliseconds>(now - s.startTime);
    return s;
}
} // namespace

struct NotificationRouter::Impl {
    struct HandlerEntry {
        HandlerId id;
        NotificationType type;
        Handler handler;
    };

    mutable std::mutex mutex;
    std::deque<NotificationRecord> history;
    std::size_t maxHistorySize;
    std::unordered_map<std::string, ProgressState> progress;
    std::unordered_map<std::string, ProgressCallback> progressCallbacks;
    std::vector<HandlerEntry> handlers;
    HandlerId nextHandlerId{0};

    explicit Impl(std::size_t maxSize) : maxHistorySize(maxSize) {}

    void trimHistory() {
        while (history.size() > maxHistorySize) history.pop_front();
    }
};

NotificationRouter::NotificationRouter(std::size_t maxHistorySize)
    : pImpl(std::make_unique<Impl>(maxHistorySize)) {
    FUNC_SCOPE();
}

NotificationRouter::~NotificationRouter() = default;

void NotificationRouter::HandleNotification(const std::string& serverName, const std::string& method,
                                            const std::optional<JSONValue>& params) {
    FUNC_SCOPE();
    NotificationRecord record;
    record.type = ClassifyNotification(method);
    record.serverName = serverName;
    record.timestamp = system_clock::now();
    record.method = method;
    if (params) record.params = params->DeepCopy();

    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->history.push_back(record);
        pImpl->trimHistory();
    }
    LOG_DEBUG("Notification from {}: {} ({})", serverName, method, toString(record.type));

    NotificationEvent ev;
    ev.type = "notification";
    ev.serverName = serverName;
    ev.record = copyRecord(record);
    ev.notificationType = record.type;
    Emit(ev);

    const JSONValue empty{JSONValue::Object{}};
    const JSONValue& p = record.params ? *record.params : empty;
    switch (record.type) {
        case NotificationType::Progress:
            handleProgress(serverName, record.params);
            break;
        case NotificationType::Cancelled: {
            NotificationEvent c;
            c.type = "cancelled";
            c.serverName = serverName;
            if (const JSONValue* id = FindMember(p, "requestId")) c.requestId = *id;
            c.reason = GetString(p, "reason");
            Emit(c);
            break;
        }
        case NotificationType::ResourcesUpdated: {
            NotificationEvent u;
            u.type = "resource:updated";
            u.serverName = serverName;
            u.uri = GetString(p, "uri");
            Emit(u);
            break;
        }
        default:
            if (isListChanged(record.type)) {
                NotificationEvent l;
                l.type = "list:changed";
                l.serverName = serverName;
                l.notificationType = record.type;
                Emit(l);
            }
            break;
    }

    dispatchHandlers(record);
}

void NotificationRouter::handleProgress(const std::string& serverName, const std::optional<JSONValue>& params) {
    if (!params) {
        LOG_WARN("Progress notification from {} without params", serverName);
        return;
    }
    const JSONValue* tokenNode = FindMember(*params, "progressToken");
    auto token = tokenNode ? tokenToString(*tokenNode) : std::nullopt;
    auto value = GetNumber(*params, "progress");
    if (!token || !value) {
        LOG_WARN("Malformed progress notification from {}", serverName);
        return;
    }

    const auto now = system_clock::now();
    const std::string key = progressKey(serverName, *token);
    ProgressState state;
    ProgressCallback callback;
    bool complete = false;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        auto it = pImpl->progress.find(key);
        if (it == pImpl->progress.end()) {
            ProgressState fresh;
            fresh.serverName = serverName;
            fresh.progressToken = *token;
            fresh.startTime = now;
            it = pImpl->progress.emplace(key, std::move(fresh)).first;
        }
        ProgressState& s = it->second;
        s.progress = *value;
        s.total = GetNumber(*params, "total");
        s.message = GetString(*params, "message");
        s.lastUpdate = now;
        state = withDuration(s, now);

        // Completion is inferred: servers send no dedicated terminal message.
        complete = (s.total && s.progress >= *s.total) || s.progress == 100.0;
        if (complete) {
            pImpl->progress.erase(it);
        }
        auto cb = pImpl->progressCallbacks.find(serverName);
        if (cb != pImpl->progressCallbacks.end()) callback = cb->second;
    }

    NotificationEvent ev;
    ev.type = "progress";
    ev.serverName = serverName;
    ev.progress = state;
    Emit(ev);

    if (callback) {
        try {
            callback(state);
        } catch (const std::exception& e) {
            LOG_ERROR("Progress callback for {} threw: {}", serverName, e.what());
            NotificationEvent err;
            err.type = "handler:error";
            err.serverName = serverName;
            err.notificationType = NotificationType::Progress;
            err.error = e.what();
            Emit(err);
        }
    }

    if (complete) {
        LOG_DEBUG("Progress {} on {} complete", *token, serverName);
        NotificationEvent done;
        done.type = "progress:complete";
        done.serverName = serverName;
        done.progress = state;
        Emit(done);
    }
}

void NotificationRouter::dispatchHandlers(const NotificationRecord& record) {
    std::vector<Handler> toRun;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        for (const auto& h : pImpl->handlers) {
            if (h.type == record.type) toRun.push_back(h.handler);
        }
    }
    if (toRun.empty()) return;

    // Handlers run concurrently; each gets its own copy of the record.
    std::vector<std::future<void>> running;
    running.reserve(toRun.size());
    for (auto& h : toRun) {
        running.push_back(std::async(std::launch::async, [h, rec = copyRecord(record)]() { h(rec); }));
    }
    for (auto& f : running) {
        std::string failure;
        try {
            f.get();
            continue;
        } catch (const std::exception& e) {
            failure = e.what();
        } catch (...) {
            failure = "unknown exception";
        }
        LOG_ERROR("Notification handler for {} from {} failed: {}", record.method, record.serverName, failure);
        NotificationEvent err;
        err.type = "handler:error";
        err.serverName = record.serverName;
        err.notificationType = record.type;
        err.record = copyRecord(record);
        err.error = failure;
        Emit(err);
    }
}

NotificationRouter::HandlerId NotificationRouter::RegisterHandler(NotificationType type, Handler handler) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    HandlerId id = ++pImpl->nextHandlerId;
    pImpl->handlers.push_back(Impl::HandlerEntry{id, type, std::move(handler)});
    return id;
}

bool NotificationRouter::UnregisterHandler(HandlerId id) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto& hs = pImpl->handlers;
    auto it = std::find_if(hs.begin(), hs.end(), [id](const Impl::HandlerEntry& h) { return h.id == id; });
    if (it == hs.end()) return false;
    hs.erase(it);
    return true;
}

void NotificationRouter::OnProgress(const std::string& serverName, ProgressCallback callback) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->progressCallbacks[serverName] = std::move(callback);
}

void NotificationRouter::OffProgress(const std::string& serverName) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->progressCallbacks.erase(serverName);
}

std::vector<NotificationRecord> NotificationRouter::GetHistory(const HistoryFilter& filter) const {
    std::vector<NotificationRecord> out;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        for (const auto& r : pImpl->history) {
            if (filter.serverName && r.serverName != *filter.serverName) continue;
            if (filter.type && r.type != *filter.type) continue;
            if (filter.since && r.timestamp < *filter.since) continue;
            if (filter.until && r.timestamp > *filter.until) continue;
            out.push_back(copyRecord(r));
        }
    }
    if (filter.limit && out.size() > *filter.limit) {
        out.erase(out.begin(), out.end() - static_cast<std::ptrdiff_t>(*filter.limit));
    }
    return out;
}

void NotificationRouter::ClearHistory() {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->history.clear();
    }
    NotificationEvent ev;
    ev.type = "history:cleared";
    Emit(ev);
}

void NotificationRouter::ClearServerHistory(const std::string& serverName) {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        auto& h = pImpl->history;
        h.erase(std::remove_if(h.begin(), h.end(),
                               [&serverName](const NotificationRecord& r) { return r.serverName == serverName; }),
                h.end());
    }
    NotificationEvent ev;
    ev.type = "history:cleared";
    ev.serverName = serverName;
    Emit(ev);
}

void NotificationRouter::SetMaxHistorySize(std::size_t size) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->maxHistorySize = size;
    pImpl->trimHistory();
}

std::vector<ProgressState> NotificationRouter::GetActiveProgress(const ProgressFilter& filter) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    const auto now = system_clock::now();
    std::vector<ProgressState> out;
    for (const auto& [key, s] : pImpl->progress) {
        if (filter.serverName && s.serverName != *filter.serverName) continue;
        if (filter.since && s.startTime < *filter.since) continue;
        if (filter.until && s.startTime > *filter.until) continue;
        out.push_back(withDuration(s, now));
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.startTime < b.startTime; });
    return out;
}

std::vector<ProgressState> NotificationRouter::GetServerProgress(const std::string& serverName) const {
    ProgressFilter f;
    f.serverName = serverName;
    return GetActiveProgress(f);
}

bool NotificationRouter::CancelProgress(const std::string& serverName, const std::string& progressToken) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->progress.erase(progressKey(serverName, progressToken)) > 0;
}

void NotificationRouter::ClearProgress(const std::optional<std::string>& serverName) {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (!serverName) {
            pImpl->progress.clear();
        } else {
            for (auto it = pImpl->progress.begin(); it != pImpl->progress.end();) {
                if (it->second.serverName == *serverName) it = pImpl->progress.erase(it); else ++it;
            }
        }
    }
    NotificationEvent ev;
    ev.type = "progress:cleared";
    ev.serverName = serverName.value_or("");
    Emit(ev);
}

NotificationStats NotificationRouter::GetStats() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    NotificationStats stats;
    stats.totalNotifications = pImpl->history.size();
    std::map<std::string, std::size_t> byType;
    std::map<std::string, std::size_t> byServer;
    for (const auto& r : pImpl->history) {
        ++byType[toString(r.type)];
        ++byServer[r.serverName];
    }
    stats.byType.assign(byType.begin(), byType.end());
    stats.byServer.assign(byServer.begin(), byServer.end());
    stats.activeProgress = pImpl->progress.size();
    stats.registeredHandlers = pImpl->handlers.size();
    return stats;
}

} // namespace mcprt
