//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CancellationManager.cpp
// Purpose: Cancellation tokens and the cancellable request registry
//==========================================================================================================

#include "mcprt/CancellationManager.h"

#include <algorithm>
#include <atomic>
#include <map>
#include <unordered_map>

#include "logging/Logger.h"

namespace mcprt {

using namespace std::chrono;

////////////////////////////////////////// CancellationToken //////////////////////////////////////////

std::shared_ptr<CancellationToken> CancellationToken::Create() {
    return std::shared_ptr<CancellationToken>(new CancellationToken());
}

bool CancellationToken::IsCancelled() const {
    std::lock_guard<std::mutex> lock(mutex);
    return cancelled;
}

std::optional<CancellationReason> CancellationToken::Reason() const {
    std::lock_guard<std::mutex> lock(mutex);
    return reason;
}

std::optional<system_clock::time_point> CancellationToken::Timestamp() const {
    std::lock_guard<std::mutex> lock(mutex);
    return timestamp;
}

bool CancellationToken::Cancel(CancellationReason why) {
    std::vector<Callback> toRun;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (cancelled) {
            return false;
        }
        cancelled = true;
        reason = why;
        timestamp = system_clock::now();
        toRun.swap(callbacks);
    }
    for (auto& cb : toRun) {
        try {
            cb(why);
        } catch (const std::exception& e) {
            LOG_ERROR("Cancellation callback threw: {}", e.what());
        } catch (...) {
            LOG_ERROR("Cancellation callback threw an unknown exception");
        }
    }
    return true;
}

void CancellationToken::OnCancelled(Callback callback) {
    CancellationReason why;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!cancelled) {
            callbacks.push_back(std::move(callback));
            return;
        }
        why = *reason;
    }
    callback(why);
}

void CancellationToken::ThrowIfCancelled() const {
    std::lock_guard<std::mutex> lock(mutex);
    if (cancelled) {
        throw errors::CancellationError(std::string("Operation cancelled: ") + errors::toString(*reason), *reason);
    }
}

std::shared_ptr<CancellationToken> CombineTokens(const std::vector<std::shared_ptr<CancellationToken>>& tokens) {
    auto combined = CancellationToken::Create();
    std::weak_ptr<CancellationToken> weak = combined;
    for (const auto& t : tokens) {
        if (!t) continue;
        t->OnCancelled([weak](CancellationReason why) {
            if (auto c = weak.lock()) c->Cancel(why);
        });
    }
    return combined;
}

////////////////////////////////////////// CancellationManager //////////////////////////////////////////

struct CancellationManager::Impl {
    struct Entry {
        uint64_t seq = 0;
        JSONRPCId id;
        std::string serverName;
        std::string method;
        steady_clock::time_point startTime;
        std::optional<milliseconds> timeout;
        std::optional<std::stop_source> abortSource;
        std::function<void(CancellationReason)> onCancel;
        std::shared_ptr<CancellationToken> token;
        std::shared_ptr<net::steady_timer> timer;
    };

    EventLoop& loop;
    std::atomic<CancellationManager*> owner;
    mutable std::mutex mutex;
    std::unordered_map<std::string, Entry> requests;
    uint64_t nextSeq{0};

    Impl(EventLoop& l, CancellationManager* o) : loop(l), owner(o) {}

    static CancellableRequestInfo info(const Entry& e) {
        return CancellableRequestInfo{e.id, e.serverName, e.method, e.startTime, e.timeout, e.token};
    }

    bool isCurrent(const std::string& key, uint64_t seq) const {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = requests.find(key);
        return it != requests.end() && it->second.seq == seq;
    }
};

CancellationManager::CancellationManager(EventLoop& loop)
    : pImpl(std::make_shared<Impl>(loop, this)) {
    FUNC_SCOPE();
}

CancellationManager::~CancellationManager() {
    FUNC_SCOPE();
    pImpl->owner = nullptr;
    Cleanup();
    pImpl->loop.Sync();
}

std::shared_ptr<CancellationToken> CancellationManager::RegisterRequest(const JSONRPCId& id, const std::string& serverName,
                                                                        const std::string& method,
                                                                        CancellableRequestOptions options) {
    FUNC_SCOPE();
    const std::string key = IdKey(id);
    auto token = CancellationToken::Create();
    uint64_t seq = 0;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->requests.count(key) != 0) {
            throw errors::ValidationError("Request already registered: " + IdToString(id));
        }
        Impl::Entry e;
        e.seq = seq = ++pImpl->nextSeq;
        e.id = id;
        e.serverName = serverName;
        e.method = method;
        e.startTime = steady_clock::now();
        e.timeout = options.timeout;
        e.abortSource = std::move(options.abortSource);
        e.onCancel = std::move(options.onCancel);
        e.token = token;
        pImpl->requests.emplace(key, std::move(e));
    }

    std::weak_ptr<Impl> weak = pImpl;
    if (options.timeout) {
        auto timer = pImpl->loop.ScheduleTimer(*options.timeout, [weak, key, seq, id]() {
            auto impl = weak.lock();
            if (!impl || !impl->isCurrent(key, seq)) return;
            if (CancellationManager* self = impl->owner.load()) {
                LOG_DEBUG("Request {} exceeded its timeout; auto-cancelling", IdToString(id));
                self->CancelRequest(id, CancellationReason::Timeout);
            }
        });
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        auto it = pImpl->requests.find(key);
        if (it != pImpl->requests.end() && it->second.seq == seq) {
            it->second.timer = timer;
        } else {
            pImpl->loop.CancelTimer(timer);
        }
    }

    token->OnCancelled([weak, key, seq, id](CancellationReason why) {
        auto impl = weak.lock();
        if (!impl || !impl->isCurrent(key, seq)) return;
        if (CancellationManager* self = impl->owner.load()) {
            self->CancelRequest(id, why);
        }
    });

    LOG_DEBUG("Registered cancellable request {} ({}) for {}", IdToString(id), method, serverName);
    CancellationEvent ev;
    ev.type = "request:registered";
    ev.requestId = id;
    ev.serverName = serverName;
    ev.method = method;
    Emit(ev);
    return token;
}

bool CancellationManager::UnregisterRequest(const JSONRPCId& id) {
    Impl::Entry e;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        auto it = pImpl->requests.find(IdKey(id));
        if (it == pImpl->requests.end()) return false;
        e = std::move(it->second);
        pImpl->requests.erase(it);
    }
    pImpl->loop.CancelTimer(e.timer);
    CancellationEvent ev;
    ev.type = "request:unregistered";
    ev.requestId = id;
    ev.serverName = e.serverName;
    ev.method = e.method;
    ev.duration = duration_cast<milliseconds>(steady_clock::now() - e.startTime);
    Emit(ev);
    return true;
}

std::optional<CancellationResult> CancellationManager::CancelRequest(const JSONRPCId& id, CancellationReason reason) {
    FUNC_SCOPE();
    Impl::Entry e;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        auto it = pImpl->requests.find(IdKey(id));
        if (it == pImpl->requests.end()) {
            return std::nullopt;
        }
        e = std::move(it->second);
        pImpl->requests.erase(it);
    }
    pImpl->loop.CancelTimer(e.timer);
    if (e.abortSource) {
        e.abortSource->request_stop();
    }
    if (e.onCancel) {
        std::optional<std::string> failure;
        try {
            e.onCancel(reason);
        } catch (const std::exception& ex) {
            failure = ex.what();
        } catch (...) {
            failure = "unknown exception";
        }
        if (failure) {
            LOG_WARN("onCancel for request {} threw: {}", IdToString(id), *failure);
            CancellationEvent err;
            err.type = "cancel:error";
            err.requestId = id;
            err.serverName = e.serverName;
            err.method = e.method;
            err.reason = reason;
            err.error = *failure;
            Emit(err);
        }
    }
    // Re-enters through the token callback, which finds no entry and returns.
    e.token->Cancel(reason);

    CancellationResult result;
    result.success = true;
    result.reason = reason;
    result.requestId = id;
    result.serverName = e.serverName;
    result.duration = duration_cast<milliseconds>(steady_clock::now() - e.startTime);
    LOG_INFO("Cancelled request {} ({}) on {}: {} after {}ms", IdToString(id), e.method, e.serverName,
             errors::toString(reason), result.duration.count());

    CancellationEvent ev;
    ev.type = "request:cancelled";
    ev.requestId = id;
    ev.serverName = e.serverName;
    ev.method = e.method;
    ev.reason = reason;
    ev.duration = result.duration;
    Emit(ev);
    return result;
}

std::vector<CancellationResult> CancellationManager::CancelServerRequests(const std::string& serverName,
                                                                          CancellationReason reason) {
    std::vector<JSONRPCId> ids;
    for (const auto& r : GetServerRequests(serverName)) ids.push_back(r.id);
    std::vector<CancellationResult> results;
    for (const auto& id : ids) {
        if (auto r = CancelRequest(id, reason)) results.push_back(std::move(*r));
    }
    CancellationEvent ev;
    ev.type = "server:cancelled";
    ev.serverName = serverName;
    ev.reason = reason;
    ev.count = results.size();
    Emit(ev);
    return results;
}

std::vector<CancellationResult> CancellationManager::CancelAll(CancellationReason reason) {
    std::vector<JSONRPCId> ids;
    for (const auto& r : GetAllRequests()) ids.push_back(r.id);
    std::vector<CancellationResult> results;
    for (const auto& id : ids) {
        if (auto r = CancelRequest(id, reason)) results.push_back(std::move(*r));
    }
    CancellationEvent ev;
    ev.type = "all:cancelled";
    ev.reason = reason;
    ev.count = results.size();
    Emit(ev);
    return results;
}

bool CancellationManager::HasRequest(const JSONRPCId& id) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->requests.count(IdKey(id)) != 0;
}

std::optional<CancellableRequestInfo> CancellationManager::GetRequest(const JSONRPCId& id) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->requests.find(IdKey(id));
    if (it == pImpl->requests.end()) return std::nullopt;
    return Impl::info(it->second);
}

std::vector<CancellableRequestInfo> CancellationManager::GetAllRequests() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    std::vector<CancellableRequestInfo> out;
    for (const auto& [key, e] : pImpl->requests) out.push_back(Impl::info(e));
    return out;
}

std::vector<CancellableRequestInfo> CancellationManager::GetServerRequests(const std::string& serverName) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    std::vector<CancellableRequestInfo> out;
    for (const auto& [key, e] : pImpl->requests) {
        if (e.serverName == serverName) out.push_back(Impl::info(e));
    }
    return out;
}

CancellationStats CancellationManager::GetStats() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    CancellationStats stats;
    stats.totalActive = pImpl->requests.size();
    std::map<std::string, std::size_t> byServer;
    std::map<std::string, std::size_t> byMethod;
    auto now = steady_clock::now();
    for (const auto& [key, e] : pImpl->requests) {
        ++byServer[e.serverName];
        ++byMethod[e.method];
        auto age = duration_cast<milliseconds>(now - e.startTime);
        if (!stats.oldestRequestAge || age > *stats.oldestRequestAge) stats.oldestRequestAge = age;
    }
    stats.byServer.assign(byServer.begin(), byServer.end());
    stats.byMethod.assign(byMethod.begin(), byMethod.end());
    return stats;
}

std::vector<std::pair<std::string, milliseconds>> CancellationManager::GetRequestDurations() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    std::vector<std::pair<std::string, milliseconds>> out;
    auto now = steady_clock::now();
    for (const auto& [key, e] : pImpl->requests) {
        out.emplace_back(IdToString(e.id), duration_cast<milliseconds>(now - e.startTime));
    }
    return out;
}

std::vector<CancellableRequestInfo> CancellationManager::FindLongRunningRequests(milliseconds threshold) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    std::vector<CancellableRequestInfo> out;
    auto now = steady_clock::now();
    for (const auto& [key, e] : pImpl->requests) {
        if (now - e.startTime > threshold) out.push_back(Impl::info(e));
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.startTime < b.startTime; });
    return out;
}

JSONValue CancellationManager::CreateCancellationNotification(const JSONRPCId& requestId, std::optional<std::string> reason) {
    JSONValue::Object params;
    params["requestId"] = std::make_shared<JSONValue>(IdToJSON(requestId));
    if (reason) params["reason"] = std::make_shared<JSONValue>(*reason);
    return JSONValue{std::move(params)};
}

void CancellationManager::Cleanup() {
    FUNC_SCOPE();
    std::unordered_map<std::string, Impl::Entry> drained;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        drained.swap(pImpl->requests);
    }
    for (auto& [key, e] : drained) {
        pImpl->loop.CancelTimer(e.timer);
    }
}

} // namespace mcprt
