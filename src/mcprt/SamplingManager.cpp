//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SamplingManager.cpp
// Purpose: Sampling request validation, concurrency cap, timeout race and result validation
//==========================================================================================================

#include "mcprt/SamplingManager.h"

#include <atomic>
#include <map>
#include <mutex>
#include <random>
#include <shared_mutex>
#include <thread>
#include <unordered_map>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcprt/errors/Errors.h"
#include "mcprt/validation/Validators.h"

namespace mcprt {

using namespace std::chrono;

namespace {
// How often a waiter re-checks whether its request was already settled elsewhere.
constexpr milliseconds kWaiterPoll{20};

std::future<CreateMessageResult> failed(std::exception_ptr ex) {
    std::promise<CreateMessageResult> p;
    p.set_exception(ex);
    return p.get_future();
}

std::string describe(std::exception_ptr ex) {
    try {
        std::rethrow_exception(ex);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}
} // namespace

struct SamplingManager::Impl {
    struct Pending {
        SamplingRequestInfo info;
        std::promise<CreateMessageResult> promise;
        std::shared_ptr<net::steady_timer> timer;
        std::stop_source stopSource;
        steady_clock::time_point started;
    };

    EventLoop& loop;
    SamplingOptions options;
    // Guards `owner` against destruction while a waiter thread or timer is settling a request.
    std::shared_mutex lifeMutex;
    SamplingManager* owner;
    mutable std::mutex mutex;
    std::unordered_map<std::string, SamplingCallback> callbacks;
    std::unordered_map<std::string, Pending> pending;
    // Threads currently waiting on a host callback's future.
    std::shared_ptr<std::atomic<std::size_t>> waiters = std::make_shared<std::atomic<std::size_t>>(0);
    std::mt19937_64 rng{std::random_device{}()};

    Impl(EventLoop& l, SamplingOptions o, SamplingManager* self) : loop(l), options(o), owner(self) {}

    std::optional<Pending> take(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = pending.find(id);
        if (it == pending.end()) return std::nullopt;
        Pending p = std::move(it->second);
        pending.erase(it);
        return p;
    }

    // Runs fn(owner) unless the manager is being destroyed.
    template <typename F>
    static void withOwner(const std::weak_ptr<Impl>& weak, F&& fn) {
        auto impl = weak.lock();
        if (!impl) return;
        std::shared_lock<std::shared_mutex> alive(impl->lifeMutex);
        if (impl->owner) fn(*impl->owner);
    }
};

SamplingManager::SamplingManager(EventLoop& loop, SamplingOptions options) {
    FUNC_SCOPE();
    if (auto envMs = GetEnvMilliseconds("MCPRT_SAMPLING_TIMEOUT_MS")) {
        options.defaultTimeout = milliseconds(*envMs);
    }
    pImpl = std::make_shared<Impl>(loop, options, this);
}

SamplingManager::~SamplingManager() {
    FUNC_SCOPE();
    Cleanup();
    std::unique_lock<std::shared_mutex> lock(pImpl->lifeMutex);
    pImpl->owner = nullptr;
}

void SamplingManager::RegisterCallback(const std::string& serverName, SamplingCallback callback) {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->callbacks[serverName] = std::move(callback);
    }
    LOG_DEBUG("Sampling callback registered for {}", serverName);
    SamplingEvent ev;
    ev.type = "callback:registered";
    ev.serverName = serverName;
    Emit(ev);
}

bool SamplingManager::UnregisterCallback(const std::string& serverName) {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->callbacks.erase(serverName) == 0) return false;
    }
    SamplingEvent ev;
    ev.type = "callback:unregistered";
    ev.serverName = serverName;
    Emit(ev);
    return true;
}

bool SamplingManager::HasCallback(const std::string& serverName) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->callbacks.count(serverName) != 0;
}

std::future<CreateMessageResult> SamplingManager::HandleSamplingRequest(const std::string& serverName,
                                                                        const JSONValue& params,
                                                                        std::optional<milliseconds> timeout) {
    FUNC_SCOPE();
    SamplingCallback callback;
    std::string requestId;
    std::future<CreateMessageResult> fut;
    std::stop_token stopToken;
    CreateMessageParams typed;
    milliseconds effectiveTimeout{0};
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        auto cb = pImpl->callbacks.find(serverName);
        if (cb == pImpl->callbacks.end()) {
            return failed(std::make_exception_ptr(
                errors::ProtocolError("No sampling callback registered for server: " + serverName)));
        }
        if (pImpl->pending.size() >= pImpl->options.maxConcurrentRequests) {
            return failed(std::make_exception_ptr(errors::ProtocolError(
                "Too many concurrent sampling requests (max " + std::to_string(pImpl->options.maxConcurrentRequests) + ")")));
        }
        if (auto err = validation::validateCreateMessageParamsJson(params)) {
            LOG_WARN("Rejected sampling request from {}: {}", serverName, *err);
            return failed(std::make_exception_ptr(errors::ValidationError(*err)));
        }
        callback = cb->second;
        typed = CreateMessageParamsFromJSON(params);

        auto ms = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
        do {
            requestId = serverName + "-" + std::to_string(ms) + "-" + std::to_string(pImpl->rng() % 1000000);
        } while (pImpl->pending.count(requestId) != 0);

        Impl::Pending p;
        p.info = SamplingRequestInfo{requestId, serverName, typed, system_clock::now()};
        p.started = steady_clock::now();
        stopToken = p.stopSource.get_token();
        fut = p.promise.get_future();
        pImpl->pending.emplace(requestId, std::move(p));
        effectiveTimeout = timeout.value_or(pImpl->options.defaultTimeout);
    }

    LOG_INFO("Sampling request {} from {} ({} message(s), maxTokens={})", requestId, serverName,
             typed.messages.size(), typed.maxTokens);
    SamplingEvent start;
    start.type = "request:start";
    start.serverName = serverName;
    start.requestId = requestId;
    Emit(start);

    std::weak_ptr<Impl> weak = pImpl;
    auto timer = pImpl->loop.ScheduleTimer(effectiveTimeout, [weak, requestId, effectiveTimeout]() {
        Impl::withOwner(weak, [&](SamplingManager& self) {
            self.settleWithError(requestId, std::make_exception_ptr(errors::TimeoutError(
                "Sampling request timed out after " + std::to_string(effectiveTimeout.count()) + "ms")),
                "request:error");
        });
    });
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        auto it = pImpl->pending.find(requestId);
        if (it != pImpl->pending.end()) it->second.timer = timer; else pImpl->loop.CancelTimer(timer);
    }

    std::future<CreateMessageResult> cbFuture;
    try {
        cbFuture = callback(typed, stopToken);
    } catch (const std::exception& e) {
        LOG_ERROR("Sampling callback for {} threw: {}", serverName, e.what());
        settleWithError(requestId, std::current_exception(), "request:error");
        return fut;
    }
    if (!cbFuture.valid()) {
        settleWithError(requestId, std::make_exception_ptr(errors::ProtocolError(
            "Sampling callback for " + serverName + " returned no future")), "request:error");
        return fut;
    }

    // Waits for the host outside the event loop; whichever of result/timeout/cancel takes the pending
    // entry first settles the caller. Once the request is settled by a timeout, a cancel or Cleanup()
    // its stop token fires and the waiter leaves without waiting for the host any longer.
    auto waiters = pImpl->waiters;
    ++*waiters;
    std::thread([weak, waiters, requestId, stopToken, cbFuture = std::move(cbFuture)]() mutable {
        while (cbFuture.wait_for(kWaiterPoll) != std::future_status::ready) {
            if (stopToken.stop_requested() || weak.expired()) {
                LOG_DEBUG("Sampling request {} settled; no longer waiting for its callback", requestId);
                --*waiters;
                return;
            }
        }
        std::exception_ptr error;
        std::optional<CreateMessageResult> result;
        try {
            result = cbFuture.get();
        } catch (...) {
            error = std::current_exception();
        }
        Impl::withOwner(weak, [&](SamplingManager& self) {
            if (error) {
                self.settleWithError(requestId, error, "request:error");
            } else {
                self.settleWithResult(requestId, std::move(*result));
            }
        });
        --*waiters;
    }).detach();
    return fut;
}

void SamplingManager::settleWithResult(const std::string& requestId, CreateMessageResult result) {
    auto p = pImpl->take(requestId);
    if (!p) {
        LOG_DEBUG("Discarding late sampling result for {}", requestId);
        return;
    }
    pImpl->loop.CancelTimer(p->timer);
    auto elapsed = duration_cast<milliseconds>(steady_clock::now() - p->started);
    SamplingEvent ev;
    ev.serverName = p->info.serverName;
    ev.requestId = requestId;
    ev.duration = elapsed;
    if (auto err = validation::validateCreateMessageResult(result)) {
        LOG_ERROR("Sampling callback for {} returned an invalid result: {}", p->info.serverName, *err);
        p->promise.set_exception(std::make_exception_ptr(errors::ValidationError(*err)));
        ev.type = "request:error";
        ev.error = *err;
        Emit(ev);
        return;
    }
    LOG_INFO("Sampling request {} completed in {}ms (model={})", requestId, elapsed.count(), result.model);
    p->promise.set_value(std::move(result));
    ev.type = "request:complete";
    Emit(ev);
}

void SamplingManager::settleWithError(const std::string& requestId, std::exception_ptr error, const char* eventType) {
    auto p = pImpl->take(requestId);
    if (!p) return;
    pImpl->loop.CancelTimer(p->timer);
    p->stopSource.request_stop();
    const std::string message = describe(error);
    LOG_WARN("Sampling request {} from {} failed: {}", requestId, p->info.serverName, message);
    p->promise.set_exception(error);
    SamplingEvent ev;
    ev.type = eventType;
    ev.serverName = p->info.serverName;
    ev.requestId = requestId;
    ev.duration = duration_cast<milliseconds>(steady_clock::now() - p->started);
    ev.error = message;
    Emit(ev);
}

bool SamplingManager::CancelRequest(const std::string& requestId) {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->pending.count(requestId) == 0) return false;
    }
    settleWithError(requestId, std::make_exception_ptr(errors::CancellationError(
        "Sampling request " + requestId + " cancelled", errors::CancellationReason::UserCancelled)),
        "request:cancelled");
    return true;
}

std::size_t SamplingManager::CancelServerRequests(const std::string& serverName) {
    std::size_t n = 0;
    for (const auto& info : GetServerPendingRequests(serverName)) {
        if (CancelRequest(info.id)) ++n;
    }
    return n;
}

std::size_t SamplingManager::GetPendingCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->pending.size();
}

std::vector<SamplingRequestInfo> SamplingManager::GetServerPendingRequests(const std::string& serverName) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    std::vector<SamplingRequestInfo> out;
    for (const auto& [id, p] : pImpl->pending) {
        if (p.info.serverName == serverName) out.push_back(p.info);
    }
    return out;
}

SamplingStats SamplingManager::GetStats() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    SamplingStats stats;
    stats.registeredCallbacks = pImpl->callbacks.size();
    stats.pendingRequests = pImpl->pending.size();
    stats.maxConcurrentRequests = pImpl->options.maxConcurrentRequests;
    stats.callbackWaiters = pImpl->waiters->load();
    std::map<std::string, std::size_t> byServer;
    for (const auto& [id, p] : pImpl->pending) ++byServer[p.info.serverName];
    stats.byServer.assign(byServer.begin(), byServer.end());
    return stats;
}

void SamplingManager::SetMaxConcurrentRequests(std::size_t max) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->options.maxConcurrentRequests = max;
}

void SamplingManager::SetDefaultTimeout(milliseconds timeout) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->options.defaultTimeout = timeout;
}

void SamplingManager::Cleanup() {
    FUNC_SCOPE();
    std::unordered_map<std::string, Impl::Pending> drained;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        drained.swap(pImpl->pending);
        pImpl->callbacks.clear();
    }
    for (auto& [id, p] : drained) {
        pImpl->loop.CancelTimer(p.timer);
        p.stopSource.request_stop();
        p.promise.set_exception(std::make_exception_ptr(errors::CancellationError(
            "Sampling manager cleanup - request cancelled", errors::CancellationReason::Shutdown)));
    }
}

} // namespace mcprt
