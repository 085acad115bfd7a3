//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Runtime.cpp
// Purpose: Connection handling, inbound dispatch and lifecycle reactions for the client runtime
//==========================================================================================================

#include "mcprt/Runtime.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <format>
#include <functional>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <thread>

#include "logging/Logger.h"
#include "mcprt/ProcessTransport.hpp"
#include "mcprt/ProtocolEngine.h"
#include "mcprt/async/FutureAwaitable.h"
#include "mcprt/async/Task.h"
#include "mcprt/errors/Errors.h"

namespace mcprt {

using errors::CancellationReason;

namespace {

template <typename T>
std::future<T> failedFuture(std::exception_ptr ex) {
    std::promise<T> p;
    p.set_exception(ex);
    return p.get_future();
}

std::string errorPayload(const JSONRPCId& id, int code, const std::string& message) {
    return CreateErrorResponse(id, code, message)->Serialize();
}

JSONValue emptyObject() {
    return JSONValue{JSONValue::Object{}};
}

////////////////////////////////////////// Coroutine helpers //////////////////////////////////////////

async::Task<CallToolResult> coCallToolResult(std::future<JSONValue> fut) {
    JSONValue result = co_await async::makeFutureAwaitable(std::move(fut));
    co_return CallToolResultFromJSON(result);
}

async::Task<std::vector<Tool>> coTools(std::future<JSONValue> fut) {
    JSONValue result = co_await async::makeFutureAwaitable(std::move(fut));
    std::vector<Tool> tools;
    const JSONValue* arr = FindMember(result, "tools");
    if (arr && arr->IsArray()) {
        for (const auto& item : std::get<JSONValue::Array>(arr->value)) {
            if (item && item->IsObject()) tools.push_back(ToolFromJSON(*item));
        }
    }
    co_return tools;
}

async::Task<void> coDiscard(std::future<JSONValue> fut) {
    (void)co_await async::makeFutureAwaitable(std::move(fut));
    co_return;
}

} // namespace

//==========================================================================================================
// Runtime::Impl
// Purpose: Shared state. Lifecycle listeners, receive pumps and cancellation callbacks hold a raw Impl*;
//          all of them are torn down in shutdown() before the managers go away. Coroutines that can
//          outlive the Runtime object hold a shared_ptr.
//==========================================================================================================
struct Runtime::Impl {
    struct Connection {
        std::string name;
        std::unique_ptr<ProtocolEngine> engine;
        mutable std::mutex mutex;  // transport, pump, serverInfo, clientInfo
        Implementation clientInfo;
        std::shared_ptr<ProcessTransport> transport;
        std::thread pump;
        std::optional<InitializeResult> serverInfo;
        std::atomic<bool> ready{false};   // handshake done, requests allowed
        std::atomic<bool> busy{false};    // a handshake is in progress
        std::atomic<bool> wanted{false};  // re-initialize after a restart
    };
    using ConnectionPtr = std::shared_ptr<Connection>;

    RuntimeConfig config;
    EventLoop loop;
    LifecycleManager lifecycle;
    CancellationManager cancellation;
    NotificationRouter router;
    SamplingManager sampling;
    ServerLogManager logs;

    mutable std::shared_mutex lifeMutex;
    Runtime* owner;

    mutable std::mutex mutex;
    std::map<std::string, ConnectionPtr> connections;
    std::vector<std::string> serverNames;
    RootsManager roots;
    std::atomic<uint64_t> nextRequestId{0};
    std::vector<LifecycleManager::ListenerId> listeners;
    std::vector<RootsManager::ListenerId> rootsListeners;
    std::atomic<bool> shutDown{false};

    std::mutex workMutex;
    std::condition_variable workCv;
    std::deque<std::function<void()>> work;
    bool workStopping = false;
    std::thread worker;

    Impl(Runtime* rt, RuntimeConfig cfg)
        : config(std::move(cfg)),
          lifecycle(loop, config.lifecycle),
          cancellation(loop),
          router(config.maxNotificationHistory),
          sampling(loop, config.sampling),
          logs(config.logging.serverLogs),
          owner(rt),
          roots(config.rootsOptions, config.roots) {}

    ~Impl() {
        stopWorker();
    }

    void start() {
        for (const auto& [name, level] : config.logging.serverLevels) {
            logs.SetServerLevel(name, level);
        }
        for (const auto& [name, server] : config.servers) {
            registerServer(name, server);
        }
        for (const char* type : {"server:stopping", "server:stopped", "server:crashed", "server:error"}) {
            listeners.push_back(lifecycle.On(type, [this, type](const LifecycleEvent& ev) {
                onServerDown(ev.serverName, std::string(type).substr(7));
            }));
        }
        listeners.push_back(lifecycle.On("server:started", [this](const LifecycleEvent& ev) {
            onServerStarted(ev.serverName);
        }));
        // Runtime::SetRoots announces "roots:set" itself so it can hand back the broadcast future.
        for (const char* type : {"root:added", "root:removed", "root:updated", "roots:cleared"}) {
            rootsListeners.push_back(roots.On(type, [this](const RootsEvent&) {
                (void)broadcastRootsChanged();
            }));
        }
        worker = std::thread([this]() { workerLoop(); });
        LOG_INFO("Runtime started with {} configured server(s)", config.servers.size());
    }

    void emit(const RuntimeEvent& ev) {
        std::shared_lock<std::shared_mutex> lock(lifeMutex);
        if (owner) owner->emitEvent(ev);
    }

    void registerServer(const std::string& name, const ServerConfig& server) {
        lifecycle.RegisterServer(name, server);
        std::lock_guard<std::mutex> lock(mutex);
        if (std::find(serverNames.begin(), serverNames.end(), name) == serverNames.end()) {
            serverNames.push_back(name);
        }
    }

    ConnectionPtr find(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = connections.find(name);
        return it == connections.end() ? nullptr : it->second;
    }

    ConnectionPtr connectionFor(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex);
        auto& slot = connections[name];
        if (!slot) {
            slot = std::make_shared<Connection>();
            slot->name = name;
            slot->engine = std::make_unique<ProtocolEngine>(loop, config.protocol);
            slot->clientInfo = config.clientInfo;
        }
        return slot;
    }

    static std::shared_ptr<ProcessTransport> transportOf(const Connection& conn) {
        std::lock_guard<std::mutex> lock(conn.mutex);
        return conn.transport;
    }

    ////////////////////////////////////////// Worker //////////////////////////////////////////

    void workerLoop() {
        for (;;) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lock(workMutex);
                workCv.wait(lock, [this]() { return workStopping || !work.empty(); });
                if (work.empty()) return;
                job = std::move(work.front());
                work.pop_front();
            }
            try {
                job();
            } catch (const std::exception& e) {
                LOG_ERROR("Runtime worker job failed: {}", e.what());
            }
        }
    }

    void post(std::function<void()> job) {
        {
            std::lock_guard<std::mutex> lock(workMutex);
            if (workStopping) {
                LOG_DEBUG("Runtime worker stopped; dropping job");
                return;
            }
            work.push_back(std::move(job));
        }
        workCv.notify_one();
    }

    template <typename T>
    std::future<T> runOnWorker(std::function<T()> fn) {
        auto task = std::make_shared<std::packaged_task<T()>>(std::move(fn));
        auto fut = task->get_future();
        {
            std::lock_guard<std::mutex> lock(workMutex);
            if (workStopping) {
                return failedFuture<T>(std::make_exception_ptr(errors::TransportError("Runtime is shut down")));
            }
            work.push_back([task]() { (*task)(); });
        }
        workCv.notify_one();
        return fut;
    }

    void stopWorker() {
        {
            std::lock_guard<std::mutex> lock(workMutex);
            workStopping = true;
        }
        workCv.notify_all();
        if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
            worker.join();
        }
    }

    ////////////////////////////////////////// Handshake //////////////////////////////////////////

    // Blocks on transport writes; never called on the event loop thread.
    InitializeResult handshake(const ConnectionPtr& conn) {
        FUNC_SCOPE();
        if (shutDown.load()) {
            throw errors::TransportError("Runtime is shut down");
        }
        detachTransport(*conn);

        auto transport = std::make_shared<ProcessTransport>(lifecycle, conn->name);
        transport->Start().get();
        Implementation clientInfo;
        {
            std::lock_guard<std::mutex> lock(conn->mutex);
            conn->transport = transport;
            conn->pump = std::thread([this, conn, transport]() { pumpLoop(conn, transport); });
            clientInfo = conn->clientInfo;
        }

        try {
            ClientCapabilities caps;
            caps.roots = true;
            caps.rootsListChanged = true;
            caps.sampling = true;
            InitializeResult result =
                conn->engine->Initialize(*transport, ProtocolEngine::CreateInitializeParams(clientInfo, caps)).get();
            conn->engine->Initialized(*transport).get();
            {
                std::lock_guard<std::mutex> lock(conn->mutex);
                conn->serverInfo = result;
            }
            conn->ready = true;
            LOG_INFO("Connected to {} ({} {}), protocol {}", conn->name, result.serverInfo.name,
                     result.serverInfo.version, result.protocolVersion);

            if (result.capabilities.logging) {
                try {
                    conn->engine->SetLoggingLevel(*transport, logs.GetServerLevel(conn->name)).get();
                } catch (const std::exception& e) {
                    LOG_WARN("logging/setLevel for {} failed: {}", conn->name, e.what());
                }
            }
            return result;
        } catch (const std::exception& e) {
            LOG_ERROR("Initialize handshake with {} failed: {}", conn->name, e.what());
            conn->ready = false;
            detachTransport(*conn);
            throw;
        }
    }

    static void detachTransport(Connection& conn) {
        std::shared_ptr<ProcessTransport> transport;
        std::thread pump;
        {
            std::lock_guard<std::mutex> lock(conn.mutex);
            transport = std::move(conn.transport);
            pump = std::move(conn.pump);
        }
        if (transport) {
            transport->Close().get();
        }
        if (pump.joinable()) {
            if (pump.get_id() == std::this_thread::get_id()) {
                pump.detach();
            } else {
                pump.join();
            }
        }
    }

    static async::Task<InitializeResult> connect(std::shared_ptr<Impl> self, ConnectionPtr conn) {
        if (conn->ready.load()) {
            std::optional<InitializeResult> info;
            {
                std::lock_guard<std::mutex> lock(conn->mutex);
                info = conn->serverInfo;
            }
            if (info) co_return *info;
        }
        if (conn->busy.exchange(true)) {
            throw errors::ProtocolError("Connection to " + conn->name + " is already in progress");
        }
        conn->wanted = true;
        try {
            co_await async::makeFutureAwaitable(self->lifecycle.StartWithDependencies(conn->name));
            InitializeResult result = self->handshake(conn);
            conn->busy = false;
            self->emit(RuntimeEvent{"server:connected", conn->name, "", result});
            co_return result;
        } catch (const std::exception&) {
            conn->wanted = false;
            conn->busy = false;
            throw;
        }
    }

    static async::Task<void> connectAll(std::shared_ptr<Impl> self, std::vector<std::string> names) {
        std::vector<std::string> failures;
        for (const auto& name : names) {
            try {
                (void)co_await async::makeFutureAwaitable(connect(self, self->connectionFor(name)).toFuture());
            } catch (const std::exception& e) {
                failures.push_back(name + ": " + e.what());
            }
        }
        if (!failures.empty()) {
            std::string joined;
            for (std::size_t i = 0; i < failures.size(); ++i) {
                if (i > 0) joined += ", ";
                joined += failures[i];
            }
            throw errors::ProtocolError("Failed to connect some servers: " + joined);
        }
        co_return;
    }

    void reconnect(const ConnectionPtr& conn) {
        if (shutDown.load() || !conn->wanted.load() || conn->ready.load()) return;
        if (conn->busy.exchange(true)) return;
        LOG_INFO("Server {} restarted; re-initializing", conn->name);
        try {
            InitializeResult result = handshake(conn);
            emit(RuntimeEvent{"server:connected", conn->name, "restart", result});
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to re-initialize {}: {}", conn->name, e.what());
        }
        conn->busy = false;
    }

    void disconnect(const ConnectionPtr& conn, const std::string& reason) {
        conn->wanted = false;
        const bool wasReady = conn->ready.exchange(false);
        cancellation.CancelServerRequests(conn->name, CancellationReason::Shutdown);
        sampling.CancelServerRequests(conn->name);
        conn->engine->Cleanup();
        detachTransport(*conn);
        if (wasReady) {
            LOG_INFO("Disconnected from {} ({})", conn->name, reason);
            emit(RuntimeEvent{"server:disconnected", conn->name, reason, std::nullopt});
        }
    }

    ////////////////////////////////////////// Lifecycle reactions (loop thread) //////////////////////////////////////////

    void onServerDown(const std::string& name, const std::string& why) {
        auto conn = find(name);
        if (!conn) return;
        const bool wasReady = conn->ready.exchange(false);
        if (!wasReady && !conn->busy.load()) return;
        LOG_INFO("Server {} is {}; failing its in-flight requests", name, why);
        cancellation.CancelServerRequests(name, CancellationReason::Shutdown);
        sampling.CancelServerRequests(name);
        conn->engine->Cleanup();
        post([conn]() { detachTransport(*conn); });
        if (wasReady) {
            emit(RuntimeEvent{"server:disconnected", name, why, std::nullopt});
        }
    }

    void onServerStarted(const std::string& name) {
        auto conn = find(name);
        if (!conn || !conn->wanted.load() || conn->ready.load() || conn->busy.load()) return;
        post([this, conn]() { reconnect(conn); });
    }

    ////////////////////////////////////////// Requests //////////////////////////////////////////

    void onRequestCancelled(const std::string& name, const JSONRPCId& id, CancellationReason reason) {
        auto conn = find(name);
        if (!conn) return;
        conn->engine->CancelPending(id, reason);
        if (reason == CancellationReason::ServerRequest || reason == CancellationReason::Shutdown) return;
        if (!conn->ready.load()) return;
        post([conn, id, reason]() {
            auto transport = transportOf(*conn);
            if (!transport || !conn->ready.load()) return;
            conn->engine->SendCancelledNotification(*transport, id, std::string(errors::toString(reason))).get();
        });
    }

    static async::Task<JSONValue> track(std::shared_ptr<Impl> self, JSONRPCId id, std::future<JSONValue> fut) {
        try {
            JSONValue result = co_await async::makeFutureAwaitable(std::move(fut));
            self->cancellation.UnregisterRequest(id);
            co_return result;
        } catch (const errors::TimeoutError&) {
            // Tell the server the request is abandoned; the caller still sees the timeout.
            self->cancellation.CancelRequest(id, CancellationReason::Timeout);
            throw;
        } catch (const std::exception&) {
            self->cancellation.UnregisterRequest(id);
            throw;
        }
    }

    ////////////////////////////////////////// Inbound //////////////////////////////////////////

    void pumpLoop(const ConnectionPtr& conn, const std::shared_ptr<ProcessTransport>& transport) {
        LOG_DEBUG("Receive pump for {} started", conn->name);
        for (;;) {
            std::string raw;
            try {
                raw = transport->Receive().get();
            } catch (const std::exception& e) {
                LOG_DEBUG("Receive pump for {} stopped: {}", conn->name, e.what());
                return;
            }
            dispatch(conn, transport, raw);
        }
    }

    void dispatch(const ConnectionPtr& conn, const std::shared_ptr<ProcessTransport>& transport,
                  const std::string& raw) {
        ParsedMessage message;
        try {
            message = ProtocolEngine::ParseMessage(raw);
        } catch (const errors::RuntimeError& e) {
            LOG_WARN("Dropping malformed message from {}: {}", conn->name, e.what());
            return;
        }
        if (auto* response = std::get_if<JSONRPCResponse>(&message)) {
            conn->engine->HandleResponse(*response);
        } else if (auto* notification = std::get_if<JSONRPCNotification>(&message)) {
            handleNotification(*conn, *notification);
        } else {
            handleServerRequest(conn, transport, std::get<JSONRPCRequest>(message));
        }
    }

    void handleNotification(const Connection& conn, const JSONRPCNotification& n) {
        if (n.method == Methods::Cancelled && n.params) {
            if (const JSONValue* rid = FindMember(*n.params, "requestId")) {
                // A null id never names an outstanding request.
                auto id = IdFromJSON(*rid);
                if (id && !std::holds_alternative<std::nullptr_t>(*id)) {
                    if (cancellation.CancelRequest(*id, CancellationReason::ServerRequest)) {
                        LOG_INFO("{} cancelled request {}", conn.name, IdToString(*id));
                    }
                }
            }
        } else if (n.method == Methods::Log) {
            logs.HandleLogNotification(conn.name, n.params);
        }
        router.HandleNotification(conn.name, n.method, n.params);
    }

    void handleServerRequest(const ConnectionPtr& conn, const std::shared_ptr<ProcessTransport>& transport,
                             const JSONRPCRequest& request) {
        LOG_DEBUG("<- server request {} from {} id={}", request.method, conn->name, IdToString(request.id));
        if (request.method == Methods::CreateMessage) {
            auto fut = sampling.HandleSamplingRequest(conn->name, request.params.value_or(emptyObject()));
            // Answered from the waiter thread so the pump keeps draining responses.
            (void)answerSampling(conn->name, transport, request.id, std::move(fut));
            return;
        }
        if (request.method == Methods::ListRoots) {
            JSONValue::Array arr;
            for (const auto& r : roots.GetRootsForProtocol()) arr.push_back(std::make_shared<JSONValue>(ToJSON(r)));
            JSONValue::Object result;
            result["roots"] = std::make_shared<JSONValue>(JSONValue{std::move(arr)});
            reply(conn->name, *transport, JSONRPCResponse(request.id, JSONValue{std::move(result)}).Serialize());
            return;
        }
        if (request.method == Methods::Ping) {
            reply(conn->name, *transport, JSONRPCResponse(request.id, emptyObject()).Serialize());
            return;
        }
        LOG_WARN("{} sent unsupported request {}", conn->name, request.method);
        reply(conn->name, *transport,
              errorPayload(request.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + request.method));
    }

    static async::Task<void> answerSampling(std::string serverName, std::shared_ptr<ProcessTransport> transport,
                                            JSONRPCId id, std::future<CreateMessageResult> fut) {
        std::string payload;
        try {
            CreateMessageResult result = co_await async::makeFutureAwaitable(std::move(fut));
            payload = JSONRPCResponse(id, ToJSON(result)).Serialize();
        } catch (const errors::ValidationError& e) {
            payload = errorPayload(id, JSONRPCErrorCodes::InvalidParams, e.what());
        } catch (const std::exception& e) {
            payload = errorPayload(id, JSONRPCErrorCodes::InternalError, e.what());
        }
        reply(serverName, *transport, payload);
    }

    static void reply(const std::string& serverName, ITransport& transport, const std::string& payload) {
        try {
            transport.Send(payload).get();
        } catch (const std::exception& e) {
            LOG_WARN("Failed to answer {}: {}", serverName, e.what());
        }
    }

    ////////////////////////////////////////// Roots //////////////////////////////////////////

    // Sends notifications/roots/list_changed to every ready connection from the worker thread.
    std::future<void> broadcastRootsChanged() {
        return runOnWorker<void>([this]() {
            std::vector<ConnectionPtr> conns;
            {
                std::lock_guard<std::mutex> lock(mutex);
                for (const auto& [name, conn] : connections) {
                    if (conn->ready.load()) conns.push_back(conn);
                }
            }
            for (const auto& conn : conns) {
                auto transport = transportOf(*conn);
                if (!transport) continue;
                try {
                    conn->engine->SendNotification(*transport, Methods::RootsListChanged).get();
                } catch (const std::exception& e) {
                    LOG_WARN("roots/list_changed to {} failed: {}", conn->name, e.what());
                }
            }
        });
    }

    ////////////////////////////////////////// Shutdown //////////////////////////////////////////

    void shutdown() {
        if (shutDown.exchange(true)) return;
        FUNC_SCOPE();
        LOG_INFO("Runtime shutting down");
        for (auto id : listeners) lifecycle.Off(id);
        listeners.clear();
        for (auto id : rootsListeners) roots.Off(id);
        rootsListeners.clear();
        if (!loop.InLoopThread()) {
            loop.Sync();
        }

        std::vector<ConnectionPtr> conns;
        {
            std::lock_guard<std::mutex> lock(mutex);
            for (const auto& [name, conn] : connections) conns.push_back(conn);
        }
        for (const auto& conn : conns) {
            conn->wanted = false;
            conn->ready = false;
        }
        cancellation.CancelAll(CancellationReason::Shutdown);
        sampling.Cleanup();
        for (const auto& conn : conns) {
            conn->engine->Cleanup();
            detachTransport(*conn);
        }
        stopWorker();
        // A handshake that was running on the worker may have attached a fresh transport.
        for (const auto& conn : conns) {
            conn->engine->Cleanup();
            detachTransport(*conn);
        }

        auto stopped = lifecycle.StopAll(false);
        const auto bound = config.lifecycle.shutdownTimeout + std::chrono::seconds(2);
        if (stopped.wait_for(bound) == std::future_status::timeout) {
            LOG_WARN("Servers did not stop within {} ms", bound.count());
        } else {
            try {
                stopped.get();
            } catch (const std::exception& e) {
                LOG_WARN("Stopping servers: {}", e.what());
            }
        }
        lifecycle.Cleanup();
    }
};

////////////////////////////////////////// Runtime //////////////////////////////////////////

Runtime::Runtime(RuntimeConfig config) {
    FUNC_SCOPE();
    if (config.logging.level) Logger::setLogLevel(*config.logging.level);
    if (config.logging.file) Logger::setLogFile(*config.logging.file);
    // Environment wins over the config file.
    Logger::configureFromEnv();
    pImpl = std::make_shared<Impl>(this, std::move(config));
    pImpl->start();
}

Runtime::~Runtime() {
    FUNC_SCOPE();
    pImpl->shutdown();
    std::unique_lock<std::shared_mutex> lock(pImpl->lifeMutex);
    pImpl->owner = nullptr;
}

std::future<InitializeResult> Runtime::Connect(const std::string& serverName, std::optional<Implementation> clientInfo) {
    FUNC_SCOPE();
    if (pImpl->loop.InLoopThread()) {
        return failedFuture<InitializeResult>(std::make_exception_ptr(
            errors::ProtocolError("Connect cannot be called from the event loop thread")));
    }
    if (pImpl->shutDown.load()) {
        return failedFuture<InitializeResult>(std::make_exception_ptr(errors::TransportError("Runtime is shut down")));
    }
    if (!pImpl->lifecycle.GetConfig(serverName)) {
        return failedFuture<InitializeResult>(std::make_exception_ptr(
            errors::ConfigError("Unknown server: " + serverName)));
    }
    auto conn = pImpl->connectionFor(serverName);
    if (clientInfo) {
        std::lock_guard<std::mutex> lock(conn->mutex);
        conn->clientInfo = std::move(*clientInfo);
    }
    return Impl::connect(pImpl, std::move(conn)).toFuture();
}

std::future<void> Runtime::ConnectAll() {
    FUNC_SCOPE();
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        names = pImpl->serverNames;
    }
    return Impl::connectAll(pImpl, std::move(names)).toFuture();
}

std::future<void> Runtime::Disconnect(const std::string& serverName) {
    FUNC_SCOPE();
    auto conn = pImpl->find(serverName);
    if (!conn) {
        return failedFuture<void>(std::make_exception_ptr(
            errors::TransportError("Server " + serverName + " is not connected")));
    }
    Impl* impl = pImpl.get();
    return pImpl->runOnWorker<void>([impl, conn]() {
        impl->disconnect(conn, "disconnect");
        impl->lifecycle.Stop(conn->name).get();
    });
}

bool Runtime::IsConnected(const std::string& serverName) const {
    auto conn = pImpl->find(serverName);
    return conn && conn->ready.load();
}

std::vector<std::string> Runtime::GetConnectedServers() const {
    std::vector<std::string> out;
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    for (const auto& [name, conn] : pImpl->connections) {
        if (conn->ready.load()) out.push_back(name);
    }
    return out;
}

std::optional<InitializeResult> Runtime::GetServerInfo(const std::string& serverName) const {
    auto conn = pImpl->find(serverName);
    if (!conn || !conn->ready.load()) return std::nullopt;
    std::lock_guard<std::mutex> lock(conn->mutex);
    return conn->serverInfo;
}

void Runtime::RegisterServer(const std::string& name, const ServerConfig& config) {
    pImpl->registerServer(name, config);
}

std::future<JSONValue> Runtime::Request(const std::string& serverName, const std::string& method,
                                        std::optional<JSONValue> params, RequestOptions options) {
    FUNC_SCOPE();
    if (pImpl->loop.InLoopThread()) {
        return failedFuture<JSONValue>(std::make_exception_ptr(
            errors::ProtocolError("Requests cannot be issued from the event loop thread")));
    }
    auto conn = pImpl->find(serverName);
    std::shared_ptr<ProcessTransport> transport = conn ? Impl::transportOf(*conn) : nullptr;
    if (!conn || !conn->ready.load() || !transport) {
        return failedFuture<JSONValue>(std::make_exception_ptr(
            errors::TransportError("Server " + serverName + " is not connected")));
    }

    JSONRPCId id = options.id ? *options.id : JSONRPCId{std::format("{}-{}", serverName, ++pImpl->nextRequestId)};
    CancellableRequestOptions cancelOptions;
    cancelOptions.abortSource = std::move(options.abortSource);
    Impl* impl = pImpl.get();
    cancelOptions.onCancel = [impl, serverName, id](CancellationReason reason) {
        impl->onRequestCancelled(serverName, id, reason);
    };
    try {
        pImpl->cancellation.RegisterRequest(id, serverName, method, std::move(cancelOptions));
    } catch (const errors::ValidationError&) {
        return failedFuture<JSONValue>(std::current_exception());
    }

    auto fut = conn->engine->SendRequest(*transport, id, method, std::move(params), options.timeout);
    return Impl::track(pImpl, std::move(id), std::move(fut)).toFuture();
}

std::future<CallToolResult> Runtime::CallTool(const std::string& serverName, const std::string& toolName,
                                              const JSONValue& arguments, RequestOptions options) {
    JSONValue::Object params;
    params["name"] = std::make_shared<JSONValue>(toolName);
    params["arguments"] = std::make_shared<JSONValue>(arguments);
    return coCallToolResult(Request(serverName, Methods::CallTool, JSONValue{std::move(params)}, std::move(options)))
        .toFuture();
}

std::future<std::vector<Tool>> Runtime::ListTools(const std::string& serverName, RequestOptions options) {
    return coTools(Request(serverName, Methods::ListTools, std::nullopt, std::move(options))).toFuture();
}

std::future<void> Runtime::Ping(const std::string& serverName, RequestOptions options) {
    return coDiscard(Request(serverName, Methods::Ping, std::nullopt, std::move(options))).toFuture();
}

std::future<void> Runtime::SetServerLogLevel(const std::string& serverName, LoggingLevel level) {
    pImpl->logs.SetServerLevel(serverName, level);
    auto info = GetServerInfo(serverName);
    if (!info || !info->capabilities.logging) {
        std::promise<void> done;
        done.set_value();
        return done.get_future();
    }
    JSONValue::Object params;
    params["level"] = std::make_shared<JSONValue>(toString(level));
    return coDiscard(Request(serverName, Methods::SetLogLevel, JSONValue{std::move(params)})).toFuture();
}

std::future<void> Runtime::SetRoots(std::vector<Root> roots) {
    pImpl->roots.SetRoots(roots);
    return pImpl->broadcastRootsChanged();
}

std::vector<Root> Runtime::GetRoots() const {
    return pImpl->roots.GetRootsForProtocol();
}

EventLoop& Runtime::Loop() { return pImpl->loop; }
LifecycleManager& Runtime::Lifecycle() { return pImpl->lifecycle; }
CancellationManager& Runtime::Cancellation() { return pImpl->cancellation; }
NotificationRouter& Runtime::Notifications() { return pImpl->router; }
RootsManager& Runtime::Roots() { return pImpl->roots; }
SamplingManager& Runtime::Sampling() { return pImpl->sampling; }
ServerLogManager& Runtime::Logs() { return pImpl->logs; }

void Runtime::Shutdown() {
    pImpl->shutdown();
}

} // namespace mcprt
