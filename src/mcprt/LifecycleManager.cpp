//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LifecycleManager.cpp
// Purpose: Server lifecycle flows as Boost.Asio coroutines on the runtime event loop
//==========================================================================================================

#include "mcprt/LifecycleManager.h"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <set>

#include <signal.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>

#include "logging/Logger.h"
#include "mcprt/ChildProcess.h"
#include "mcprt/errors/Errors.h"

namespace mcprt {

using namespace std::chrono;
using TimerPtr = std::shared_ptr<net::steady_timer>;

const char* toString(ServerState state) {
    switch (state) {
        case ServerState::Stopped: return "stopped";
        case ServerState::Starting: return "starting";
        case ServerState::Running: return "running";
        case ServerState::Stopping: return "stopping";
        case ServerState::Error: return "error";
        case ServerState::Crashed: return "crashed";
    }
    return "stopped";
}

namespace {
constexpr milliseconds kMaxBackoff{60000};
constexpr milliseconds kStatePollInterval{100};
constexpr milliseconds kStateWaitLimit{30000};

std::string describe(std::exception_ptr ex) {
    try {
        std::rethrow_exception(ex);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

std::string joinFailures(const std::vector<std::pair<std::string, std::string>>& failures) {
    std::string out;
    for (const auto& [name, message] : failures) {
        if (!out.empty()) out += ", ";
        out += name + ": " + message;
    }
    return out;
}
} // namespace

struct LifecycleManager::Impl : std::enable_shared_from_this<LifecycleManager::Impl> {
    struct Entry {
        ServerConfig config;
        ServerProcess process;
        std::shared_ptr<ChildProcess> child;
        // Bumped on every spawn so callbacks from an older child are ignored.
        uint64_t generation = 0;
        // Bumped by every explicit start or stop; a restart waiting out its backoff gives up when it moves.
        uint64_t restartEpoch = 0;
        TimerPtr healthTimer;
        TimerPtr startupTimer;
        TimerPtr shutdownTimer;
        TimerPtr readyTimer;   // awaited by the start flow
        TimerPtr exitWaiter;   // awaited by the stop flow
        std::optional<ExitStatus> startupExit;
        bool startupTimedOut = false;
    };

    EventLoop& loop;
    LifecycleOptions options;
    std::atomic<LifecycleManager*> owner;
    // Bumped by Cleanup(); flows suspended across a Cleanup() abandon their work.
    std::atomic<uint64_t> epoch{0};
    mutable std::mutex mutex;
    std::map<std::string, Entry> entries;
    std::vector<std::string> order;
    std::map<std::string, std::vector<std::string>> dependencies;
    std::set<TimerPtr> sleepers;

    Impl(EventLoop& l, LifecycleOptions o, LifecycleManager* self) : loop(l), options(o), owner(self) {}

    Entry* find(const std::string& name) {
        auto it = entries.find(name);
        return it == entries.end() ? nullptr : &it->second;
    }

    const Entry* find(const std::string& name) const {
        auto it = entries.find(name);
        return it == entries.end() ? nullptr : &it->second;
    }

    void cancel(TimerPtr& timer) {
        if (timer) {
            loop.CancelTimer(timer);
            timer.reset();
        }
    }

    ServerState state(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex);
        const Entry* e = find(name);
        return e ? e->process.state : ServerState::Stopped;
    }

    LifecycleEvent event(const char* type, const std::string& name) const {
        LifecycleEvent ev;
        ev.type = type;
        ev.serverName = name;
        std::lock_guard<std::mutex> lock(mutex);
        if (const Entry* e = find(name)) {
            ev.process = e->process;
            ev.pid = e->process.pid;
        }
        return ev;
    }

    void emit(const LifecycleEvent& ev) {
        if (LifecycleManager* self = owner.load()) self->Emit(ev);
    }

    void spawnDetached(net::awaitable<void> flow, std::string what) {
        net::co_spawn(loop.Context(), std::move(flow), [what = std::move(what)](std::exception_ptr ex) {
            if (ex) LOG_ERROR("{} failed: {}", what, describe(ex));
        });
    }

    milliseconds backoff(int restartCount) const {
        int exponent = std::clamp(restartCount - 1, 0, 6);
        return std::min(milliseconds(options.restartDelay.count() * (int64_t{1} << exponent)), kMaxBackoff);
    }

    ////////////////////////////////////////// Child callbacks //////////////////////////////////////////

    void onOutput(const std::string& name, const char* type, const std::string& data) {
        LifecycleEvent ev;
        ev.type = type;
        ev.serverName = name;
        ev.data = data;
        emit(ev);
    }

    void onChildExit(const std::string& name, uint64_t generation, const ExitStatus& status) {
        enum class Outcome { None, Crashed, Stopped } outcome = Outcome::None;
        {
            std::lock_guard<std::mutex> lock(mutex);
            Entry* e = find(name);
            if (!e || e->generation != generation) return;
            e->child.reset();
            cancel(e->healthTimer);
            cancel(e->readyTimer);
            cancel(e->exitWaiter);
            switch (e->process.state) {
                case ServerState::Starting:
                    e->startupExit = status;
                    break;
                case ServerState::Stopping:
                case ServerState::Stopped:
                case ServerState::Error:
                    break;
                case ServerState::Running:
                case ServerState::Crashed:
                    e->process.pid.reset();
                    e->process.stoppedAt = system_clock::now();
                    if (status.code && *status.code == 0) {
                        e->process.state = ServerState::Stopped;
                        outcome = Outcome::Stopped;
                    } else {
                        e->process.lastError = "Process exited with " + describeExit(status);
                        e->process.consecutiveFailures++;
                        e->process.state = ServerState::Crashed;
                        outcome = Outcome::Crashed;
                    }
                    break;
            }
        }
        if (outcome == Outcome::None) return;

        LifecycleEvent ev = event(outcome == Outcome::Crashed ? "server:crashed" : "server:stopped", name);
        ev.code = status.code;
        ev.signal = status.signal;
        if (outcome == Outcome::Crashed) {
            LOG_WARN("Server {} exited unexpectedly with {}", name, describeExit(status));
            emit(ev);
            spawnDetached(autoRestart(shared_from_this(), name), "Auto-restart of " + name);
        } else {
            LOG_INFO("Server {} exited cleanly", name);
            emit(ev);
        }
    }

    void onStartupTimeout(const std::string& name, uint64_t generation) {
        std::lock_guard<std::mutex> lock(mutex);
        Entry* e = find(name);
        if (!e || e->generation != generation || e->process.state != ServerState::Starting) return;
        e->startupTimedOut = true;
        e->startupTimer.reset();
        cancel(e->readyTimer);
    }

    void handleStartupFailure(const std::string& name, uint64_t generation, const std::string& message) {
        std::shared_ptr<ChildProcess> child;
        {
            std::lock_guard<std::mutex> lock(mutex);
            Entry* e = find(name);
            if (!e || e->generation != generation || e->process.state != ServerState::Starting) return;
            e->process.lastError = message;
            e->process.consecutiveFailures++;
            e->process.state = ServerState::Error;
            e->process.pid.reset();
            cancel(e->startupTimer);
            cancel(e->readyTimer);
            child = e->child;
        }
        if (child) {
            try {
                child->Kill(SIGKILL);
            } catch (const std::exception& ex) {
                LOG_ERROR("Failed to kill {} after startup failure: {}", name, ex.what());
            }
        }
        LOG_ERROR("Server {} failed to start: {}", name, message);
        LifecycleEvent ev = event("server:error", name);
        ev.error = message;
        emit(ev);
    }

    ////////////////////////////////////////// Health //////////////////////////////////////////

    HealthCheckResult healthCheck(const std::string& name) {
        HealthCheckResult result;
        result.lastCheck = system_clock::now();
        ServerProcess snapshot;
        std::shared_ptr<ChildProcess> child;
        {
            std::lock_guard<std::mutex> lock(mutex);
            const Entry* e = find(name);
            if (!e) {
                result.error = "Server not found";
                return result;
            }
            snapshot = e->process;
            child = e->child;
        }
        if (snapshot.state != ServerState::Running) {
            result.error = std::string("Server is ") + toString(snapshot.state);
            return result;
        }
        if (!child || !child->IsAlive()) {
            result.error = "Process not found or killed";
            return result;
        }

        auto t0 = steady_clock::now();
        bool alive = child->IsAlive() && ::kill(child->Pid(), 0) == 0;
        if (!alive) {
            result.error = "Process is not accepting signals";
        } else if (options.healthCallback) {
            try {
                alive = options.healthCallback(name, child->Pid());
                if (!alive) result.error = "Health callback reported failure";
            } catch (const std::exception& ex) {
                alive = false;
                result.error = std::string("Health callback threw: ") + ex.what();
            } catch (...) {
                alive = false;
                result.error = "Health callback threw an unknown exception";
            }
        }
        result.latency = duration_cast<microseconds>(steady_clock::now() - t0);
        result.healthy = alive;
        result.pid = child->Pid();
        result.restartCount = snapshot.restartCount;
        if (snapshot.startedAt) result.uptime = duration_cast<milliseconds>(system_clock::now() - *snapshot.startedAt);

        LifecycleEvent ev;
        ev.type = alive ? "health:ok" : "health:failed";
        ev.serverName = name;
        ev.health = result;
        emit(ev);
        return result;
    }

    void scheduleHealthCheck(const std::string& name, uint64_t generation) {
        std::weak_ptr<Impl> weak = weak_from_this();
        auto timer = loop.ScheduleTimer(options.healthCheckInterval, [weak, name, generation]() {
            if (auto impl = weak.lock()) impl->periodicHealthCheck(name, generation);
        });
        std::lock_guard<std::mutex> lock(mutex);
        Entry* e = find(name);
        if (e && e->generation == generation && e->process.state == ServerState::Running) {
            cancel(e->healthTimer);
            e->healthTimer = timer;
        } else {
            loop.CancelTimer(timer);
        }
    }

    void periodicHealthCheck(const std::string& name, uint64_t generation) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            Entry* e = find(name);
            if (!e || e->generation != generation || e->process.state != ServerState::Running) return;
            e->healthTimer.reset();
        }
        HealthCheckResult result = healthCheck(name);
        bool degraded = false;
        {
            std::lock_guard<std::mutex> lock(mutex);
            Entry* e = find(name);
            if (!e || e->generation != generation) return;
            if (result.healthy) {
                e->process.consecutiveFailures = 0;
            } else if (++e->process.consecutiveFailures >= options.healthFailureThreshold) {
                degraded = true;
            }
        }
        if (degraded) {
            LOG_WARN("Server {} failed {} consecutive health checks", name, options.healthFailureThreshold);
            LifecycleEvent ev = event("health:degraded", name);
            ev.health = result;
            emit(ev);
            spawnDetached(autoRestart(shared_from_this(), name), "Auto-restart of " + name);
            return;
        }
        scheduleHealthCheck(name, generation);
    }

    ////////////////////////////////////////// Flows //////////////////////////////////////////

    // Returns false when the sleep was interrupted by Cleanup().
    static net::awaitable<bool> sleepFor(std::shared_ptr<Impl> self, milliseconds delay) {
        const uint64_t startEpoch = self->epoch.load();
        auto timer = std::make_shared<net::steady_timer>(self->loop.Context(), delay);
        {
            std::lock_guard<std::mutex> lock(self->mutex);
            self->sleepers.insert(timer);
        }
        boost::system::error_code ec;
        co_await timer->async_wait(net::redirect_error(net::use_awaitable, ec));
        {
            std::lock_guard<std::mutex> lock(self->mutex);
            self->sleepers.erase(timer);
        }
        co_return !ec && self->epoch.load() == startEpoch;
    }

    // Polls until the server leaves `from`; returns the new state.
    static net::awaitable<ServerState> waitWhile(std::shared_ptr<Impl> self, std::string name, ServerState from) {
        auto deadline = steady_clock::now() + kStateWaitLimit;
        for (;;) {
            ServerState current = self->state(name);
            if (current != from) co_return current;
            if (steady_clock::now() >= deadline) {
                throw errors::TimeoutError("Timeout waiting for " + name + " to leave state " + toString(from));
            }
            const bool slept = co_await sleepFor(self, kStatePollInterval);
            if (!slept) {
                throw errors::CancellationError("Wait for " + name + " cancelled", errors::CancellationReason::Shutdown);
            }
        }
    }

    static net::awaitable<void> start(std::shared_ptr<Impl> self, std::string name, StartOptions opts) {
        ServerState current;
        {
            std::lock_guard<std::mutex> lock(self->mutex);
            const Entry* e = self->find(name);
            if (!e) throw errors::ProcessError("Server not found: " + name);
            current = e->process.state;
        }
        if (current == ServerState::Running && !opts.force) co_return;
        if (current == ServerState::Starting) {
            if (opts.waitForReady) {
                ServerState reached = co_await waitWhile(self, name, ServerState::Starting);
                if (reached != ServerState::Running) {
                    throw errors::ProcessError("Server " + name + " failed to start (" + toString(reached) + ")");
                }
            }
            co_return;
        }
        if (current == ServerState::Stopping) {
            co_await waitWhile(self, name, ServerState::Stopping);
        }

        for (const auto& dep : opts.dependencies) {
            if (self->state(dep) != ServerState::Running) {
                StartOptions depOptions;
                depOptions.waitForReady = true;
                co_await start(self, dep, depOptions);
            }
        }

        if (self->state(name) == ServerState::Running) {
            StopOptions replace;
            replace.reason = "forced start";
            co_await stop(self, name, replace);
        }

        ServerConfig config;
        uint64_t generation = 0;
        const uint64_t startEpoch = self->epoch.load();
        {
            std::lock_guard<std::mutex> lock(self->mutex);
            Entry* e = self->find(name);
            if (!e) throw errors::ProcessError("Server not found: " + name);
            config = e->config;
            generation = ++e->generation;
            ++e->restartEpoch;
            e->process.state = ServerState::Starting;
            e->process.pid.reset();
            e->startupExit.reset();
            e->startupTimedOut = false;
        }
        LOG_INFO("Starting server {} ({})", name, config.command);
        self->emit(self->event("server:starting", name));

        std::optional<std::string> failure;
        std::exception_ptr failureEx;
        try {
            if (config.type != "stdio" || config.command.empty()) {
                throw errors::ProcessError("Unsupported server type or missing command: " + config.type);
            }
            std::weak_ptr<Impl> weak = self;
            ChildProcess::Handlers handlers;
            handlers.onStdout = [weak, name](const std::string& data) {
                if (auto impl = weak.lock()) impl->onOutput(name, "server:stdout", data);
            };
            handlers.onStderr = [weak, name](const std::string& data) {
                if (auto impl = weak.lock()) impl->onOutput(name, "server:stderr", data);
            };
            handlers.onExit = [weak, name, generation](const ExitStatus& status) {
                if (auto impl = weak.lock()) impl->onChildExit(name, generation, status);
            };
            auto child = ChildProcess::Spawn(self->loop, ProcessSpec{config.command, config.args, config.env},
                                             std::move(handlers));

            TimerPtr ready;
            {
                std::lock_guard<std::mutex> lock(self->mutex);
                Entry* e = self->find(name);
                if (!e || e->generation != generation) {
                    child->Kill(SIGKILL);
                    throw errors::ProcessError("Startup of " + name + " was interrupted");
                }
                e->child = child;
                e->process.pid = child->Pid();
                e->process.startedAt = system_clock::now();
                e->startupTimer = self->loop.ScheduleTimer(self->options.startupTimeout, [weak, name, generation]() {
                    if (auto impl = weak.lock()) impl->onStartupTimeout(name, generation);
                });
                ready = e->readyTimer = std::make_shared<net::steady_timer>(self->loop.Context(), self->options.readyGrace);
            }

            boost::system::error_code ec;
            co_await ready->async_wait(net::redirect_error(net::use_awaitable, ec));

            std::lock_guard<std::mutex> lock(self->mutex);
            Entry* e = self->find(name);
            if (self->epoch.load() != startEpoch) {
                throw errors::CancellationError("Startup of " + name + " cancelled", errors::CancellationReason::Shutdown);
            }
            if (!e || e->generation != generation || e->process.state != ServerState::Starting) {
                throw errors::ProcessError("Startup of " + name + " was interrupted");
            }
            e->readyTimer.reset();
            if (e->startupExit) {
                throw errors::ProcessError("Process exited with " + describeExit(*e->startupExit) + " during startup");
            }
            if (e->startupTimedOut) {
                throw errors::TimeoutError("Startup timeout exceeded");
            }
            self->cancel(e->startupTimer);
            e->process.state = ServerState::Running;
            e->process.consecutiveFailures = 0;
        } catch (const std::exception& ex) {
            failure = ex.what();
            failureEx = std::current_exception();
        }
        if (failureEx) {
            self->handleStartupFailure(name, generation, *failure);
            std::rethrow_exception(failureEx);
        }

        LifecycleEvent started = self->event("server:started", name);
        LOG_INFO("Server {} running (pid {})", name, started.pid ? *started.pid : -1);
        self->emit(started);
        self->scheduleHealthCheck(name, generation);
    }

    static net::awaitable<void> stop(std::shared_ptr<Impl> self, std::string name, StopOptions opts) {
        std::shared_ptr<ChildProcess> child;
        TimerPtr waiter;
        {
            std::lock_guard<std::mutex> lock(self->mutex);
            Entry* e = self->find(name);
            if (!e) throw errors::ProcessError("Server not found: " + name);
            ++e->restartEpoch;
            if (e->process.state == ServerState::Stopped) co_return;
            self->cancel(e->healthTimer);
            self->cancel(e->startupTimer);
            self->cancel(e->readyTimer);
            e->process.state = ServerState::Stopping;
            child = e->child;
            if (child && child->IsAlive()) {
                waiter = e->exitWaiter =
                    std::make_shared<net::steady_timer>(self->loop.Context(), steady_clock::time_point::max());
            }
        }
        LifecycleEvent stopping = self->event("server:stopping", name);
        stopping.reason = opts.reason;
        LOG_INFO("Stopping server {}{}", name, opts.reason.empty() ? "" : " (" + opts.reason + ")");
        self->emit(stopping);

        if (waiter) {
            const int signal = opts.force ? SIGKILL : opts.killSignal;
            std::weak_ptr<ChildProcess> weakChild = child;
            auto escalate = self->loop.ScheduleTimer(self->options.shutdownTimeout, [weakChild, name]() {
                auto c = weakChild.lock();
                if (!c || !c->IsAlive()) return;
                LOG_WARN("Server {} did not exit within the shutdown timeout; sending SIGKILL", name);
                try {
                    c->Kill(SIGKILL);
                } catch (const std::exception& ex) {
                    LOG_ERROR("SIGKILL for {} failed: {}", name, ex.what());
                }
            });
            {
                std::lock_guard<std::mutex> lock(self->mutex);
                if (Entry* e = self->find(name)) e->shutdownTimer = escalate;
            }

            std::optional<std::string> signalFailure;
            std::exception_ptr signalEx;
            try {
                child->Kill(signal);
            } catch (const std::exception& ex) {
                signalFailure = ex.what();
                signalEx = std::current_exception();
            }
            if (signalEx) {
                {
                    std::lock_guard<std::mutex> lock(self->mutex);
                    if (Entry* e = self->find(name)) {
                        self->cancel(e->shutdownTimer);
                        e->exitWaiter.reset();
                        e->process.state = ServerState::Error;
                        e->process.lastError = *signalFailure;
                    }
                }
                LifecycleEvent ev = self->event("server:error", name);
                ev.error = *signalFailure;
                self->emit(ev);
                std::rethrow_exception(signalEx);
            }

            if (child->IsAlive()) {
                boost::system::error_code ec;
                co_await waiter->async_wait(net::redirect_error(net::use_awaitable, ec));
            }
            self->loop.CancelTimer(escalate);
        }

        {
            std::lock_guard<std::mutex> lock(self->mutex);
            if (Entry* e = self->find(name)) {
                e->shutdownTimer.reset();
                e->exitWaiter.reset();
                e->child.reset();
                e->process.state = ServerState::Stopped;
                e->process.stoppedAt = system_clock::now();
                e->process.pid.reset();
            }
        }
        LOG_INFO("Server {} stopped", name);
        self->emit(self->event("server:stopped", name));
    }

    static net::awaitable<void> restart(std::shared_ptr<Impl> self, std::string name) {
        {
            std::lock_guard<std::mutex> lock(self->mutex);
            if (!self->find(name)) throw errors::ProcessError("Server not found: " + name);
        }
        self->emit(self->event("server:restarting", name));

        ServerState current = self->state(name);
        if (current == ServerState::Running || current == ServerState::Starting) {
            co_await stop(self, name, StopOptions{});
        }

        int count = 0;
        uint64_t restartEpoch = 0;
        {
            std::lock_guard<std::mutex> lock(self->mutex);
            Entry* e = self->find(name);
            if (!e) throw errors::ProcessError("Server not found: " + name);
            count = ++e->process.restartCount;
            restartEpoch = e->restartEpoch;
        }
        milliseconds delay = self->backoff(count);
        LOG_INFO("Restarting server {} in {}ms (restart #{})", name, delay.count(), count);
        if (delay.count() > 0) {
            const bool slept = co_await sleepFor(self, delay);
            if (!slept) {
                throw errors::CancellationError("Restart of " + name + " cancelled", errors::CancellationReason::Shutdown);
            }
        }
        {
            std::lock_guard<std::mutex> lock(self->mutex);
            Entry* e = self->find(name);
            if (!e || e->restartEpoch != restartEpoch) {
                LOG_INFO("Restart of {} abandoned: server was stopped or started meanwhile", name);
                co_return;
            }
        }
        co_await start(self, name, StartOptions{});
    }

    static net::awaitable<void> autoRestart(std::shared_ptr<Impl> self, std::string name) {
        bool allowed = false;
        {
            std::lock_guard<std::mutex> lock(self->mutex);
            Entry* e = self->find(name);
            if (!e) co_return;
            allowed = e->process.restartCount < self->options.maxRestarts &&
                      e->process.consecutiveFailures < self->options.maxConsecutiveFailures;
            if (!allowed) {
                e->process.state = ServerState::Stopped;
                e->process.stoppedAt = system_clock::now();
            }
        }
        if (!allowed) {
            LOG_ERROR("Server {} exceeded its restart budget; giving up", name);
            LifecycleEvent ev = self->event("server:crashed", name);
            ev.reason = "max_restarts_exceeded";
            self->emit(ev);
            co_return;
        }

        std::optional<std::string> failure;
        try {
            co_await restart(self, name);
        } catch (const std::exception& ex) {
            failure = ex.what();
        }
        if (failure) {
            {
                std::lock_guard<std::mutex> lock(self->mutex);
                if (Entry* e = self->find(name)) {
                    e->process.lastError = *failure;
                    e->process.consecutiveFailures++;
                }
            }
            LifecycleEvent ev = self->event("server:error", name);
            ev.error = *failure;
            self->emit(ev);
        }
    }

    static net::awaitable<void> startWithDependencies(std::shared_ptr<Impl> self, std::string name,
                                                      std::shared_ptr<std::vector<std::string>> path) {
        if (std::find(path->begin(), path->end(), name) != path->end()) {
            std::string cycle;
            for (const auto& p : *path) cycle += p + " -> ";
            throw errors::ProcessError("Dependency cycle detected: " + cycle + name);
        }
        std::vector<std::string> deps;
        {
            std::lock_guard<std::mutex> lock(self->mutex);
            if (!self->find(name)) throw errors::ProcessError("Server not found: " + name);
            auto it = self->dependencies.find(name);
            if (it != self->dependencies.end()) deps = it->second;
        }
        path->push_back(name);
        for (const auto& dep : deps) {
            if (self->state(dep) != ServerState::Running) {
                co_await startWithDependencies(self, dep, path);
            }
        }
        path->pop_back();
        StartOptions opts;
        opts.dependencies = deps;
        co_await start(self, name, opts);
    }

    std::vector<std::string> names() const {
        std::lock_guard<std::mutex> lock(mutex);
        return order;
    }

    static net::awaitable<void> startAll(std::shared_ptr<Impl> self) {
        std::vector<std::pair<std::string, std::string>> failures;
        for (const auto& name : self->names()) {
            try {
                co_await start(self, name, StartOptions{});
            } catch (const std::exception& ex) {
                failures.emplace_back(name, ex.what());
            }
        }
        if (!failures.empty()) {
            throw errors::ProcessError("Failed to start some servers: " + joinFailures(failures));
        }
    }

    static net::awaitable<void> stopAll(std::shared_ptr<Impl> self, bool force) {
        std::vector<std::pair<std::string, std::string>> failures;
        for (const auto& name : self->names()) {
            ServerState current = self->state(name);
            if (current != ServerState::Running && current != ServerState::Starting) continue;
            try {
                StopOptions opts;
                opts.force = force;
                co_await stop(self, name, opts);
            } catch (const std::exception& ex) {
                failures.emplace_back(name, ex.what());
            }
        }
        if (!failures.empty() && !force) {
            throw errors::ProcessError("Failed to stop some servers: " + joinFailures(failures));
        }
    }

    static net::awaitable<void> restartAll(std::shared_ptr<Impl> self) {
        for (const auto& name : self->names()) {
            std::optional<std::string> failure;
            try {
                co_await restart(self, name);
            } catch (const std::exception& ex) {
                failure = ex.what();
            }
            if (failure) {
                LifecycleEvent ev = self->event("server:error", name);
                ev.error = *failure;
                self->emit(ev);
            }
        }
    }

    static net::awaitable<void> unregister(std::shared_ptr<Impl> self, std::string name) {
        ServerState current;
        {
            std::lock_guard<std::mutex> lock(self->mutex);
            const Entry* e = self->find(name);
            if (!e) co_return;
            current = e->process.state;
        }
        if (current == ServerState::Running || current == ServerState::Starting) {
            StopOptions opts;
            opts.force = true;
            opts.reason = "unregistered";
            co_await stop(self, name, opts);
        }
        std::lock_guard<std::mutex> lock(self->mutex);
        if (Entry* e = self->find(name)) {
            self->cancel(e->healthTimer);
            self->cancel(e->startupTimer);
            self->cancel(e->shutdownTimer);
            self->cancel(e->readyTimer);
            self->entries.erase(name);
        }
        self->order.erase(std::remove(self->order.begin(), self->order.end(), name), self->order.end());
        self->dependencies.erase(name);
        LOG_DEBUG("Server {} unregistered", name);
    }

    static net::awaitable<void> configChange(std::shared_ptr<Impl> self, std::string name, ServerConfig config) {
        const bool wasRunning = self->state(name) == ServerState::Running;
        if (wasRunning) {
            StopOptions opts;
            opts.reason = "config changed";
            co_await stop(self, name, opts);
        }
        {
            std::lock_guard<std::mutex> lock(self->mutex);
            Entry* e = self->find(name);
            if (!e) throw errors::ProcessError("Server not found: " + name);
            e->config = config;
        }
        LifecycleEvent ev = self->event("config:changed", name);
        ev.config = config;
        self->emit(ev);
        if (wasRunning) co_await start(self, name, StartOptions{});
    }
};

LifecycleManager::LifecycleManager(EventLoop& loop, LifecycleOptions options)
    : pImpl(std::make_shared<Impl>(loop, options, this)) {
    FUNC_SCOPE();
}

LifecycleManager::~LifecycleManager() {
    FUNC_SCOPE();
    pImpl->owner = nullptr;
    Cleanup();
    pImpl->loop.Sync();
}

void LifecycleManager::RegisterServer(const std::string& name, const ServerConfig& config) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    Impl::Entry* e = pImpl->find(name);
    if (!e) {
        Impl::Entry fresh;
        fresh.process.name = name;
        e = &pImpl->entries.emplace(name, std::move(fresh)).first->second;
        pImpl->order.push_back(name);
    }
    e->config = config;
    if (!config.dependsOn.empty()) pImpl->dependencies[name] = config.dependsOn;
    LOG_DEBUG("Registered server {} ({})", name, config.command);
}

std::future<void> LifecycleManager::UnregisterServer(const std::string& name) {
    return net::co_spawn(pImpl->loop.Context(), Impl::unregister(pImpl, name), net::use_future);
}

void LifecycleManager::SetDependencies(const std::string& name, const std::vector<std::string>& dependencies) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->dependencies[name] = dependencies;
}

std::vector<std::string> LifecycleManager::GetDependencies(const std::string& name) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->dependencies.find(name);
    return it == pImpl->dependencies.end() ? std::vector<std::string>{} : it->second;
}

std::future<void> LifecycleManager::Start(const std::string& name, StartOptions options) {
    return net::co_spawn(pImpl->loop.Context(), Impl::start(pImpl, name, std::move(options)), net::use_future);
}

std::future<void> LifecycleManager::StartAll() {
    return net::co_spawn(pImpl->loop.Context(), Impl::startAll(pImpl), net::use_future);
}

std::future<void> LifecycleManager::StartWithDependencies(const std::string& name) {
    return net::co_spawn(pImpl->loop.Context(),
                         Impl::startWithDependencies(pImpl, name, std::make_shared<std::vector<std::string>>()),
                         net::use_future);
}

std::future<void> LifecycleManager::Stop(const std::string& name, StopOptions options) {
    return net::co_spawn(pImpl->loop.Context(), Impl::stop(pImpl, name, std::move(options)), net::use_future);
}

std::future<void> LifecycleManager::StopAll(bool force) {
    return net::co_spawn(pImpl->loop.Context(), Impl::stopAll(pImpl, force), net::use_future);
}

std::future<void> LifecycleManager::Restart(const std::string& name) {
    return net::co_spawn(pImpl->loop.Context(), Impl::restart(pImpl, name), net::use_future);
}

std::future<void> LifecycleManager::RestartAll() {
    return net::co_spawn(pImpl->loop.Context(), Impl::restartAll(pImpl), net::use_future);
}

std::chrono::milliseconds LifecycleManager::CalculateBackoffDelay(int restartCount) const {
    return pImpl->backoff(restartCount);
}

HealthCheckResult LifecycleManager::HealthCheck(const std::string& name) {
    return pImpl->healthCheck(name);
}

std::vector<std::pair<std::string, HealthCheckResult>> LifecycleManager::HealthCheckAll() {
    std::vector<std::pair<std::string, HealthCheckResult>> results;
    for (const auto& name : pImpl->names()) {
        results.emplace_back(name, pImpl->healthCheck(name));
    }
    return results;
}

std::future<void> LifecycleManager::OnConfigChange(const std::string& name, const ServerConfig& config) {
    return net::co_spawn(pImpl->loop.Context(), Impl::configChange(pImpl, name, config), net::use_future);
}

std::future<void> LifecycleManager::WriteStdin(const std::string& name, const std::string& data) {
    std::shared_ptr<ChildProcess> child;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        const Impl::Entry* e = pImpl->find(name);
        if (e && (e->process.state == ServerState::Running || e->process.state == ServerState::Starting)) {
            child = e->child;
        }
    }
    if (!child) {
        std::promise<void> p;
        p.set_exception(std::make_exception_ptr(errors::ProcessError("Server " + name + " is not running")));
        return p.get_future();
    }
    return child->Write(data);
}

ServerState LifecycleManager::GetState(const std::string& name) const {
    return pImpl->state(name);
}

std::optional<ServerProcess> LifecycleManager::GetProcess(const std::string& name) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    const Impl::Entry* e = pImpl->find(name);
    if (!e) return std::nullopt;
    return e->process;
}

std::vector<ServerProcess> LifecycleManager::GetAllProcesses() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    std::vector<ServerProcess> out;
    for (const auto& name : pImpl->order) out.push_back(pImpl->entries.at(name).process);
    return out;
}

bool LifecycleManager::IsRunning(const std::string& name) const {
    return pImpl->state(name) == ServerState::Running;
}

std::vector<std::string> LifecycleManager::GetRunningServers() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    std::vector<std::string> out;
    for (const auto& name : pImpl->order) {
        if (pImpl->entries.at(name).process.state == ServerState::Running) out.push_back(name);
    }
    return out;
}

std::optional<ServerStats> LifecycleManager::GetStats(const std::string& name) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    const Impl::Entry* e = pImpl->find(name);
    if (!e) return std::nullopt;
    ServerStats stats;
    if (e->process.startedAt) stats.uptime = duration_cast<milliseconds>(system_clock::now() - *e->process.startedAt);
    stats.restartCount = e->process.restartCount;
    stats.consecutiveFailures = e->process.consecutiveFailures;
    stats.lastError = e->process.lastError;
    return stats;
}

std::optional<ServerConfig> LifecycleManager::GetConfig(const std::string& name) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    const Impl::Entry* e = pImpl->find(name);
    if (!e) return std::nullopt;
    return e->config;
}

void LifecycleManager::Cleanup() {
    FUNC_SCOPE();
    pImpl->epoch++;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        for (auto& [name, e] : pImpl->entries) {
            pImpl->cancel(e.healthTimer);
            pImpl->cancel(e.startupTimer);
        }
        for (const auto& timer : pImpl->sleepers) pImpl->loop.CancelTimer(timer);
    }

    if (!pImpl->loop.InLoopThread() && !pImpl->loop.Context().stopped()) {
        auto stopped = StopAll(true);
        if (stopped.wait_for(pImpl->options.shutdownTimeout + seconds(5)) == std::future_status::ready) {
            try {
                stopped.get();
            } catch (const std::exception& ex) {
                LOG_ERROR("Stopping servers during cleanup failed: {}", ex.what());
            }
        } else {
            LOG_WARN("Timed out waiting for servers to stop during cleanup");
        }
    }

    std::vector<std::shared_ptr<ChildProcess>> children;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        for (auto& [name, e] : pImpl->entries) {
            pImpl->cancel(e.shutdownTimer);
            pImpl->cancel(e.readyTimer);
            pImpl->cancel(e.exitWaiter);
            if (e.child) children.push_back(std::move(e.child));
        }
        pImpl->entries.clear();
        pImpl->order.clear();
        pImpl->dependencies.clear();
    }
    for (auto& child : children) {
        try {
            child->Kill(SIGKILL);
        } catch (const std::exception& ex) {
            LOG_ERROR("Failed to kill pid {} during cleanup: {}", child->Pid(), ex.what());
        }
        child->Close();
    }
    RemoveAllListeners();
}

} // namespace mcprt
