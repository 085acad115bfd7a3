//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LifecycleManager.h
// Purpose: Per-server process state machine: spawn, readiness, health checks, dependency ordering and
//          exponential-backoff auto-restart
//==========================================================================================================

#pragma once

#include <chrono>
#include <csignal>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include "mcprt/EventEmitter.h"
#include "mcprt/EventLoop.h"

namespace mcprt {

enum class ServerState {
    Stopped,
    Starting,
    Running,
    Stopping,
    Error,
    Crashed
};

const char* toString(ServerState state);

//==========================================================================================================
// ServerConfig
// Purpose: How to launch one server. Only "stdio" servers are supported.
//==========================================================================================================
struct ServerConfig {
    std::string type = "stdio";
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::vector<std::string> dependsOn;
};

struct ServerProcess {
    std::string name;
    std::optional<pid_t> pid;
    ServerState state = ServerState::Stopped;
    std::optional<std::chrono::system_clock::time_point> startedAt;
    std::optional<std::chrono::system_clock::time_point> stoppedAt;
    int restartCount = 0;
    int consecutiveFailures = 0;
    std::optional<std::string> lastError;
};

struct LifecycleOptions {
    std::chrono::milliseconds startupTimeout{30000};
    std::chrono::milliseconds shutdownTimeout{10000};
    int maxRestarts = 3;
    std::chrono::milliseconds restartDelay{1000};
    std::chrono::milliseconds healthCheckInterval{30000};
    int maxConsecutiveFailures = 5;
    // A freshly spawned process counts as ready once it survives this long.
    std::chrono::milliseconds readyGrace{1000};
    // Consecutive failed periodic checks that mark a server degraded.
    int healthFailureThreshold = 3;
    // Extra liveness test run after the process check passes. Called on the event loop thread and must
    // not block; returning false or throwing marks the check failed.
    std::function<bool(const std::string& name, pid_t pid)> healthCallback;
};

struct StartOptions {
    bool force = false;
    bool waitForReady = false;
    std::vector<std::string> dependencies;
};

struct StopOptions {
    bool force = false;
    int killSignal = SIGTERM;
    std::string reason;
};

struct HealthCheckResult {
    bool healthy = false;
    std::chrono::system_clock::time_point lastCheck;
    std::optional<std::chrono::microseconds> latency;
    std::optional<std::string> error;
    std::optional<pid_t> pid;
    std::chrono::milliseconds uptime{0};
    int restartCount = 0;
};

struct ServerStats {
    std::optional<std::chrono::milliseconds> uptime;
    int restartCount = 0;
    int consecutiveFailures = 0;
    std::optional<std::string> lastError;
};

//==========================================================================================================
// LifecycleEvent
// Purpose: Payload for "server:starting", "server:started", "server:stopping", "server:stopped",
//          "server:error", "server:crashed", "server:restarting", "server:stdout", "server:stderr",
//          "health:ok", "health:degraded", "health:failed" and "config:changed".
//==========================================================================================================
struct LifecycleEvent {
    std::string type;
    std::string serverName;
    std::optional<ServerProcess> process;
    std::optional<pid_t> pid;
    std::optional<int> code;
    std::optional<int> signal;
    std::string reason;   // server:stopping, server:crashed ("max_restarts_exceeded")
    std::string error;    // server:error
    std::string data;     // server:stdout / server:stderr
    std::optional<HealthCheckResult> health;
    std::optional<ServerConfig> config;
};

//==========================================================================================================
// LifecycleManager
// Purpose: Owns one state machine per registered server. Flows run as coroutines on the event loop;
//          the returned futures complete when the flow does.
// Notes:
//   Do not block on a returned future from an event listener: listeners run on the loop thread.
//==========================================================================================================
class LifecycleManager : public EventEmitter<LifecycleEvent> {
public:
    explicit LifecycleManager(EventLoop& loop, LifecycleOptions options = {});
    ~LifecycleManager() override;

    ////////////////////////////////////////// Registration //////////////////////////////////////////
    // Adds or replaces a server's config; a new server starts out stopped. dependsOn seeds dependencies.
    void RegisterServer(const std::string& name, const ServerConfig& config);
    // Force-stops the server if needed, then forgets it.
    std::future<void> UnregisterServer(const std::string& name);
    void SetDependencies(const std::string& name, const std::vector<std::string>& dependencies);
    std::vector<std::string> GetDependencies(const std::string& name) const;

    ////////////////////////////////////////// Start / stop //////////////////////////////////////////
    //==========================================================================================================
    // Starts one server.
    // Args:
    //   name: Registered server.
    //   options: force restarts a running server; waitForReady waits for an in-progress start;
    //            dependencies are started first, in order.
    // Returns:
    //   Future completing once the server is running. Fails with ProcessError (unknown server, spawn
    //   failure, early exit) or TimeoutError (startup timeout).
    //==========================================================================================================
    std::future<void> Start(const std::string& name, StartOptions options = {});
    std::future<void> StartAll();
    // Depth-first start of not-running dependencies, then the server. Cycles fail with ProcessError.
    std::future<void> StartWithDependencies(const std::string& name);

    //==========================================================================================================
    // Stops one server: killSignal (SIGKILL when force), escalating to SIGKILL after shutdownTimeout.
    // Returns:
    //   Future completing once the process has exited.
    //==========================================================================================================
    std::future<void> Stop(const std::string& name, StopOptions options = {});
    // Stops running/starting servers. Failures are aggregated into one error unless force.
    std::future<void> StopAll(bool force = false);

    // Stops if needed, increments restartCount, waits the backoff delay and starts again.
    std::future<void> Restart(const std::string& name);
    // Restarts every server; failures are reported as server:error events.
    std::future<void> RestartAll();

    // min(restartDelay * 2^min(restartCount-1, 6), 60s)
    std::chrono::milliseconds CalculateBackoffDelay(int restartCount) const;

    ////////////////////////////////////////// Health //////////////////////////////////////////
    HealthCheckResult HealthCheck(const std::string& name);
    std::vector<std::pair<std::string, HealthCheckResult>> HealthCheckAll();

    // Stops the server if running, swaps its config, emits config:changed and starts it again if it was running.
    std::future<void> OnConfigChange(const std::string& name, const ServerConfig& config);

    // Writes raw bytes to the server's stdin.
    std::future<void> WriteStdin(const std::string& name, const std::string& data);

    ////////////////////////////////////////// Queries //////////////////////////////////////////
    ServerState GetState(const std::string& name) const;
    std::optional<ServerProcess> GetProcess(const std::string& name) const;
    std::vector<ServerProcess> GetAllProcesses() const;
    bool IsRunning(const std::string& name) const;
    std::vector<std::string> GetRunningServers() const;
    std::optional<ServerStats> GetStats(const std::string& name) const;
    std::optional<ServerConfig> GetConfig(const std::string& name) const;

    // Cancels every timer, force-stops all servers, clears all tables and listeners. Blocks until the
    // children have exited unless called on the loop thread.
    void Cleanup();

private:
    struct Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace mcprt
