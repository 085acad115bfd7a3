//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_lifecycle.cpp
// Purpose: Server supervision: start/stop, crash restarts with backoff, restart budget and dependencies
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcprt/EventLoop.h"
#include "mcprt/LifecycleManager.h"
#include "mcprt/errors/Errors.h"
#include <atomic>
#include <csignal>
#include <chrono>
#include <mutex>
#include <thread>

using namespace mcprt;
using namespace std::chrono_literals;

namespace {

LifecycleOptions fastOptions() {
    LifecycleOptions o;
    o.startupTimeout = 5000ms;
    o.shutdownTimeout = 2000ms;
    o.restartDelay = 10ms;
    o.readyGrace = 50ms;
    o.healthCheckInterval = 60000ms;
    return o;
}

ServerConfig shellServer(const std::string& script, std::vector<std::string> dependsOn = {}) {
    ServerConfig c;
    c.command = "/bin/sh";
    c.args = {"-c", script};
    c.dependsOn = std::move(dependsOn);
    return c;
}

// Records "<type>:<server>" for every lifecycle event.
struct EventLog {
    std::mutex mutex;
    std::vector<std::string> entries;
    std::vector<LifecycleEvent> events;

    void attach(LifecycleManager& mgr) {
        mgr.On("*", [this](const LifecycleEvent& ev) {
            std::lock_guard<std::mutex> lock(mutex);
            entries.push_back(ev.type + ":" + ev.serverName);
            events.push_back(ev);
        });
    }

    std::size_t count(const std::string& type, const std::string& reason = "") {
        std::lock_guard<std::mutex> lock(mutex);
        std::size_t n = 0;
        for (const auto& ev : events) {
            if (ev.type == type && (reason.empty() || ev.reason == reason)) ++n;
        }
        return n;
    }

    bool waitFor(const std::string& type, const std::string& reason, std::chrono::milliseconds limit) {
        auto deadline = std::chrono::steady_clock::now() + limit;
        while (std::chrono::steady_clock::now() < deadline) {
            if (count(type, reason) > 0) return true;
            std::this_thread::sleep_for(10ms);
        }
        return false;
    }

    std::vector<std::string> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return entries;
    }
};

} // namespace

TEST(LifecycleManager, StartAndStop) {
    EventLog log;
    EventLoop loop;
    LifecycleManager mgr(loop, fastOptions());
    log.attach(mgr);
    mgr.RegisterServer("alpha", shellServer("exec sleep 30"));
    EXPECT_EQ(mgr.GetState("alpha"), ServerState::Stopped);

    mgr.Start("alpha").get();
    EXPECT_TRUE(mgr.IsRunning("alpha"));
    auto proc = mgr.GetProcess("alpha");
    ASSERT_TRUE(proc.has_value());
    EXPECT_TRUE(proc->pid.has_value());
    EXPECT_EQ(mgr.GetRunningServers(), std::vector<std::string>{"alpha"});

    auto health = mgr.HealthCheck("alpha");
    EXPECT_TRUE(health.healthy);
    EXPECT_EQ(health.pid, proc->pid);

    mgr.Stop("alpha").get();
    EXPECT_EQ(mgr.GetState("alpha"), ServerState::Stopped);
    EXPECT_FALSE(mgr.HealthCheck("alpha").healthy);
    EXPECT_EQ(log.count("server:starting"), 1u);
    EXPECT_EQ(log.count("server:started"), 1u);
    EXPECT_EQ(log.count("server:stopping"), 1u);
    EXPECT_GE(log.count("server:stopped"), 1u);
    EXPECT_EQ(log.count("server:crashed"), 0u);
}

TEST(LifecycleManager, UnknownServerFails) {
    EventLoop loop;
    LifecycleManager mgr(loop, fastOptions());
    EXPECT_THROW(mgr.Start("ghost").get(), errors::ProcessError);
}

TEST(LifecycleManager, MissingBinaryReportsError) {
    EventLog log;
    EventLoop loop;
    LifecycleManager mgr(loop, fastOptions());
    log.attach(mgr);
    ServerConfig c;
    c.command = "/nonexistent/mcprt-server";
    mgr.RegisterServer("broken", c);
    EXPECT_THROW(mgr.Start("broken").get(), errors::ProcessError);
    EXPECT_EQ(mgr.GetState("broken"), ServerState::Error);
    EXPECT_EQ(log.count("server:error"), 1u);
    auto stats = mgr.GetStats("broken");
    ASSERT_TRUE(stats.has_value());
    EXPECT_TRUE(stats->lastError.has_value());
}

TEST(LifecycleManager, EarlyExitFailsStartup) {
    EventLoop loop;
    auto opts = fastOptions();
    opts.readyGrace = 500ms;
    LifecycleManager mgr(loop, opts);
    mgr.RegisterServer("quick", shellServer("exit 2"));
    EXPECT_THROW(mgr.Start("quick").get(), errors::ProcessError);
    EXPECT_FALSE(mgr.IsRunning("quick"));
}

TEST(LifecycleManager, CleanExitIsStoppedNotCrashed) {
    EventLog log;
    EventLoop loop;
    LifecycleManager mgr(loop, fastOptions());
    log.attach(mgr);
    mgr.RegisterServer("done", shellServer("sleep 0.2; exit 0"));
    mgr.Start("done").get();
    ASSERT_TRUE(log.waitFor("server:stopped", "", 3000ms));
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(mgr.GetState("done"), ServerState::Stopped);
    EXPECT_EQ(log.count("server:crashed"), 0u);
    EXPECT_EQ(mgr.GetProcess("done")->restartCount, 0);
}

TEST(LifecycleManager, CrashRestartsUntilBudgetIsSpent) {
    EventLog log;
    EventLoop loop;
    auto opts = fastOptions();
    opts.maxRestarts = 3;
    LifecycleManager mgr(loop, opts);
    log.attach(mgr);
    mgr.RegisterServer("flaky", shellServer("sleep 0.2; exit 1"));
    mgr.Start("flaky").get();

    ASSERT_TRUE(log.waitFor("server:crashed", "max_restarts_exceeded", 15000ms));
    std::this_thread::sleep_for(500ms);

    auto proc = mgr.GetProcess("flaky");
    ASSERT_TRUE(proc.has_value());
    EXPECT_EQ(proc->restartCount, 3);
    EXPECT_EQ(proc->state, ServerState::Stopped);
    EXPECT_EQ(log.count("server:crashed", "max_restarts_exceeded"), 1u);
    EXPECT_EQ(log.count("server:restarting"), 3u);
    // One crash per run (the first start plus three restarts) and the final budget event.
    EXPECT_EQ(log.count("server:crashed"), 5u);
}

TEST(LifecycleManager, BackoffDoublesAndIsCapped) {
    EventLoop loop;
    auto opts = fastOptions();
    opts.restartDelay = 1000ms;
    LifecycleManager mgr(loop, opts);
    EXPECT_EQ(mgr.CalculateBackoffDelay(1), 1000ms);
    EXPECT_EQ(mgr.CalculateBackoffDelay(2), 2000ms);
    EXPECT_EQ(mgr.CalculateBackoffDelay(3), 4000ms);
    auto previous = 0ms;
    for (int n = 1; n <= 20; ++n) {
        auto d = mgr.CalculateBackoffDelay(n);
        EXPECT_GE(d, previous);
        EXPECT_LE(d, 60000ms);
        previous = d;
    }
    EXPECT_EQ(mgr.CalculateBackoffDelay(20), 60000ms);
}

TEST(LifecycleManager, DependenciesStartFirst) {
    EventLog log;
    EventLoop loop;
    LifecycleManager mgr(loop, fastOptions());
    log.attach(mgr);
    mgr.RegisterServer("db", shellServer("exec sleep 30"));
    mgr.RegisterServer("cache", shellServer("exec sleep 30", {"db"}));
    mgr.RegisterServer("app", shellServer("exec sleep 30", {"cache"}));
    EXPECT_EQ(mgr.GetDependencies("app"), std::vector<std::string>{"cache"});

    mgr.StartWithDependencies("app").get();
    std::vector<std::string> started;
    for (const auto& e : log.snapshot()) {
        if (e.rfind("server:started:", 0) == 0) started.push_back(e.substr(15));
    }
    EXPECT_EQ(started, (std::vector<std::string>{"db", "cache", "app"}));

    mgr.StopAll().get();
    EXPECT_TRUE(mgr.GetRunningServers().empty());
}

TEST(LifecycleManager, DependencyCycleIsRejected) {
    EventLoop loop;
    LifecycleManager mgr(loop, fastOptions());
    mgr.RegisterServer("a", shellServer("exec sleep 30"));
    mgr.RegisterServer("b", shellServer("exec sleep 30"));
    mgr.SetDependencies("a", {"b"});
    mgr.SetDependencies("b", {"a"});
    try {
        mgr.StartWithDependencies("a").get();
        FAIL() << "expected ProcessError";
    } catch (const errors::ProcessError& e) {
        EXPECT_NE(std::string(e.what()).find("cycle"), std::string::npos);
    }
    EXPECT_FALSE(mgr.IsRunning("a"));
    EXPECT_FALSE(mgr.IsRunning("b"));
}

TEST(LifecycleManager, ConfigChangeRestartsRunningServer) {
    EventLog log;
    EventLoop loop;
    LifecycleManager mgr(loop, fastOptions());
    log.attach(mgr);
    mgr.RegisterServer("svc", shellServer("exec sleep 30"));
    mgr.Start("svc").get();
    auto firstPid = mgr.GetProcess("svc")->pid;

    mgr.OnConfigChange("svc", shellServer("exec sleep 31")).get();
    EXPECT_EQ(log.count("config:changed"), 1u);
    EXPECT_TRUE(mgr.IsRunning("svc"));
    EXPECT_NE(mgr.GetProcess("svc")->pid, firstPid);
    ASSERT_TRUE(mgr.GetConfig("svc").has_value());
    EXPECT_EQ(mgr.GetConfig("svc")->args.back(), "exec sleep 31");
    mgr.StopAll().get();
}

TEST(LifecycleManager, StdoutIsForwarded) {
    std::mutex m;
    std::string out;
    EventLoop loop;
    LifecycleManager mgr(loop, fastOptions());
    mgr.On("server:stdout", [&](const LifecycleEvent& ev) {
        std::lock_guard<std::mutex> lock(m);
        out += ev.data;
    });
    mgr.RegisterServer("echoer", shellServer("read line; echo \"ack:$line\"; exec sleep 30"));
    mgr.Start("echoer").get();
    mgr.WriteStdin("echoer", "ping\n").get();
    bool seen = false;
    for (int i = 0; i < 200 && !seen; ++i) {
        {
            std::lock_guard<std::mutex> lock(m);
            seen = out.find("ack:ping") != std::string::npos;
        }
        if (!seen) std::this_thread::sleep_for(10ms);
    }
    EXPECT_TRUE(seen);
    mgr.StopAll().get();
}

TEST(LifecycleManager, StopDuringBackoffCancelsPendingRestart) {
    EventLog log;
    EventLoop loop;
    auto opts = fastOptions();
    opts.restartDelay = 600ms;
    LifecycleManager mgr(loop, opts);
    log.attach(mgr);
    mgr.RegisterServer("flaky", shellServer("sleep 0.3; exit 1"));
    mgr.Start("flaky").get();

    ASSERT_TRUE(log.waitFor("server:crashed", "", 3000ms));
    mgr.Stop("flaky").get();
    EXPECT_EQ(mgr.GetState("flaky"), ServerState::Stopped);

    // Outlasts the backoff delay.
    std::this_thread::sleep_for(1200ms);
    EXPECT_EQ(mgr.GetState("flaky"), ServerState::Stopped);
    EXPECT_EQ(log.count("server:started"), 1u);
    EXPECT_EQ(log.count("server:crashed"), 1u);
    EXPECT_FALSE(mgr.GetProcess("flaky")->pid.has_value());

    // An explicit start still works afterwards.
    mgr.RegisterServer("flaky", shellServer("exec sleep 30"));
    mgr.Start("flaky").get();
    EXPECT_TRUE(mgr.IsRunning("flaky"));
    mgr.StopAll().get();
}

TEST(LifecycleManager, StopEscalatesToSigkillAfterShutdownTimeout) {
    EventLog log;
    EventLoop loop;
    auto opts = fastOptions();
    opts.shutdownTimeout = 300ms;
    LifecycleManager mgr(loop, opts);
    log.attach(mgr);
    mgr.RegisterServer("stubborn", shellServer("trap '' TERM; while :; do sleep 0.05; done"));
    mgr.Start("stubborn").get();
    auto pid = mgr.GetProcess("stubborn")->pid;
    ASSERT_TRUE(pid.has_value());

    auto t0 = std::chrono::steady_clock::now();
    mgr.Stop("stubborn").get();
    auto elapsed = std::chrono::steady_clock::now() - t0;

    EXPECT_GE(elapsed, 250ms);
    EXPECT_LT(elapsed, 5000ms);
    EXPECT_EQ(mgr.GetState("stubborn"), ServerState::Stopped);
    EXPECT_NE(::kill(*pid, 0), 0);
    EXPECT_EQ(log.count("server:crashed"), 0u);
}

TEST(LifecycleManager, PeriodicHealthFailuresDegradeAndRestart) {
    std::atomic<bool> failing{true};
    std::atomic<int> healthCalls{0};
    EventLog log;
    EventLoop loop;
    auto opts = fastOptions();
    opts.healthCheckInterval = 40ms;
    opts.healthFailureThreshold = 3;
    opts.healthCallback = [&](const std::string&, pid_t) {
        ++healthCalls;
        return !failing.load();
    };
    LifecycleManager mgr(loop, opts);
    log.attach(mgr);
    mgr.RegisterServer("sick", shellServer("exec sleep 30"));
    mgr.Start("sick").get();

    ASSERT_TRUE(log.waitFor("health:degraded", "", 3000ms));
    failing = false;
    EXPECT_GE(log.count("health:failed"), 3u);
    EXPECT_GE(healthCalls.load(), 3);

    ASSERT_TRUE(log.waitFor("health:ok", "", 3000ms));
    EXPECT_EQ(log.count("health:degraded"), 1u);
    EXPECT_EQ(log.count("server:restarting"), 1u);
    EXPECT_EQ(log.count("server:started"), 2u);
    EXPECT_TRUE(mgr.IsRunning("sick"));
    EXPECT_EQ(mgr.GetProcess("sick")->restartCount, 1);
    mgr.StopAll().get();
}

TEST(LifecycleManager, WaitForReadyFollowsAStartInProgress) {
    EventLoop loop;
    auto opts = fastOptions();
    opts.readyGrace = 400ms;
    LifecycleManager mgr(loop, opts);
    mgr.RegisterServer("slow", shellServer("exec sleep 30"));

    auto first = mgr.Start("slow");
    for (int i = 0; i < 200 && mgr.GetState("slow") != ServerState::Starting; ++i) {
        std::this_thread::sleep_for(2ms);
    }
    ASSERT_EQ(mgr.GetState("slow"), ServerState::Starting);

    // Without waitForReady a second Start returns while the first is still in its grace period.
    mgr.Start("slow").get();
    EXPECT_EQ(mgr.GetState("slow"), ServerState::Starting);

    StartOptions wait;
    wait.waitForReady = true;
    mgr.Start("slow", wait).get();
    EXPECT_EQ(mgr.GetState("slow"), ServerState::Running);
    first.get();
    mgr.StopAll().get();
}

TEST(LifecycleManager, WaitForReadyReportsFailedStartup) {
    EventLoop loop;
    auto opts = fastOptions();
    opts.readyGrace = 400ms;
    LifecycleManager mgr(loop, opts);
    mgr.RegisterServer("doomed", shellServer("sleep 0.1; exit 3"));

    auto first = mgr.Start("doomed");
    for (int i = 0; i < 200 && mgr.GetState("doomed") != ServerState::Starting; ++i) {
        std::this_thread::sleep_for(2ms);
    }
    StartOptions wait;
    wait.waitForReady = true;
    EXPECT_THROW(mgr.Start("doomed", wait).get(), errors::ProcessError);
    EXPECT_THROW(first.get(), errors::ProcessError);
    EXPECT_EQ(mgr.GetState("doomed"), ServerState::Error);
}
