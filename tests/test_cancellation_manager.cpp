//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_cancellation_manager.cpp
// Purpose: Cancellation registry: manual, timeout, per-server and global cancellation
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcprt/CancellationManager.h"
#include "mcprt/EventLoop.h"
#include <atomic>
#include <chrono>
#include <future>
#include <thread>

using namespace mcprt;
using namespace std::chrono_literals;

namespace {
JSONRPCId sid(const char* s) { return JSONRPCId{std::string(s)}; }
}

TEST(CancellationManager, RegisterThenUnregister) {
    EventLoop loop;
    CancellationManager mgr(loop);
    std::vector<std::string> seen;
    mgr.On("*", [&](const CancellationEvent& ev) { seen.push_back(ev.type); });

    auto token = mgr.RegisterRequest(sid("r1"), "alpha", "tools/call");
    ASSERT_TRUE(token);
    EXPECT_TRUE(mgr.HasRequest(sid("r1")));
    EXPECT_TRUE(mgr.UnregisterRequest(sid("r1")));
    EXPECT_FALSE(mgr.HasRequest(sid("r1")));
    EXPECT_FALSE(mgr.UnregisterRequest(sid("r1")));
    EXPECT_FALSE(token->IsCancelled());
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], "request:registered");
    EXPECT_EQ(seen[1], "request:unregistered");
}

TEST(CancellationManager, DuplicateIdIsRejected) {
    EventLoop loop;
    CancellationManager mgr(loop);
    mgr.RegisterRequest(sid("dup"), "alpha", "ping");
    EXPECT_THROW(mgr.RegisterRequest(sid("dup"), "alpha", "ping"), errors::ValidationError);
}

TEST(CancellationManager, CancelIsIdempotent) {
    EventLoop loop;
    CancellationManager mgr(loop);
    int callbacks = 0;
    std::stop_source abort;
    CancellableRequestOptions opts;
    opts.abortSource = abort;
    opts.onCancel = [&](CancellationReason r) {
        ++callbacks;
        EXPECT_EQ(r, CancellationReason::UserCancelled);
    };
    auto token = mgr.RegisterRequest(sid("c1"), "alpha", "tools/call", opts);

    auto first = mgr.CancelRequest(sid("c1"));
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(first->success);
    EXPECT_EQ(first->serverName, "alpha");
    EXPECT_FALSE(mgr.CancelRequest(sid("c1")).has_value());
    EXPECT_EQ(callbacks, 1);
    EXPECT_TRUE(abort.stop_requested());
    EXPECT_TRUE(token->IsCancelled());
    EXPECT_EQ(token->Reason().value(), CancellationReason::UserCancelled);
    EXPECT_THROW(token->ThrowIfCancelled(), errors::CancellationError);
}

TEST(CancellationManager, TimeoutCancelsOnce) {
    EventLoop loop;
    CancellationManager mgr(loop);
    std::atomic<int> callbacks{0};
    std::promise<CancellationReason> reason;
    CancellableRequestOptions opts;
    opts.timeout = 10ms;
    opts.onCancel = [&](CancellationReason r) {
        if (callbacks.fetch_add(1) == 0) reason.set_value(r);
    };
    mgr.RegisterRequest(sid("t1"), "alpha", "slow", opts);

    auto fut = reason.get_future();
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(fut.get(), CancellationReason::Timeout);
    std::this_thread::sleep_for(30ms);
    loop.Sync();
    EXPECT_EQ(callbacks.load(), 1);
    EXPECT_FALSE(mgr.HasRequest(sid("t1")));
}

TEST(CancellationManager, UnregisterDisarmsTimeout) {
    EventLoop loop;
    CancellationManager mgr(loop);
    std::atomic<int> callbacks{0};
    CancellableRequestOptions opts;
    opts.timeout = 20ms;
    opts.onCancel = [&](CancellationReason) { ++callbacks; };
    mgr.RegisterRequest(sid("t2"), "alpha", "fast", opts);
    EXPECT_TRUE(mgr.UnregisterRequest(sid("t2")));
    std::this_thread::sleep_for(60ms);
    loop.Sync();
    EXPECT_EQ(callbacks.load(), 0);
}

TEST(CancellationManager, ThrowingCallbackReportsCancelError) {
    EventLoop loop;
    CancellationManager mgr(loop);
    std::string error;
    mgr.On("cancel:error", [&](const CancellationEvent& ev) { error = ev.error; });
    CancellableRequestOptions opts;
    opts.onCancel = [](CancellationReason) { throw std::runtime_error("boom"); };
    auto token = mgr.RegisterRequest(sid("e1"), "alpha", "x", opts);
    EXPECT_TRUE(mgr.CancelRequest(sid("e1")).has_value());
    EXPECT_EQ(error, "boom");
    EXPECT_TRUE(token->IsCancelled());
}

TEST(CancellationManager, NonStandardThrowFromCallbackIsReported) {
    EventLoop loop;
    CancellationManager mgr(loop);
    std::string error;
    mgr.On("cancel:error", [&](const CancellationEvent& ev) { error = ev.error; });
    CancellableRequestOptions opts;
    opts.onCancel = [](CancellationReason) { throw 42; };
    auto token = mgr.RegisterRequest(sid("e2"), "alpha", "x", opts);
    int tokenCallbacks = 0;
    token->OnCancelled([&tokenCallbacks](CancellationReason) {
        ++tokenCallbacks;
        throw 7;
    });
    std::optional<CancellationResult> result;
    EXPECT_NO_THROW(result = mgr.CancelRequest(sid("e2")));
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->success);
    EXPECT_EQ(error, "unknown exception");
    EXPECT_TRUE(token->IsCancelled());
    EXPECT_EQ(tokenCallbacks, 1);
    EXPECT_FALSE(mgr.HasRequest(sid("e2")));
}

TEST(CancellationManager, CancelServerRequestsOnlyTouchesThatServer) {
    EventLoop loop;
    CancellationManager mgr(loop);
    std::size_t reported = 0;
    mgr.On("server:cancelled", [&](const CancellationEvent& ev) { reported = ev.count; });
    mgr.RegisterRequest(sid("a1"), "alpha", "x");
    mgr.RegisterRequest(sid("a2"), "alpha", "y");
    mgr.RegisterRequest(sid("b1"), "beta", "x");

    auto results = mgr.CancelServerRequests("alpha");
    EXPECT_EQ(results.size(), 2u);
    EXPECT_EQ(reported, 2u);
    for (const auto& r : results) EXPECT_EQ(r.reason, CancellationReason::Shutdown);
    EXPECT_TRUE(mgr.HasRequest(sid("b1")));
    EXPECT_EQ(mgr.GetServerRequests("alpha").size(), 0u);
}

TEST(CancellationManager, CancelAllEmptiesRegistry) {
    EventLoop loop;
    CancellationManager mgr(loop);
    std::size_t reported = 0;
    mgr.On("all:cancelled", [&](const CancellationEvent& ev) { reported = ev.count; });
    mgr.RegisterRequest(sid("a1"), "alpha", "x");
    mgr.RegisterRequest(sid("b1"), "beta", "x");
    EXPECT_EQ(mgr.CancelAll().size(), 2u);
    EXPECT_EQ(reported, 2u);
    EXPECT_TRUE(mgr.GetAllRequests().empty());
    EXPECT_TRUE(mgr.CancelAll().empty());
}

TEST(CancellationManager, StatsGroupByServerAndMethod) {
    EventLoop loop;
    CancellationManager mgr(loop);
    mgr.RegisterRequest(sid("a1"), "alpha", "tools/call");
    mgr.RegisterRequest(sid("a2"), "alpha", "ping");
    mgr.RegisterRequest(sid("b1"), "beta", "tools/call");
    auto stats = mgr.GetStats();
    EXPECT_EQ(stats.totalActive, 3u);
    ASSERT_TRUE(stats.oldestRequestAge.has_value());
    std::size_t alpha = 0;
    for (const auto& [server, n] : stats.byServer) {
        if (server == "alpha") alpha = n;
    }
    EXPECT_EQ(alpha, 2u);
    std::size_t calls = 0;
    for (const auto& [method, n] : stats.byMethod) {
        if (method == "tools/call") calls = n;
    }
    EXPECT_EQ(calls, 2u);
    EXPECT_EQ(mgr.GetRequestDurations().size(), 3u);
    EXPECT_EQ(mgr.FindLongRunningRequests(1h).size(), 0u);
    std::this_thread::sleep_for(5ms);
    EXPECT_EQ(mgr.FindLongRunningRequests(1ms).size(), 3u);
}

TEST(CancellationToken, CombinedTokenFollowsFirstInput) {
    auto a = CancellationToken::Create();
    auto b = CancellationToken::Create();
    auto combined = CombineTokens({a, b});
    EXPECT_FALSE(combined->IsCancelled());
    EXPECT_TRUE(b->Cancel(CancellationReason::Timeout));
    EXPECT_TRUE(combined->IsCancelled());
    EXPECT_EQ(combined->Reason().value(), CancellationReason::Timeout);
    EXPECT_TRUE(a->Cancel(CancellationReason::Error));
    EXPECT_EQ(combined->Reason().value(), CancellationReason::Timeout);
}

TEST(CancellationToken, FirstCancelWins) {
    auto t = CancellationToken::Create();
    int calls = 0;
    t->OnCancelled([&](CancellationReason) { ++calls; });
    EXPECT_TRUE(t->Cancel(CancellationReason::Shutdown));
    EXPECT_FALSE(t->Cancel(CancellationReason::Timeout));
    EXPECT_EQ(t->Reason().value(), CancellationReason::Shutdown);
    int late = 0;
    t->OnCancelled([&](CancellationReason r) {
        ++late;
        EXPECT_EQ(r, CancellationReason::Shutdown);
    });
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(late, 1);
}

TEST(CancellationManager, NotificationParams) {
    auto withReason = CancellationManager::CreateCancellationNotification(JSONRPCId{static_cast<int64_t>(5)}, "timeout");
    EXPECT_EQ(GetInteger(withReason, "requestId").value_or(0), 5);
    EXPECT_EQ(GetString(withReason, "reason").value_or(""), "timeout");
    auto bare = CancellationManager::CreateCancellationNotification(sid("x"));
    EXPECT_EQ(GetString(bare, "requestId").value_or(""), "x");
    EXPECT_EQ(FindMember(bare, "reason"), nullptr);
}
