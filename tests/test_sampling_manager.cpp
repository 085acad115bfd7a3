//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_sampling_manager.cpp
// Purpose: Sampling request validation, concurrency cap, timeout and cancellation
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcprt/EventLoop.h"
#include "mcprt/SamplingManager.h"
#include "mcprt/errors/Errors.h"
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace mcprt;
using namespace std::chrono_literals;

namespace {

JSONValue validParams(int64_t maxTokens = 64) {
    JSONValue message = MakeObject({{"role", JSONValue{std::string("user")}},
                                    {"content", MakeObject({{"type", JSONValue{std::string("text")}},
                                                            {"text", JSONValue{std::string("hello")}}})}});
    return MakeObject({{"messages", MakeArray({message})}, {"maxTokens", JSONValue{maxTokens}}});
}

CreateMessageResult textResult(const std::string& text, const std::string& model = "test-model") {
    CreateMessageResult r;
    r.content = MakeObject({{"type", JSONValue{std::string("text")}}, {"text", JSONValue{text}}});
    r.model = model;
    r.stopReason = "endTurn";
    return r;
}

SamplingCallback immediate(CreateMessageResult result) {
    return [result](const CreateMessageParams&, std::stop_token) {
        std::promise<CreateMessageResult> p;
        p.set_value(result);
        return p.get_future();
    };
}

} // namespace

TEST(SamplingManager, FailsWithoutCallback) {
    EventLoop loop;
    SamplingManager mgr(loop);
    auto fut = mgr.HandleSamplingRequest("alpha", validParams());
    try {
        fut.get();
        FAIL() << "expected ProtocolError";
    } catch (const errors::ProtocolError& e) {
        EXPECT_NE(std::string(e.what()).find("No sampling callback registered for server: alpha"), std::string::npos);
    }
}

TEST(SamplingManager, ResolvesCallbackResult) {
    EventLoop loop;
    SamplingManager mgr(loop);
    std::string completedFor;
    mgr.On("request:complete", [&](const SamplingEvent& ev) { completedFor = ev.serverName; });
    int64_t seenMaxTokens = 0;
    mgr.RegisterCallback("alpha", [&](const CreateMessageParams& p, std::stop_token) {
        seenMaxTokens = p.maxTokens;
        std::promise<CreateMessageResult> pr;
        pr.set_value(textResult("hi there"));
        return pr.get_future();
    });
    EXPECT_TRUE(mgr.HasCallback("alpha"));

    auto fut = mgr.HandleSamplingRequest("alpha", validParams(32));
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    auto result = fut.get();
    EXPECT_EQ(result.model, "test-model");
    EXPECT_EQ(GetString(result.content, "text").value_or(""), "hi there");
    EXPECT_EQ(seenMaxTokens, 32);
    EXPECT_EQ(mgr.GetPendingCount(), 0u);
    EXPECT_EQ(completedFor, "alpha");
}

TEST(SamplingManager, RejectsInvalidParams) {
    EventLoop loop;
    SamplingManager mgr(loop);
    std::atomic<int> calls{0};
    mgr.RegisterCallback("alpha", [&](const CreateMessageParams&, std::stop_token) {
        ++calls;
        std::promise<CreateMessageResult> p;
        p.set_value(textResult("x"));
        return p.get_future();
    });
    EXPECT_THROW(mgr.HandleSamplingRequest("alpha", validParams(0)).get(), errors::ValidationError);
    EXPECT_THROW(mgr.HandleSamplingRequest("alpha", MakeObject({{"maxTokens", JSONValue{static_cast<int64_t>(5)}}})).get(),
                 errors::ValidationError);
    EXPECT_EQ(calls.load(), 0);
}

TEST(SamplingManager, RejectsInvalidCallbackResult) {
    EventLoop loop;
    SamplingManager mgr(loop);
    mgr.RegisterCallback("alpha", immediate(textResult("no model", "")));
    EXPECT_THROW(mgr.HandleSamplingRequest("alpha", validParams()).get(), errors::ValidationError);
}

TEST(SamplingManager, EnforcesConcurrencyCap) {
    EventLoop loop;
    SamplingManager mgr(loop, SamplingOptions{std::chrono::milliseconds(5000), 1});
    std::promise<CreateMessageResult> gate;
    auto shared = gate.get_future().share();
    mgr.RegisterCallback("alpha", [shared](const CreateMessageParams&, std::stop_token) {
        return std::async(std::launch::async, [shared]() { return shared.get(); });
    });

    auto first = mgr.HandleSamplingRequest("alpha", validParams());
    EXPECT_EQ(mgr.GetPendingCount(), 1u);
    auto second = mgr.HandleSamplingRequest("alpha", validParams());
    try {
        second.get();
        FAIL() << "expected ProtocolError";
    } catch (const errors::ProtocolError& e) {
        EXPECT_NE(std::string(e.what()).find("Too many concurrent"), std::string::npos);
    }
    gate.set_value(textResult("done"));
    EXPECT_EQ(first.get().model, "test-model");
}

TEST(SamplingManager, TimesOutAndSignalsCallback) {
    EventLoop loop;
    SamplingManager mgr(loop);
    auto stopped = std::make_shared<std::promise<void>>();
    auto pending = std::make_shared<std::promise<CreateMessageResult>>();
    mgr.RegisterCallback("alpha", [stopped, pending](const CreateMessageParams&, std::stop_token stop) {
        std::thread([stop, stopped]() {
            for (int i = 0; i < 400 && !stop.stop_requested(); ++i) std::this_thread::sleep_for(5ms);
            if (stop.stop_requested()) stopped->set_value();
        }).detach();
        return pending->get_future();
    });

    auto fut = mgr.HandleSamplingRequest("alpha", validParams(), 30ms);
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_THROW(fut.get(), errors::TimeoutError);
    EXPECT_EQ(stopped->get_future().wait_for(2s), std::future_status::ready);
    EXPECT_EQ(mgr.GetPendingCount(), 0u);

    // A result that arrives after the timeout is discarded.
    pending->set_value(textResult("late"));
}

TEST(SamplingManager, CancelServerRequests) {
    EventLoop loop;
    SamplingManager mgr(loop);
    auto pending = std::make_shared<std::promise<CreateMessageResult>>();
    mgr.RegisterCallback("alpha", [pending](const CreateMessageParams&, std::stop_token) {
        return pending->get_future();
    });
    int cancelledEvents = 0;
    mgr.On("request:cancelled", [&](const SamplingEvent&) { ++cancelledEvents; });

    auto fut = mgr.HandleSamplingRequest("alpha", validParams());
    ASSERT_EQ(mgr.GetServerPendingRequests("alpha").size(), 1u);
    EXPECT_EQ(mgr.GetStats().pendingRequests, 1u);
    EXPECT_EQ(mgr.CancelServerRequests("alpha"), 1u);
    try {
        fut.get();
        FAIL() << "expected CancellationError";
    } catch (const errors::CancellationError& e) {
        EXPECT_EQ(e.Reason(), errors::CancellationReason::UserCancelled);
    }
    EXPECT_EQ(cancelledEvents, 1);
    EXPECT_FALSE(mgr.CancelRequest("unknown"));
    pending->set_value(textResult("late"));
}

TEST(SamplingManager, CleanupRejectsPendingAndDropsCallbacks) {
    EventLoop loop;
    SamplingManager mgr(loop);
    auto pending = std::make_shared<std::promise<CreateMessageResult>>();
    mgr.RegisterCallback("alpha", [pending](const CreateMessageParams&, std::stop_token) {
        return pending->get_future();
    });
    auto fut = mgr.HandleSamplingRequest("alpha", validParams());
    mgr.Cleanup();
    EXPECT_THROW(fut.get(), errors::CancellationError);
    EXPECT_FALSE(mgr.HasCallback("alpha"));
    EXPECT_EQ(mgr.GetStats().registeredCallbacks, 0u);
    pending->set_value(textResult("late"));
}

namespace {

bool waitersDrain(const SamplingManager& mgr) {
    for (int i = 0; i < 200; ++i) {
        if (mgr.GetStats().callbackWaiters == 0) return true;
        std::this_thread::sleep_for(5ms);
    }
    return false;
}

} // namespace

TEST(SamplingManager, StalledCallbackDoesNotPinAWaiter) {
    // The host never fulfils these futures.
    auto abandoned = std::make_shared<std::vector<std::promise<CreateMessageResult>>>();
    abandoned->reserve(8);
    EventLoop loop;
    SamplingManager mgr(loop);
    mgr.RegisterCallback("alpha", [abandoned](const CreateMessageParams&, std::stop_token) {
        abandoned->emplace_back();
        return abandoned->back().get_future();
    });

    auto timedOut = mgr.HandleSamplingRequest("alpha", validParams(), 30ms);
    EXPECT_EQ(mgr.GetStats().callbackWaiters, 1u);
    EXPECT_THROW(timedOut.get(), errors::TimeoutError);
    EXPECT_TRUE(waitersDrain(mgr));

    auto cancelled = mgr.HandleSamplingRequest("alpha", validParams());
    EXPECT_EQ(mgr.CancelServerRequests("alpha"), 1u);
    EXPECT_THROW(cancelled.get(), errors::CancellationError);
    EXPECT_TRUE(waitersDrain(mgr));

    auto first = mgr.HandleSamplingRequest("alpha", validParams());
    auto second = mgr.HandleSamplingRequest("alpha", validParams());
    EXPECT_EQ(mgr.GetStats().callbackWaiters, 2u);
    mgr.Cleanup();
    EXPECT_THROW(first.get(), errors::CancellationError);
    EXPECT_THROW(second.get(), errors::CancellationError);
    EXPECT_TRUE(waitersDrain(mgr));
    EXPECT_EQ(abandoned->size(), 4u);
}

TEST(SamplingManager, CallbackWithoutFutureFails) {
    EventLoop loop;
    SamplingManager mgr(loop);
    mgr.RegisterCallback("alpha", [](const CreateMessageParams&, std::stop_token) {
        return std::future<CreateMessageResult>{};
    });
    auto fut = mgr.HandleSamplingRequest("alpha", validParams());
    EXPECT_THROW(fut.get(), errors::ProtocolError);
    EXPECT_EQ(mgr.GetPendingCount(), 0u);
    EXPECT_EQ(mgr.GetStats().callbackWaiters, 0u);
}

TEST(SamplingManager, UnregisterCallback) {
    EventLoop loop;
    SamplingManager mgr(loop);
    std::vector<std::string> events;
    mgr.On("*", [&](const SamplingEvent& ev) { events.push_back(ev.type); });
    mgr.RegisterCallback("alpha", immediate(textResult("x")));
    EXPECT_TRUE(mgr.UnregisterCallback("alpha"));
    EXPECT_FALSE(mgr.UnregisterCallback("alpha"));
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0], "callback:registered");
    EXPECT_EQ(events[1], "callback:unregistered");
}
