//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_protocol_engine.cpp
// Purpose: Request/response correlation, timeouts, cancellation and message validation
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcprt/EventLoop.h"
#include "mcprt/InMemoryTransport.hpp"
#include "mcprt/ProtocolEngine.h"
#include "mcprt/errors/Errors.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <set>
#include <thread>

using namespace mcprt;
using namespace std::chrono_literals;

namespace {

// Client-side engine wired to an in-memory peer. The peer answers each request with responder().
class EngineHarness {
public:
    using Responder = std::function<std::vector<std::string>(const JSONRPCRequest&)>;

    explicit EngineHarness(Responder r, std::chrono::milliseconds timeout = 2000ms)
        : engine(loop, ProtocolOptions{timeout}), responder(std::move(r)) {
        auto pair = InMemoryTransport::CreatePair();
        client = std::move(pair.first);
        peer = std::move(pair.second);
        client->Start().get();
        peer->Start().get();
        peerThread = std::thread([this]() { runPeer(); });
        pumpThread = std::thread([this]() { runPump(); });
    }

    ~EngineHarness() {
        client->Close().get();
        peer->Close().get();
        peerThread.join();
        pumpThread.join();
        engine.Cleanup();
    }

    EventLoop loop;
    ProtocolEngine engine;
    std::unique_ptr<InMemoryTransport> client;
    std::unique_ptr<InMemoryTransport> peer;
    std::atomic<int> lateResponsesIgnored{0};

private:
    void runPeer() {
        for (;;) {
            std::string raw;
            try {
                raw = peer->Receive().get();
            } catch (const std::exception&) {
                return;
            }
            auto msg = ProtocolEngine::ParseMessage(raw);
            if (auto* req = std::get_if<JSONRPCRequest>(&msg)) {
                for (const auto& out : responder(*req)) peer->Send(out).get();
            }
        }
    }

    void runPump() {
        for (;;) {
            std::string raw;
            try {
                raw = client->Receive().get();
            } catch (const std::exception&) {
                return;
            }
            auto msg = ProtocolEngine::ParseMessage(raw);
            if (auto* resp = std::get_if<JSONRPCResponse>(&msg)) {
                if (!engine.HandleResponse(*resp)) ++lateResponsesIgnored;
            }
        }
    }

    Responder responder;
    std::thread peerThread;
    std::thread pumpThread;
};

std::string okResponse(const JSONRPCId& id, JSONValue result) {
    return JSONRPCResponse(id, std::move(result)).Serialize();
}

// Records outbound messages; optionally fails every Send with TransportError.
class RecordingTransport : public ITransport {
public:
    explicit RecordingTransport(bool failSends = false) : failSends(failSends) {}

    std::future<void> Start() override { return ready(); }
    std::future<void> Close() override { return ready(); }
    bool IsConnected() const override { return true; }
    std::string GetSessionId() const override { return "recording"; }

    std::future<void> Send(const std::string& message) override {
        std::promise<void> p;
        if (failSends) {
            p.set_exception(std::make_exception_ptr(errors::TransportError("pipe closed")));
        } else {
            std::lock_guard<std::mutex> lock(mutex);
            sent.push_back(message);
            p.set_value();
        }
        return p.get_future();
    }

    std::future<std::string> Receive() override {
        std::promise<std::string> p;
        p.set_exception(std::make_exception_ptr(errors::TransportError("not readable")));
        return p.get_future();
    }

    std::vector<std::string> Sent() {
        std::lock_guard<std::mutex> lock(mutex);
        return sent;
    }

private:
    static std::future<void> ready() {
        std::promise<void> p;
        p.set_value();
        return p.get_future();
    }

    bool failSends;
    std::mutex mutex;
    std::vector<std::string> sent;
};

} // namespace

TEST(ProtocolEngine, HappyPathResolvesResult) {
    EngineHarness h([](const JSONRPCRequest& req) {
        return std::vector<std::string>{okResponse(req.id, MakeObject({{"echo", JSONValue{req.method}}}))};
    });
    auto fut = h.engine.SendRequest(*h.client, "custom/method");
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    auto result = fut.get();
    EXPECT_EQ(GetString(result, "echo").value_or(""), "custom/method");
    EXPECT_EQ(h.engine.PendingCount(), 0u);
}

TEST(ProtocolEngine, RemoteErrorCarriesPeerCode) {
    EngineHarness h([](const JSONRPCRequest& req) {
        return std::vector<std::string>{
            CreateErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound, "Method not found")->Serialize()};
    });
    auto fut = h.engine.SendRequest(*h.client, "nope");
    try {
        fut.get();
        FAIL() << "expected RemoteError";
    } catch (const errors::RemoteError& e) {
        EXPECT_EQ(e.Code(), JSONRPCErrorCodes::MethodNotFound);
        EXPECT_EQ(e.Error().category, errors::ErrorCategory::JsonRpcMethodNotFound);
    }
}

TEST(ProtocolEngine, TimeoutLeavesNoPendingEntry) {
    EngineHarness h([](const JSONRPCRequest&) { return std::vector<std::string>{}; }, 50ms);
    auto fut = h.engine.SendRequest(*h.client, "slow/method");
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    try {
        fut.get();
        FAIL() << "expected TimeoutError";
    } catch (const errors::TimeoutError& e) {
        EXPECT_NE(std::string(e.what()).find("timed out"), std::string::npos);
    }
    EXPECT_EQ(h.engine.PendingCount(), 0u);
}

TEST(ProtocolEngine, DuplicateResponseIsIgnored) {
    EngineHarness h([](const JSONRPCRequest& req) {
        auto first = okResponse(req.id, MakeObject({{"n", JSONValue{static_cast<int64_t>(1)}}}));
        auto second = okResponse(req.id, MakeObject({{"n", JSONValue{static_cast<int64_t>(2)}}}));
        return std::vector<std::string>{first, second};
    });
    auto result = h.engine.SendRequest(*h.client, "twice").get();
    EXPECT_EQ(GetInteger(result, "n").value_or(0), 1);
    for (int i = 0; i < 100 && h.lateResponsesIgnored.load() == 0; ++i) std::this_thread::sleep_for(10ms);
    EXPECT_EQ(h.lateResponsesIgnored.load(), 1);
}

TEST(ProtocolEngine, CancelPendingRejectsWithReason) {
    EngineHarness h([](const JSONRPCRequest&) { return std::vector<std::string>{}; });
    JSONRPCId id{std::string("cancel-me")};
    auto fut = h.engine.SendRequest(*h.client, id, "slow/method");
    EXPECT_TRUE(h.engine.HasPending(id));
    EXPECT_TRUE(h.engine.CancelPending(id, errors::CancellationReason::UserCancelled));
    EXPECT_FALSE(h.engine.CancelPending(id, errors::CancellationReason::UserCancelled));
    try {
        fut.get();
        FAIL() << "expected CancellationError";
    } catch (const errors::CancellationError& e) {
        EXPECT_EQ(e.Reason(), errors::CancellationReason::UserCancelled);
    }
}

TEST(ProtocolEngine, DuplicateIdIsRejected) {
    EngineHarness h([](const JSONRPCRequest&) { return std::vector<std::string>{}; });
    JSONRPCId id{static_cast<int64_t>(9)};
    auto first = h.engine.SendRequest(*h.client, id, "a");
    auto second = h.engine.SendRequest(*h.client, id, "b");
    EXPECT_THROW(second.get(), errors::ProtocolError);
    h.engine.CancelPending(id, errors::CancellationReason::Shutdown);
    EXPECT_THROW(first.get(), errors::CancellationError);
}

TEST(ProtocolEngine, CleanupRejectsEverything) {
    EngineHarness h([](const JSONRPCRequest&) { return std::vector<std::string>{}; });
    auto a = h.engine.SendRequest(*h.client, "a");
    auto b = h.engine.SendRequest(*h.client, "b");
    EXPECT_EQ(h.engine.PendingCount(), 2u);
    h.engine.Cleanup();
    EXPECT_EQ(h.engine.PendingCount(), 0u);
    EXPECT_THROW(a.get(), errors::CancellationError);
    EXPECT_THROW(b.get(), errors::CancellationError);
}

TEST(ProtocolEngine, InitializeParsesServerInfo) {
    EngineHarness h([](const JSONRPCRequest& req) {
        JSONValue result = MakeObject({
            {"protocolVersion", JSONValue{std::string(PROTOCOL_VERSION)}},
            {"capabilities", MakeObject({{"tools", MakeObject({})}, {"logging", MakeObject({})}})},
            {"serverInfo", MakeObject({{"name", JSONValue{std::string("peer")}}, {"version", JSONValue{std::string("2.1")}}})}});
        return std::vector<std::string>{okResponse(req.id, result)};
    });
    auto params = ProtocolEngine::CreateInitializeParams(Implementation("tester", "0.1"));
    auto result = h.engine.Initialize(*h.client, params).get();
    EXPECT_EQ(result.serverInfo.name, "peer");
    EXPECT_EQ(result.serverInfo.version, "2.1");
    EXPECT_TRUE(result.capabilities.tools);
    EXPECT_TRUE(result.capabilities.logging);
    EXPECT_FALSE(result.capabilities.prompts);
}

TEST(ProtocolEngine, InitializeRejectsUnsupportedServerVersion) {
    EngineHarness h([](const JSONRPCRequest& req) {
        JSONValue result = MakeObject({{"protocolVersion", JSONValue{std::string("1999-01-01")}},
                                       {"capabilities", MakeObject({})},
                                       {"serverInfo", MakeObject({{"name", JSONValue{std::string("old")}}})}});
        return std::vector<std::string>{okResponse(req.id, result)};
    });
    auto fut = h.engine.Initialize(*h.client, ProtocolEngine::CreateInitializeParams(Implementation("t", "1")));
    EXPECT_THROW(fut.get(), errors::ProtocolError);
}

TEST(ProtocolEngine, SendFailureRejectsWithoutWaitingForTimeout) {
    EventLoop loop;
    ProtocolEngine engine(loop, ProtocolOptions{5000ms});
    RecordingTransport broken(true);
    auto t0 = std::chrono::steady_clock::now();
    auto fut = engine.SendRequest(broken, "tools/list");
    ASSERT_EQ(fut.wait_for(1s), std::future_status::ready);
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 1s);
    EXPECT_THROW(fut.get(), errors::TransportError);
    EXPECT_EQ(engine.PendingCount(), 0u);
}

TEST(ProtocolEngine, ResponseAfterTimeoutIsANoOp) {
    EventLoop loop;
    ProtocolEngine engine(loop, ProtocolOptions{30ms});
    RecordingTransport silent;
    auto fut = engine.SendRequest(silent, "slow/method");
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_THROW(fut.get(), errors::TimeoutError);
    ASSERT_EQ(silent.Sent().size(), 1u);

    auto sent = ProtocolEngine::ParseMessage(silent.Sent().front());
    ASSERT_TRUE(std::holds_alternative<JSONRPCRequest>(sent));
    const JSONRPCId id = std::get<JSONRPCRequest>(sent).id;
    JSONRPCResponse late(id, MakeObject({{"ok", JSONValue{true}}}));
    EXPECT_FALSE(engine.HandleResponse(late));
    EXPECT_FALSE(engine.HandleResponse(late));
    EXPECT_EQ(engine.PendingCount(), 0u);

    // The engine keeps working after the late reply.
    auto next = engine.SendRequest(silent, "next/method");
    auto nextSent = ProtocolEngine::ParseMessage(silent.Sent().back());
    EXPECT_TRUE(engine.HandleResponse(JSONRPCResponse(std::get<JSONRPCRequest>(nextSent).id, MakeObject({}))));
    EXPECT_NO_THROW(next.get());
}

TEST(ProtocolEngine, InitializeRejectsUnsupportedClientVersionBeforeSending) {
    EventLoop loop;
    ProtocolEngine engine(loop);
    RecordingTransport transport;
    auto params = ProtocolEngine::CreateInitializeParams(Implementation("tester", "0.1"));
    params.protocolVersion = "1999-01-01";
    auto fut = engine.Initialize(transport, params);
    ASSERT_EQ(fut.wait_for(1s), std::future_status::ready);
    try {
        fut.get();
        FAIL() << "expected ProtocolError";
    } catch (const errors::ProtocolError& e) {
        EXPECT_NE(std::string(e.what()).find("1999-01-01"), std::string::npos);
    }
    EXPECT_TRUE(transport.Sent().empty());
    EXPECT_EQ(engine.PendingCount(), 0u);
}

TEST(ProtocolEngineStatic, GeneratedIdsAreUnique) {
    EventLoop loop;
    ProtocolEngine engine(loop);
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) seen.insert(IdKey(engine.GenerateId()));
    EXPECT_EQ(seen.size(), 1000u);
}

TEST(ProtocolEngineStatic, ValidationListsEveryViolation) {
    auto v = ProtocolEngine::ValidateMessage(ParseJSON(R"({"id":1,"method":5})"));
    EXPECT_FALSE(v.valid);
    ASSERT_GE(v.errors.size(), 2u);
    bool mentionsVersion = false;
    for (const auto& e : v.errors) {
        if (e.find("jsonrpc") != std::string::npos) mentionsVersion = true;
    }
    EXPECT_TRUE(mentionsVersion);
}

TEST(ProtocolEngineStatic, ParseMessageClassifies) {
    auto req = ProtocolEngine::ParseMessage(R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    EXPECT_TRUE(std::holds_alternative<JSONRPCRequest>(req));
    auto note = ProtocolEngine::ParseMessage(R"({"jsonrpc":"2.0","method":"notifications/progress","params":{}})");
    EXPECT_TRUE(std::holds_alternative<JSONRPCNotification>(note));
    auto resp = ProtocolEngine::ParseMessage(R"({"jsonrpc":"2.0","id":"a","result":{}})");
    EXPECT_TRUE(std::holds_alternative<JSONRPCResponse>(resp));

    EXPECT_THROW(ProtocolEngine::ParseMessage("{not json"), errors::ParseError);
    EXPECT_THROW(ProtocolEngine::ParseMessage(R"({"id":1,"method":"ping"})"), errors::ProtocolError);
}

TEST(ProtocolEngineStatic, FormatErrorIncludesCode) {
    auto text = ProtocolEngine::FormatError(CreateErrorObject(JSONRPCErrorCodes::InvalidParams, "bad"));
    EXPECT_EQ(text, "[-32602] bad");
}
