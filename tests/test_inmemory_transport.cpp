//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_inmemory_transport.cpp
// Purpose: InMemoryTransport basic tests
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcprt/InMemoryTransport.hpp"
#include "mcprt/errors/Errors.h"
#include <future>
#include <chrono>
#include <thread>

using namespace mcprt;

TEST(InMemoryTransport, DeliversInOrder) {
    auto pair = InMemoryTransport::CreatePair();
    auto client = std::move(pair.first);
    auto server = std::move(pair.second);
    client->Start().get();
    server->Start().get();

    client->Send("one").get();
    client->Send("two").get();

    auto first = server->Receive();
    ASSERT_EQ(first.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(first.get(), "one");
    EXPECT_EQ(server->Receive().get(), "two");

    client->Close().get();
    server->Close().get();
}

TEST(InMemoryTransport, PendingReceiveCompletesOnSend) {
    auto pair = InMemoryTransport::CreatePair();
    auto client = std::move(pair.first);
    auto server = std::move(pair.second);
    client->Start().get();
    server->Start().get();

    auto pending = client->Receive();
    EXPECT_EQ(pending.wait_for(std::chrono::milliseconds(20)), std::future_status::timeout);
    std::thread t([&]() { server->Send("{\"jsonrpc\":\"2.0\"}").get(); });
    ASSERT_EQ(pending.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(pending.get(), "{\"jsonrpc\":\"2.0\"}");
    t.join();
}

TEST(InMemoryTransport, ErrorWhenPeerDisconnected) {
    auto pair = InMemoryTransport::CreatePair();
    auto client = std::move(pair.first);
    auto server = std::move(pair.second);
    client->Start().get();
    server->Start().get();

    auto waiting = server->Receive();
    client->Close().get();
    ASSERT_EQ(waiting.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_THROW(waiting.get(), errors::TransportError);
    EXPECT_FALSE(client->IsConnected());
    EXPECT_THROW(client->Send("late").get(), errors::TransportError);
}

TEST(InMemoryTransport, SessionIdsAreDistinct) {
    auto pair = InMemoryTransport::CreatePair();
    EXPECT_FALSE(pair.first->GetSessionId().empty());
    EXPECT_NE(pair.first->GetSessionId(), pair.second->GetSessionId());
}
