//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_runtime_config.cpp
// Purpose: Runtime config parsing, defaults and key-level error reporting
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcprt/RuntimeConfig.h"
#include "mcprt/errors/Errors.h"
#include <cstdio>
#include <fstream>

using namespace mcprt;
using namespace std::chrono_literals;

namespace {

std::string configErrorOf(const std::string& text) {
    try {
        RuntimeConfig::Parse(text);
    } catch (const errors::ConfigError& e) {
        return e.what();
    }
    return "";
}

} // namespace

TEST(RuntimeConfig, DefaultsWhenEmpty) {
    auto cfg = RuntimeConfig::Parse("{}");
    EXPECT_TRUE(cfg.servers.empty());
    EXPECT_EQ(cfg.lifecycle.maxRestarts, 3);
    EXPECT_EQ(cfg.lifecycle.restartDelay, 1000ms);
    EXPECT_EQ(cfg.protocol.requestTimeout, 30000ms);
    EXPECT_EQ(cfg.sampling.maxConcurrentRequests, 5u);
    EXPECT_EQ(cfg.maxNotificationHistory, 100u);
    EXPECT_EQ(cfg.clientInfo.name, "mcprt");
    EXPECT_FALSE(cfg.clientInfo.version.empty());
}

TEST(RuntimeConfig, ParsesFullDocument) {
    auto cfg = RuntimeConfig::Parse(R"({
        "mcpServers": {
            "files": {"command": "files-server", "args": ["--root", "/tmp"], "env": {"MODE": "ro"}},
            "search": {"type": "stdio", "command": "search-server", "dependsOn": ["files"]}
        },
        "lifecycle": {"maxRestarts": 5, "restartDelayMs": 250, "readyGraceMs": 100, "healthCheckIntervalMs": 5000},
        "protocol": {"requestTimeoutMs": 1500},
        "sampling": {"timeoutMs": 2000, "maxConcurrentRequests": 2},
        "notifications": {"maxHistory": 10},
        "logging": {"level": "debug", "serverDefaultLevel": "warning", "maxEntries": 50, "echo": false,
                    "servers": {"files": "error"}},
        "roots": [{"uri": "file:///work", "name": "work"}, {"uri": "file:///tmp"}],
        "clientInfo": {"name": "host", "version": "9.9"}
    })");

    ASSERT_EQ(cfg.servers.size(), 2u);
    const auto& files = cfg.servers.at("files");
    EXPECT_EQ(files.command, "files-server");
    EXPECT_EQ(files.args, (std::vector<std::string>{"--root", "/tmp"}));
    EXPECT_EQ(files.env.at("MODE"), "ro");
    EXPECT_EQ(cfg.servers.at("search").dependsOn, std::vector<std::string>{"files"});

    EXPECT_EQ(cfg.lifecycle.maxRestarts, 5);
    EXPECT_EQ(cfg.lifecycle.restartDelay, 250ms);
    EXPECT_EQ(cfg.lifecycle.readyGrace, 100ms);
    EXPECT_EQ(cfg.protocol.requestTimeout, 1500ms);
    EXPECT_EQ(cfg.sampling.defaultTimeout, 2000ms);
    EXPECT_EQ(cfg.sampling.maxConcurrentRequests, 2u);
    EXPECT_EQ(cfg.maxNotificationHistory, 10u);

    EXPECT_EQ(cfg.logging.level.value_or(""), "debug");
    EXPECT_EQ(cfg.logging.serverLogs.defaultLevel, LoggingLevel::Warning);
    EXPECT_EQ(cfg.logging.serverLogs.maxEntries, 50u);
    EXPECT_FALSE(cfg.logging.serverLogs.echoToLogger);
    EXPECT_EQ(cfg.logging.serverLevels.at("files"), LoggingLevel::Error);

    ASSERT_EQ(cfg.roots.size(), 2u);
    EXPECT_EQ(cfg.roots[0].name.value_or(""), "work");
    EXPECT_FALSE(cfg.roots[1].name.has_value());
    EXPECT_EQ(cfg.clientInfo.name, "host");
    EXPECT_EQ(cfg.clientInfo.version, "9.9");
}

TEST(RuntimeConfig, ErrorsNameTheOffendingKey) {
    EXPECT_NE(configErrorOf(R"({"mcpServers": {"a": {"type": "sse", "command": "x"}}})").find("$.mcpServers.a.type"),
              std::string::npos);
    EXPECT_NE(configErrorOf(R"({"mcpServers": {"a": {}}})").find("$.mcpServers.a.command"), std::string::npos);
    EXPECT_NE(configErrorOf(R"({"mcpServers": {"a": {"command": "x", "args": [1]}}})").find("$.mcpServers.a.args[0]"),
              std::string::npos);
    EXPECT_NE(configErrorOf(R"({"lifecycle": {"maxRestarts": -1}})").find("$.lifecycle.maxRestarts"),
              std::string::npos);
    EXPECT_NE(configErrorOf(R"({"lifecycle": {"healthCheckIntervalMs": 0}})").find("must be positive"),
              std::string::npos);
    EXPECT_NE(configErrorOf(R"({"logging": {"serverDefaultLevel": "loud"}})").find("unknown logging level"),
              std::string::npos);
    EXPECT_NE(configErrorOf(R"({"roots": [{"name": "x"}]})").find("$.roots[0].uri"), std::string::npos);
}

TEST(RuntimeConfig, RootsOptionsDefaultToLexicalChecks) {
    RuntimeConfig defaults;
    EXPECT_FALSE(defaults.rootsOptions.validatePaths);
    EXPECT_TRUE(defaults.rootsOptions.allowDynamicRoots);

    auto cfg = RuntimeConfig::Parse(R"({"rootsOptions": {"validatePaths": true, "allowDynamicRoots": false}})");
    EXPECT_TRUE(cfg.rootsOptions.validatePaths);
    EXPECT_FALSE(cfg.rootsOptions.allowDynamicRoots);
    EXPECT_NE(configErrorOf(R"({"rootsOptions": {"validatePaths": "yes"}})").find("$.rootsOptions.validatePaths"),
              std::string::npos);
}

TEST(RuntimeConfig, UnknownDependencyIsRejected) {
    auto message = configErrorOf(R"({"mcpServers": {"a": {"command": "x", "dependsOn": ["ghost"]}}})");
    EXPECT_NE(message.find("unknown server 'ghost'"), std::string::npos);
}

TEST(RuntimeConfig, MalformedJsonIsConfigError) {
    EXPECT_NE(configErrorOf("{ not json").find("Config is not valid JSON"), std::string::npos);
    EXPECT_NE(configErrorOf("[]").find("expected an object"), std::string::npos);
}

TEST(RuntimeConfig, LoadsFromFile) {
    const std::string path = ::testing::TempDir() + "mcprt_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"mcpServers": {"solo": {"command": "solo-server"}}})";
    }
    auto cfg = RuntimeConfig::LoadFile(path);
    EXPECT_EQ(cfg.servers.at("solo").command, "solo-server");
    std::remove(path.c_str());

    EXPECT_THROW(RuntimeConfig::LoadFile(path), errors::ConfigError);
}
