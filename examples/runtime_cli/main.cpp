//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Runtime example: connects every configured server, lists its tools and optionally calls one
//==========================================================================================================
// Usage:
//   mcprt_runtime_cli --config=servers.json [--server=name --tool=name [--args={"k":"v"}]] [--timeout-ms=N]
//==========================================================================================================

#include "logging/Logger.h"
#include "mcprt/Runtime.h"
#include "mcprt/errors/Errors.h"
#include <chrono>
#include <iostream>
#include <optional>
#include <string>

using namespace mcprt;

//==========================================================================================================
// getArgValue
// Purpose: Parses key=value style CLI options.
// Args:
//   argc: Argument count
//   argv: Argument vector
//   key: Key string including leading dashes (e.g., "--config")
// Returns:
//   Optional string containing the value when present
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (size_t i = 1; i < static_cast<size_t>(argc); ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

static void printTools(Runtime& runtime, const std::string& server) {
    auto tools = runtime.ListTools(server).get();
    std::cout << server << ": " << tools.size() << " tool(s)" << std::endl;
    for (const auto& t : tools) {
        std::cout << "  - " << t.name;
        if (!t.description.empty()) std::cout << ": " << t.description;
        std::cout << std::endl;
    }
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::setLogLevel(LogLevel::LOG_INFO_LEVEL);

    auto configPath = getArgValue(argc, argv, "--config");
    if (!configPath) {
        std::cerr << "usage: " << argv[0]
                  << " --config=servers.json [--server=name --tool=name [--args=JSON]] [--timeout-ms=N]" << std::endl;
        return 2;
    }

    RuntimeConfig config;
    try {
        config = RuntimeConfig::LoadFile(*configPath);
    } catch (const errors::ConfigError& e) {
        std::cerr << e.what() << std::endl;
        return 2;
    }

    Runtime runtime(std::move(config));
    runtime.On("server:disconnected", [](const RuntimeEvent& ev) {
        LOG_WARN("{} disconnected ({})", ev.serverName, ev.reason);
    });
    runtime.Notifications().On("progress", [](const NotificationEvent& ev) {
        if (ev.progress) {
            LOG_INFO("{} progress {}: {}", ev.serverName, ev.progress->progressToken, ev.progress->progress);
        }
    });

    try {
        runtime.ConnectAll().get();
    } catch (const std::exception& e) {
        // Servers that did connect stay usable.
        LOG_ERROR("{}", e.what());
    }

    int status = 0;
    for (const auto& server : runtime.GetConnectedServers()) {
        auto info = runtime.GetServerInfo(server);
        if (info) {
            std::cout << server << " -> " << info->serverInfo.name << " " << info->serverInfo.version << std::endl;
        }
        try {
            printTools(runtime, server);
        } catch (const std::exception& e) {
            LOG_ERROR("tools/list on {} failed: {}", server, e.what());
            status = 1;
        }
    }

    auto server = getArgValue(argc, argv, "--server");
    auto tool = getArgValue(argc, argv, "--tool");
    if (server && tool) {
        RequestOptions options;
        if (auto t = getArgValue(argc, argv, "--timeout-ms")) {
            options.timeout = std::chrono::milliseconds(std::stoll(*t));
        }
        try {
            JSONValue arguments = ParseJSON(getArgValue(argc, argv, "--args").value_or("{}"));
            auto result = runtime.CallTool(*server, *tool, arguments, options).get();
            for (const auto& item : result.content) {
                std::cout << SerializeJSON(item) << std::endl;
            }
            if (result.isError) status = 1;
        } catch (const errors::RemoteError& e) {
            std::cerr << "server error " << e.Code() << ": " << e.what() << std::endl;
            status = 1;
        } catch (const std::exception& e) {
            std::cerr << e.what() << std::endl;
            status = 1;
        }
    }

    runtime.Shutdown();
    return status;
}
