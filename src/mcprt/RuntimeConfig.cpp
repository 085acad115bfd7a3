//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RuntimeConfig.cpp
// Purpose: JSON config parsing with key-level error reporting
//==========================================================================================================

#include "mcprt/RuntimeConfig.h"

#include <fstream>
#include <sstream>

#include "logging/Logger.h"
#include "mcprt/errors/Errors.h"
#include "mcprt/version.h"

namespace mcprt {

using std::chrono::milliseconds;

namespace {

[[noreturn]] void fail(const std::string& path, const std::string& what) {
    throw errors::ConfigError("Invalid config at " + path + ": " + what);
}

const JSONValue::Object& asObject(const JSONValue& v, const std::string& path) {
    if (!v.IsObject()) fail(path, "expected an object");
    return std::get<JSONValue::Object>(v.value);
}

const JSONValue::Array& asArray(const JSONValue& v, const std::string& path) {
    if (!v.IsArray()) fail(path, "expected an array");
    return std::get<JSONValue::Array>(v.value);
}

std::string asString(const JSONValue& v, const std::string& path) {
    if (!v.IsString()) fail(path, "expected a string");
    return std::get<std::string>(v.value);
}

bool asBool(const JSONValue& v, const std::string& path) {
    if (!v.IsBool()) fail(path, "expected a boolean");
    return std::get<bool>(v.value);
}

int64_t asNonNegative(const JSONValue& v, const std::string& path) {
    auto n = AsNumber(v);
    if (!n || *n < 0 || *n != static_cast<double>(static_cast<int64_t>(*n))) {
        fail(path, "expected a non-negative integer");
    }
    return static_cast<int64_t>(*n);
}

std::vector<std::string> asStringList(const JSONValue& v, const std::string& path) {
    std::vector<std::string> out;
    const auto& arr = asArray(v, path);
    for (std::size_t i = 0; i < arr.size(); ++i) {
        out.push_back(asString(*arr[i], path + "[" + std::to_string(i) + "]"));
    }
    return out;
}

LoggingLevel asLoggingLevel(const JSONValue& v, const std::string& path) {
    auto level = loggingLevelFromString(asString(v, path));
    if (!level) fail(path, "unknown logging level");
    return *level;
}

// Calls fn(value, path) for a member when present.
template <typename Fn>
void with(const JSONValue::Object& obj, const std::string& base, const char* key, Fn&& fn) {
    auto it = obj.find(key);
    if (it != obj.end() && it->second) fn(*it->second, base + "." + key);
}

ServerConfig parseServer(const JSONValue& v, const std::string& path) {
    const auto& obj = asObject(v, path);
    ServerConfig cfg;
    with(obj, path, "type", [&](const JSONValue& x, const std::string& p) { cfg.type = asString(x, p); });
    if (cfg.type != "stdio") fail(path + ".type", "unsupported server type '" + cfg.type + "'");
    with(obj, path, "command", [&](const JSONValue& x, const std::string& p) { cfg.command = asString(x, p); });
    if (cfg.command.empty()) fail(path + ".command", "missing command");
    with(obj, path, "args", [&](const JSONValue& x, const std::string& p) { cfg.args = asStringList(x, p); });
    with(obj, path, "env", [&](const JSONValue& x, const std::string& p) {
        for (const auto& [k, val] : asObject(x, p)) cfg.env[k] = asString(*val, p + "." + k);
    });
    with(obj, path, "dependsOn", [&](const JSONValue& x, const std::string& p) { cfg.dependsOn = asStringList(x, p); });
    return cfg;
}

void parseLifecycle(const JSONValue& v, const std::string& path, LifecycleOptions& o) {
    const auto& obj = asObject(v, path);
    auto ms = [&](const char* key, milliseconds& out) {
        with(obj, path, key, [&](const JSONValue& x, const std::string& p) { out = milliseconds(asNonNegative(x, p)); });
    };
    auto count = [&](const char* key, int& out) {
        with(obj, path, key, [&](const JSONValue& x, const std::string& p) { out = static_cast<int>(asNonNegative(x, p)); });
    };
    ms("startupTimeoutMs", o.startupTimeout);
    ms("shutdownTimeoutMs", o.shutdownTimeout);
    ms("restartDelayMs", o.restartDelay);
    ms("healthCheckIntervalMs", o.healthCheckInterval);
    ms("readyGraceMs", o.readyGrace);
    count("maxRestarts", o.maxRestarts);
    count("maxConsecutiveFailures", o.maxConsecutiveFailures);
    count("healthFailureThreshold", o.healthFailureThreshold);
    if (o.healthCheckInterval.count() == 0) fail(path + ".healthCheckIntervalMs", "must be positive");
}

void parseLogging(const JSONValue& v, const std::string& path, LoggingSettings& s) {
    const auto& obj = asObject(v, path);
    with(obj, path, "level", [&](const JSONValue& x, const std::string& p) { s.level = asString(x, p); });
    with(obj, path, "file", [&](const JSONValue& x, const std::string& p) { s.file = asString(x, p); });
    with(obj, path, "serverDefaultLevel", [&](const JSONValue& x, const std::string& p) {
        s.serverLogs.defaultLevel = asLoggingLevel(x, p);
    });
    with(obj, path, "maxEntries", [&](const JSONValue& x, const std::string& p) {
        s.serverLogs.maxEntries = static_cast<std::size_t>(asNonNegative(x, p));
    });
    with(obj, path, "echo", [&](const JSONValue& x, const std::string& p) { s.serverLogs.echoToLogger = asBool(x, p); });
    with(obj, path, "servers", [&](const JSONValue& x, const std::string& p) {
        for (const auto& [name, level] : asObject(x, p)) s.serverLevels[name] = asLoggingLevel(*level, p + "." + name);
    });
}

} // namespace

RuntimeConfig::RuntimeConfig() : clientInfo("mcprt", getVersionString()) {
    rootsOptions.validatePaths = false;
}

RuntimeConfig RuntimeConfig::FromJSON(const JSONValue& document) {
    FUNC_SCOPE();
    RuntimeConfig cfg;
    const auto& root = asObject(document, "$");

    with(root, "$", "mcpServers", [&](const JSONValue& v, const std::string& p) {
        for (const auto& [name, server] : asObject(v, p)) {
            if (name.empty()) fail(p, "server name must not be empty");
            cfg.servers[name] = parseServer(*server, p + "." + name);
        }
    });
    for (const auto& [name, server] : cfg.servers) {
        for (const auto& dep : server.dependsOn) {
            if (cfg.servers.count(dep) == 0) {
                fail("$.mcpServers." + name + ".dependsOn", "unknown server '" + dep + "'");
            }
        }
    }

    with(root, "$", "lifecycle", [&](const JSONValue& v, const std::string& p) { parseLifecycle(v, p, cfg.lifecycle); });
    with(root, "$", "protocol", [&](const JSONValue& v, const std::string& p) {
        with(asObject(v, p), p, "requestTimeoutMs", [&](const JSONValue& x, const std::string& q) {
            cfg.protocol.requestTimeout = milliseconds(asNonNegative(x, q));
        });
    });
    with(root, "$", "sampling", [&](const JSONValue& v, const std::string& p) {
        const auto& obj = asObject(v, p);
        with(obj, p, "timeoutMs", [&](const JSONValue& x, const std::string& q) {
            cfg.sampling.defaultTimeout = milliseconds(asNonNegative(x, q));
        });
        with(obj, p, "maxConcurrentRequests", [&](const JSONValue& x, const std::string& q) {
            cfg.sampling.maxConcurrentRequests = static_cast<std::size_t>(asNonNegative(x, q));
        });
    });
    with(root, "$", "notifications", [&](const JSONValue& v, const std::string& p) {
        with(asObject(v, p), p, "maxHistory", [&](const JSONValue& x, const std::string& q) {
            cfg.maxNotificationHistory = static_cast<std::size_t>(asNonNegative(x, q));
        });
    });
    with(root, "$", "logging", [&](const JSONValue& v, const std::string& p) { parseLogging(v, p, cfg.logging); });
    with(root, "$", "roots", [&](const JSONValue& v, const std::string& p) {
        const auto& arr = asArray(v, p);
        for (std::size_t i = 0; i < arr.size(); ++i) {
            const std::string ip = p + "[" + std::to_string(i) + "]";
            const auto& obj = asObject(*arr[i], ip);
            Root r;
            with(obj, ip, "uri", [&](const JSONValue& x, const std::string& q) { r.uri = asString(x, q); });
            if (r.uri.empty()) fail(ip + ".uri", "missing uri");
            with(obj, ip, "name", [&](const JSONValue& x, const std::string& q) { r.name = asString(x, q); });
            cfg.roots.push_back(std::move(r));
        }
    });
    with(root, "$", "rootsOptions", [&](const JSONValue& v, const std::string& p) {
        const auto& obj = asObject(v, p);
        with(obj, p, "validatePaths", [&](const JSONValue& x, const std::string& q) {
            cfg.rootsOptions.validatePaths = asBool(x, q);
        });
        with(obj, p, "allowDynamicRoots", [&](const JSONValue& x, const std::string& q) {
            cfg.rootsOptions.allowDynamicRoots = asBool(x, q);
        });
    });
    with(root, "$", "clientInfo", [&](const JSONValue& v, const std::string& p) {
        const auto& obj = asObject(v, p);
        with(obj, p, "name", [&](const JSONValue& x, const std::string& q) { cfg.clientInfo.name = asString(x, q); });
        with(obj, p, "version", [&](const JSONValue& x, const std::string& q) { cfg.clientInfo.version = asString(x, q); });
    });
    return cfg;
}

RuntimeConfig RuntimeConfig::Parse(const std::string& text) {
    JSONValue document;
    try {
        document = ParseJSON(text);
    } catch (const errors::ParseError& e) {
        throw errors::ConfigError(std::string("Config is not valid JSON: ") + e.what());
    }
    return FromJSON(document);
}

RuntimeConfig RuntimeConfig::LoadFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw errors::ConfigError("Cannot open config file: " + path);
    }
    std::stringstream ss;
    ss << in.rdbuf();
    LOG_DEBUG("Loaded config file {} ({} bytes)", path, ss.str().size());
    return Parse(ss.str());
}

} // namespace mcprt
