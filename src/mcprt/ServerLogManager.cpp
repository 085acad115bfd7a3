//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerLogManager.cpp
// Purpose: Bounded store of server log records with level filtering and queries
//==========================================================================================================

#include "mcprt/ServerLogManager.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <deque>
#include <format>
#include <map>
#include <mutex>
#include <unordered_map>

#include "logging/Logger.h"

namespace mcprt {

using namespace std::chrono;

namespace {
std::string isoTime(system_clock::time_point tp) {
    std::time_t t = system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    auto ms = duration_cast<milliseconds>(tp.time_since_epoch()).count() % 1000;
    return std::format("{}.{:03}Z", buf, ms);
}

std::string upper(const char* s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

bool matches(const LogEntry& e, const LogFilter& f) {
    if (f.minLevel && e.level < *f.minLevel) return false;
    if (!f.servers.empty() && std::find(f.servers.begin(), f.servers.end(), e.serverName) == f.servers.end()) {
        return false;
    }
    if (!f.loggers.empty()) {
        if (!e.logger || std::find(f.loggers.begin(), f.loggers.end(), *e.logger) == f.loggers.end()) return false;
    }
    if (f.since && e.timestamp < *f.since) return false;
    if (f.until && e.timestamp > *f.until) return false;
    return true;
}

LogEntry copyEntry(const LogEntry& e) {
    LogEntry out = e;
    if (e.data) out.data = e.data->DeepCopy();
    return out;
}
} // namespace

std::string FormatLogEntry(const LogEntry& entry) {
    std::string out = std::format("[{}] [{}] [{}]", isoTime(entry.timestamp), entry.serverName, upper(toString(entry.level)));
    if (entry.logger) out += "[" + *entry.logger + "]";
    out += " " + entry.message;
    if (entry.data && !entry.data->IsNull()) out += " " + SerializeJSON(*entry.data);
    return out;
}

struct ServerLogManager::Impl {
    mutable std::mutex mutex;
    ServerLogOptions options;
    std::unordered_map<std::string, LoggingLevel> serverLevels;
    std::deque<LogEntry> entries;

    explicit Impl(ServerLogOptions o) : options(o) {}
};

ServerLogManager::ServerLogManager(ServerLogOptions options) : pImpl(std::make_unique<Impl>(options)) {}

ServerLogManager::~ServerLogManager() = default;

void ServerLogManager::SetDefaultLevel(LoggingLevel level) {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->options.defaultLevel = level;
    }
    ServerLogEvent ev;
    ev.type = "level:default";
    ev.level = level;
    Emit(ev);
}

void ServerLogManager::SetServerLevel(const std::string& serverName, LoggingLevel level) {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->serverLevels[serverName] = level;
    }
    ServerLogEvent ev;
    ev.type = "level:server";
    ev.serverName = serverName;
    ev.level = level;
    Emit(ev);
}

void ServerLogManager::RemoveServerLevel(const std::string& serverName) {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->serverLevels.erase(serverName) == 0) return;
    }
    ServerLogEvent ev;
    ev.type = "level:removed";
    ev.serverName = serverName;
    Emit(ev);
}

LoggingLevel ServerLogManager::GetServerLevel(const std::string& serverName) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->serverLevels.find(serverName);
    return it == pImpl->serverLevels.end() ? pImpl->options.defaultLevel : it->second;
}

void ServerLogManager::SetEchoToLogger(bool enabled) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->options.echoToLogger = enabled;
}

bool ServerLogManager::Log(const std::string& serverName, LoggingLevel level, const std::string& message,
                           const std::optional<JSONValue>& data, const std::optional<std::string>& logger) {
    LogEntry entry;
    entry.timestamp = system_clock::now();
    entry.level = level;
    entry.serverName = serverName;
    entry.logger = logger;
    entry.message = message;
    if (data) entry.data = data->DeepCopy();

    bool echo = false;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        auto it = pImpl->serverLevels.find(serverName);
        LoggingLevel min = it == pImpl->serverLevels.end() ? pImpl->options.defaultLevel : it->second;
        if (level < min) return false;
        pImpl->entries.push_back(copyEntry(entry));
        while (pImpl->entries.size() > pImpl->options.maxEntries) pImpl->entries.pop_front();
        echo = pImpl->options.echoToLogger;
    }

    if (echo) {
        const std::string line = FormatLogEntry(entry);
        if (level >= LoggingLevel::Error) {
            LOG_ERROR("{}", line);
        } else if (level == LoggingLevel::Warning) {
            LOG_WARN("{}", line);
        } else if (level == LoggingLevel::Debug) {
            LOG_DEBUG("{}", line);
        } else {
            LOG_INFO("{}", line);
        }
    }

    ServerLogEvent ev;
    ev.type = "log";
    ev.serverName = serverName;
    ev.level = level;
    ev.entry = std::move(entry);
    Emit(ev);
    return true;
}

bool ServerLogManager::HandleLogNotification(const std::string& serverName, const std::optional<JSONValue>& params) {
    if (!params || !params->IsObject()) {
        LOG_WARN("Ignoring log notification from {} without params object", serverName);
        return false;
    }
    auto levelName = GetString(*params, "level");
    auto level = levelName ? loggingLevelFromString(*levelName) : std::nullopt;
    if (!level) {
        LOG_WARN("Ignoring log notification from {} with invalid level", serverName);
        return false;
    }
    auto logger = GetString(*params, "logger");
    const JSONValue* data = FindMember(*params, "data");
    if (!data) return Log(serverName, *level, "", std::nullopt, logger);
    if (data->IsString()) return Log(serverName, *level, std::get<std::string>(data->value), std::nullopt, logger);
    return Log(serverName, *level, SerializeJSON(*data), *data, logger);
}

std::vector<LogEntry> ServerLogManager::GetEntries(const LogFilter& filter) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    std::vector<LogEntry> out;
    for (const auto& e : pImpl->entries) {
        if (matches(e, filter)) out.push_back(copyEntry(e));
    }
    return out;
}

std::vector<LogEntry> ServerLogManager::GetRecentEntries(std::size_t count, const LogFilter& filter) const {
    auto all = GetEntries(filter);
    if (all.size() > count) all.erase(all.begin(), all.end() - static_cast<std::ptrdiff_t>(count));
    return all;
}

std::vector<std::pair<LoggingLevel, std::size_t>> ServerLogManager::CountByLevel() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    std::vector<std::pair<LoggingLevel, std::size_t>> counts;
    for (int l = static_cast<int>(LoggingLevel::Debug); l <= static_cast<int>(LoggingLevel::Emergency); ++l) {
        counts.emplace_back(static_cast<LoggingLevel>(l), 0);
    }
    for (const auto& e : pImpl->entries) ++counts[static_cast<std::size_t>(e.level)].second;
    return counts;
}

std::vector<std::pair<std::string, std::size_t>> ServerLogManager::CountByServer() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    std::map<std::string, std::size_t> counts;
    for (const auto& e : pImpl->entries) ++counts[e.serverName];
    return {counts.begin(), counts.end()};
}

void ServerLogManager::Clear() {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->entries.clear();
    }
    ServerLogEvent ev;
    ev.type = "cleared";
    Emit(ev);
}

std::size_t ServerLogManager::ClearServer(const std::string& serverName) {
    std::size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        auto before = pImpl->entries.size();
        pImpl->entries.erase(std::remove_if(pImpl->entries.begin(), pImpl->entries.end(),
            [&](const LogEntry& e) { return e.serverName == serverName; }), pImpl->entries.end());
        removed = before - pImpl->entries.size();
    }
    if (removed > 0) {
        ServerLogEvent ev;
        ev.type = "cleared:server";
        ev.serverName = serverName;
        ev.count = removed;
        Emit(ev);
    }
    return removed;
}

} // namespace mcprt
