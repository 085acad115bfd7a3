//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger sinks, environment configuration and static members.
//==========================================================================================================

#include "logging/Logger.h"

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "env/EnvVars.h"

std::atomic<LogLevel> Logger::sLogLevel{LogLevel::LOG_INFO_LEVEL};
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;

namespace {

bool envFlag(const char* name, const char* defaultValue) {
    const std::string v = GetEnvOrDefault(name, defaultValue);
    return v == "1" || v == "true" || v == "TRUE";
}

// HH:MM:SS.mmm in local time
std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm buf{};
    ::localtime_r(&t, &buf);
    std::ostringstream oss;
    oss << std::put_time(&buf, "%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms.count();
    return oss.str();
}

const char* baseName(const char* path) {
    const char* slash = std::strrchr(path, '/');
    return slash ? slash + 1 : path;
}

} // namespace

LogLevel Logger::levelFromString(const std::string& lvl) {
    std::string s;
    s.reserve(lvl.size());
    for (char c : lvl) s.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
    if (s == "DEBUG") return LogLevel::LOG_DEBUG_LEVEL;
    if (s == "INFO")  return LogLevel::LOG_INFO_LEVEL;
    if (s == "WARN" || s == "WARNING") return LogLevel::LOG_WARN_LEVEL;
    if (s == "ERROR") return LogLevel::LOG_ERROR_LEVEL;
    if (s == "FATAL") return LogLevel::LOG_FATAL_LEVEL;
    return LogLevel::LOG_INFO_LEVEL;
}

void Logger::configureFromEnv() {
    const std::string lvl = GetEnvOrDefault("MCPRT_LOG_LEVEL", "");
    if (!lvl.empty()) {
        setLogLevel(lvl);
    }
    const std::string file = GetEnvOrDefault("MCPRT_LOG_FILE", "");
    if (!file.empty()) {
        setLogFile(file);
    }
}

void Logger::setLogFile(const std::string& filePath) {
    std::lock_guard<std::mutex> lock(sLogMutex);
    if (sLogFile.is_open()) {
        sLogFile.close();
    }
    sLogFile.open(filePath, std::ios::out | std::ios::app);
    if (!sLogFile.is_open()) {
        std::cerr << "[ERROR] Failed to open log file: " << filePath << " (errno=" << errno << ")" << std::endl;
        return;
    }
    auto now = std::chrono::system_clock::now();
    std::time_t nowTime = std::chrono::system_clock::to_time_t(now);
    std::tm buf{};
    ::localtime_r(&nowTime, &buf);
    sLogFile << "\n=== Log opened at " << std::put_time(&buf, "%Y-%m-%d %H:%M:%S") << " ===\n";
    sLogFile.flush();
}

void Logger::log(const char* level, const std::string& msg, const char* file, unsigned int line) {
    // ANSI colour applies to the label only and never reaches the file sink.
    static const bool colorEnabled = envFlag("MCPRT_LOG_COLOR", "1");
    // A host that speaks JSON-RPC on its own stdout sets MCPRT_STDIO_MODE=1.
    static const bool useStderr = envFlag("MCPRT_STDIO_MODE", "0");

    const std::string body = std::format("{} {}:{}: {}\n", timestamp(), baseName(file), line, msg);
    std::string console;
    if (colorEnabled) {
        const char* labelColor = (::strncmp(level, "ERROR", 5) == 0) ? "\033[38;5;88m" /* burgundy */ : "\033[35m" /* purple */;
        console = std::format("[{}{}\033[0m] {}", labelColor, level, body);
    } else {
        console = std::format("[{}] {}", level, body);
    }

    std::lock_guard<std::mutex> lock(sLogMutex);
    if (useStderr) {
        std::cerr << console;
    } else {
        std::cout << console;
    }
    if (sLogFile.is_open()) {
        sLogFile << "[" << level << "] " << body;
        sLogFile.flush();
    }
}
