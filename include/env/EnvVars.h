//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read MCPRT_* environment overrides safely.
//==========================================================================================================
#pragma once
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <optional>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    return v ? std::string(v) : defaultValue;
}

//==========================================================================================================
// GetEnvMilliseconds
// Purpose: Reads a non-negative integer millisecond override (e.g. MCPRT_REQUEST_TIMEOUT_MS).
// Args:
//   name: Environment variable name.
// Returns:
//   The parsed value, or std::nullopt when unset, empty or not a valid unsigned number.
//==========================================================================================================
inline std::optional<uint64_t> GetEnvMilliseconds(const char* name) {
    const std::string raw = GetEnvOrDefault(name, "");
    if (raw.empty()) {
        return std::nullopt;
    }
    try {
        std::size_t pos = 0;
        unsigned long long v = std::stoull(raw, &pos);
        if (pos != raw.size()) {
            return std::nullopt;
        }
        return static_cast<uint64_t>(v);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}
