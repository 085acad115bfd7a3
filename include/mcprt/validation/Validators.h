//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Validators.h
// Purpose: Shape validators for sampling payloads exchanged over sampling/createMessage
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include "mcprt/Protocol.h"

namespace mcprt {
namespace validation {

//------------------------------ Primitive checks ------------------------------
inline bool isValidSamplingRole(const std::string& role) {
    return role == "user" || role == "assistant";
}

inline std::optional<std::string> checkUnitInterval(const JSONValue& prefs, const char* name) {
    const JSONValue* m = FindMember(prefs, name);
    if (!m) return std::nullopt;
    auto v = AsNumber(*m);
    if (!v || *v < 0.0 || *v > 1.0) {
        return std::string(name) + " must be between 0 and 1";
    }
    return std::nullopt;
}

//------------------------------ Raw JSON validators (inbound from a server) ------------------------------
// Returns the first violation, or std::nullopt when params are acceptable.
inline std::optional<std::string> validateCreateMessageParamsJson(const JSONValue& params) {
    const JSONValue* messages = FindMember(params, "messages");
    if (!messages || !messages->IsArray()) {
        return std::string("Sampling params must include messages array");
    }
    const auto& arr = std::get<JSONValue::Array>(messages->value);
    if (arr.empty()) {
        return std::string("Sampling params must include at least one message");
    }
    for (const auto& msg : arr) {
        if (!msg || !msg->IsObject()) {
            return std::string("Message must be an object");
        }
        auto role = GetString(*msg, "role");
        if (!role || !isValidSamplingRole(*role)) {
            return std::string("Message must have role \"user\" or \"assistant\"");
        }
        const JSONValue* content = FindMember(*msg, "content");
        if (!content || !content->IsObject()) {
            return std::string("Message must have content object");
        }
    }
    auto maxTokens = GetNumber(params, "maxTokens");
    if (!maxTokens || *maxTokens <= 0) {
        return std::string("Sampling params must include positive maxTokens");
    }
    if (const JSONValue* prefs = FindMember(params, "modelPreferences")) {
        for (const char* name : {"costPriority", "speedPriority", "intelligencePriority"}) {
            if (auto err = checkUnitInterval(*prefs, name)) return err;
        }
    }
    return std::nullopt;
}

//------------------------------ Typed validators (outbound results from the host callback) -------------
inline std::optional<std::string> validateCreateMessageResult(const CreateMessageResult& r) {
    if (r.role != "assistant") {
        return std::string("Sampling result must have role \"assistant\"");
    }
    if (!r.content.IsObject()) {
        return std::string("Sampling result must have content object");
    }
    if (r.model.empty()) {
        return std::string("Sampling result must include model string");
    }
    return std::nullopt;
}

} // namespace validation
} // namespace mcprt
