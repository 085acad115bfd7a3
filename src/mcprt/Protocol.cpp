//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Conversions between typed MCP payloads and JSONValue
//==========================================================================================================

#include "mcprt/Protocol.h"

#include <algorithm>

namespace mcprt {

namespace {
std::vector<JSONValue> arrayItems(const JSONValue& object, const std::string& key) {
    std::vector<JSONValue> out;
    const JSONValue* m = FindMember(object, key);
    if (!m || !m->IsArray()) return out;
    for (const auto& item : std::get<JSONValue::Array>(m->value)) {
        if (item) out.push_back(*item);
    }
    return out;
}

std::optional<std::vector<std::string>> stringArray(const JSONValue& object, const std::string& key) {
    const JSONValue* m = FindMember(object, key);
    if (!m || !m->IsArray()) return std::nullopt;
    std::vector<std::string> out;
    for (const auto& item : std::get<JSONValue::Array>(m->value)) {
        if (item && item->IsString()) out.push_back(std::get<std::string>(item->value));
    }
    return out;
}

JSONValue stringArrayToJSON(const std::vector<std::string>& items) {
    JSONValue::Array arr;
    for (const auto& s : items) arr.push_back(std::make_shared<JSONValue>(s));
    return JSONValue{std::move(arr)};
}

void put(JSONValue::Object& obj, const std::string& key, JSONValue value) {
    obj[key] = std::make_shared<JSONValue>(std::move(value));
}

bool hasObject(const JSONValue& object, const std::string& key) {
    const JSONValue* m = FindMember(object, key);
    return m && m->IsObject();
}
} // namespace

const std::vector<std::string>& SupportedProtocolVersions() {
    static const std::vector<std::string> versions{PROTOCOL_VERSION};
    return versions;
}

bool IsVersionSupported(const std::string& version) {
    const auto& v = SupportedProtocolVersions();
    return std::find(v.begin(), v.end(), version) != v.end();
}

const char* toString(LoggingLevel level) {
    switch (level) {
        case LoggingLevel::Debug: return "debug";
        case LoggingLevel::Info: return "info";
        case LoggingLevel::Notice: return "notice";
        case LoggingLevel::Warning: return "warning";
        case LoggingLevel::Error: return "error";
        case LoggingLevel::Critical: return "critical";
        case LoggingLevel::Alert: return "alert";
        case LoggingLevel::Emergency: return "emergency";
    }
    return "info";
}

std::optional<LoggingLevel> loggingLevelFromString(const std::string& s) {
    static const LoggingLevel all[] = {
        LoggingLevel::Debug, LoggingLevel::Info, LoggingLevel::Notice, LoggingLevel::Warning,
        LoggingLevel::Error, LoggingLevel::Critical, LoggingLevel::Alert, LoggingLevel::Emergency};
    for (LoggingLevel l : all) {
        if (s == toString(l)) return l;
    }
    return std::nullopt;
}

//////////////////////////////////////////// Handshake ////////////////////////////////////////////

JSONValue ToJSON(const InitializeParams& params) {
    JSONValue::Object caps;
    if (params.capabilities.roots) {
        put(caps, "roots", MakeObject({{"listChanged", JSONValue(params.capabilities.rootsListChanged)}}));
    }
    if (params.capabilities.sampling) {
        put(caps, "sampling", JSONValue{JSONValue::Object{}});
    }
    if (!params.capabilities.experimental.empty()) {
        JSONValue::Object exp;
        for (const auto& [k, v] : params.capabilities.experimental) put(exp, k, v);
        put(caps, "experimental", JSONValue{std::move(exp)});
    }
    return MakeObject({
        {"protocolVersion", JSONValue(params.protocolVersion)},
        {"capabilities", JSONValue{std::move(caps)}},
        {"clientInfo", MakeObject({{"name", JSONValue(params.clientInfo.name)},
                                   {"version", JSONValue(params.clientInfo.version)}})},
    });
}

InitializeResult InitializeResultFromJSON(const JSONValue& value) {
    InitializeResult r;
    r.protocolVersion = GetString(value, "protocolVersion").value_or("");
    if (const JSONValue* caps = FindMember(value, "capabilities")) {
        r.capabilities.raw = caps->DeepCopy();
        if (const JSONValue* tools = FindMember(*caps, "tools"); tools && tools->IsObject()) {
            r.capabilities.tools = true;
            r.capabilities.toolsListChanged = GetBool(*tools, "listChanged").value_or(false);
        }
        if (const JSONValue* res = FindMember(*caps, "resources"); res && res->IsObject()) {
            r.capabilities.resources = true;
            r.capabilities.resourcesSubscribe = GetBool(*res, "subscribe").value_or(false);
            r.capabilities.resourcesListChanged = GetBool(*res, "listChanged").value_or(false);
        }
        if (const JSONValue* prompts = FindMember(*caps, "prompts"); prompts && prompts->IsObject()) {
            r.capabilities.prompts = true;
            r.capabilities.promptsListChanged = GetBool(*prompts, "listChanged").value_or(false);
        }
        r.capabilities.logging = hasObject(*caps, "logging");
    }
    if (const JSONValue* info = FindMember(value, "serverInfo")) {
        r.serverInfo.name = GetString(*info, "name").value_or("");
        r.serverInfo.version = GetString(*info, "version").value_or("");
    }
    r.instructions = GetString(value, "instructions");
    return r;
}

//////////////////////////////////////////// Tools / resources / prompts ////////////////////////////////////////////

Tool ToolFromJSON(const JSONValue& value) {
    Tool t;
    t.name = GetString(value, "name").value_or("");
    t.description = GetString(value, "description").value_or("");
    if (const JSONValue* schema = FindMember(value, "inputSchema")) {
        t.inputSchema = *schema;
    }
    return t;
}

Resource ResourceFromJSON(const JSONValue& value) {
    Resource r;
    r.uri = GetString(value, "uri").value_or("");
    r.name = GetString(value, "name").value_or("");
    r.description = GetString(value, "description");
    r.mimeType = GetString(value, "mimeType");
    return r;
}

Prompt PromptFromJSON(const JSONValue& value) {
    Prompt p;
    p.name = GetString(value, "name").value_or("");
    p.description = GetString(value, "description").value_or("");
    if (const JSONValue* args = FindMember(value, "arguments")) {
        p.arguments = *args;
    }
    return p;
}

CallToolResult CallToolResultFromJSON(const JSONValue& value) {
    CallToolResult r;
    r.content = arrayItems(value, "content");
    r.isError = GetBool(value, "isError").value_or(false);
    return r;
}

GetPromptResult GetPromptResultFromJSON(const JSONValue& value) {
    GetPromptResult r;
    r.description = GetString(value, "description").value_or("");
    r.messages = arrayItems(value, "messages");
    return r;
}

Root RootFromJSON(const JSONValue& value) {
    Root r;
    r.uri = GetString(value, "uri").value_or("");
    r.name = GetString(value, "name");
    return r;
}

JSONValue ToJSON(const Root& root) {
    JSONValue::Object obj;
    put(obj, "uri", JSONValue(root.uri));
    if (root.name) put(obj, "name", JSONValue(*root.name));
    return JSONValue{std::move(obj)};
}

//////////////////////////////////////////// Sampling ////////////////////////////////////////////

CreateMessageParams CreateMessageParamsFromJSON(const JSONValue& value) {
    CreateMessageParams p;
    for (const auto& m : arrayItems(value, "messages")) {
        SamplingMessage msg;
        msg.role = GetString(m, "role").value_or("");
        if (const JSONValue* content = FindMember(m, "content")) {
            msg.content = content->DeepCopy();
        }
        p.messages.push_back(std::move(msg));
    }
    if (const JSONValue* prefs = FindMember(value, "modelPreferences"); prefs && prefs->IsObject()) {
        ModelPreferences mp;
        for (const auto& hint : arrayItems(*prefs, "hints")) {
            if (auto name = GetString(hint, "name")) mp.hints.push_back(*name);
        }
        mp.costPriority = GetNumber(*prefs, "costPriority");
        mp.speedPriority = GetNumber(*prefs, "speedPriority");
        mp.intelligencePriority = GetNumber(*prefs, "intelligencePriority");
        p.modelPreferences = std::move(mp);
    }
    p.systemPrompt = GetString(value, "systemPrompt");
    p.includeContext = GetString(value, "includeContext");
    p.temperature = GetNumber(value, "temperature");
    p.maxTokens = GetInteger(value, "maxTokens").value_or(0);
    p.stopSequences = stringArray(value, "stopSequences");
    if (const JSONValue* meta = FindMember(value, "metadata")) {
        p.metadata = meta->DeepCopy();
    }
    return p;
}

JSONValue ToJSON(const CreateMessageParams& params) {
    JSONValue::Object obj;
    JSONValue::Array messages;
    for (const auto& m : params.messages) {
        messages.push_back(std::make_shared<JSONValue>(
            MakeObject({{"role", JSONValue(m.role)}, {"content", m.content}})));
    }
    put(obj, "messages", JSONValue{std::move(messages)});
    if (params.modelPreferences) {
        const auto& mp = *params.modelPreferences;
        JSONValue::Object prefs;
        if (!mp.hints.empty()) {
            JSONValue::Array hints;
            for (const auto& h : mp.hints) {
                hints.push_back(std::make_shared<JSONValue>(MakeObject({{"name", JSONValue(h)}})));
            }
            put(prefs, "hints", JSONValue{std::move(hints)});
        }
        if (mp.costPriority) put(prefs, "costPriority", JSONValue(*mp.costPriority));
        if (mp.speedPriority) put(prefs, "speedPriority", JSONValue(*mp.speedPriority));
        if (mp.intelligencePriority) put(prefs, "intelligencePriority", JSONValue(*mp.intelligencePriority));
        put(obj, "modelPreferences", JSONValue{std::move(prefs)});
    }
    if (params.systemPrompt) put(obj, "systemPrompt", JSONValue(*params.systemPrompt));
    if (params.includeContext) put(obj, "includeContext", JSONValue(*params.includeContext));
    if (params.temperature) put(obj, "temperature", JSONValue(*params.temperature));
    put(obj, "maxTokens", JSONValue(params.maxTokens));
    if (params.stopSequences) put(obj, "stopSequences", stringArrayToJSON(*params.stopSequences));
    if (params.metadata) put(obj, "metadata", *params.metadata);
    return JSONValue{std::move(obj)};
}

CreateMessageResult CreateMessageResultFromJSON(const JSONValue& value) {
    CreateMessageResult r;
    r.role = GetString(value, "role").value_or("");
    if (const JSONValue* content = FindMember(value, "content")) {
        r.content = content->DeepCopy();
    }
    r.model = GetString(value, "model").value_or("");
    r.stopReason = GetString(value, "stopReason");
    return r;
}

JSONValue ToJSON(const CreateMessageResult& result) {
    JSONValue::Object obj;
    put(obj, "role", JSONValue(result.role));
    put(obj, "content", result.content);
    put(obj, "model", JSONValue(result.model));
    if (result.stopReason) put(obj, "stopReason", JSONValue(*result.stopReason));
    return JSONValue{std::move(obj)};
}

} // namespace mcprt
