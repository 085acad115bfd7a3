//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol constants, method names and typed payloads exchanged with servers
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>

namespace mcprt {

// Protocol version requested by this client.
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

// Versions this client can speak. initialize is refused for anything else.
const std::vector<std::string>& SupportedProtocolVersions();
bool IsVersionSupported(const std::string& version);

//==========================================================================================================
// Implementation
// Purpose: Name/version pair used for clientInfo and serverInfo.
//==========================================================================================================
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

struct ClientCapabilities {
    bool roots = true;
    bool rootsListChanged = false;
    bool sampling = true;
    std::unordered_map<std::string, JSONValue> experimental;
};

//==========================================================================================================
// ServerCapabilities
// Purpose: Capability flags advertised by the server in its initialize result. raw keeps the original
//          object so callers can read experimental entries.
//==========================================================================================================
struct ServerCapabilities {
    bool tools = false;
    bool toolsListChanged = false;
    bool resources = false;
    bool resourcesSubscribe = false;
    bool resourcesListChanged = false;
    bool prompts = false;
    bool promptsListChanged = false;
    bool logging = false;
    JSONValue raw;
};

struct InitializeParams {
    std::string protocolVersion = PROTOCOL_VERSION;
    ClientCapabilities capabilities;
    Implementation clientInfo;
};

struct InitializeResult {
    std::string protocolVersion;
    ServerCapabilities capabilities;
    Implementation serverInfo;
    std::optional<std::string> instructions;
};

struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool parameters
};

struct CallToolResult {
    std::vector<JSONValue> content;
    bool isError = false;
};

struct Resource {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;
};

struct Prompt {
    std::string name;
    std::string description;
    std::optional<JSONValue> arguments;
};

struct GetPromptResult {
    std::string description;
    std::vector<JSONValue> messages;
};

struct Root {
    std::string uri;
    std::optional<std::string> name;
};

//==========================================================================================================
// LoggingLevel
// Purpose: RFC 5424 severities used by logging/setLevel and notifications/message, ordered from least
//          to most severe.
//==========================================================================================================
enum class LoggingLevel {
    Debug = 0,
    Info,
    Notice,
    Warning,
    Error,
    Critical,
    Alert,
    Emergency
};

const char* toString(LoggingLevel level);
std::optional<LoggingLevel> loggingLevelFromString(const std::string& s);

//////////////////////////////////////////// Sampling ////////////////////////////////////////////

struct ModelPreferences {
    std::vector<std::string> hints;
    std::optional<double> costPriority;
    std::optional<double> speedPriority;
    std::optional<double> intelligencePriority;
};

struct SamplingMessage {
    std::string role;   // "user" | "assistant"
    JSONValue content;  // content object, e.g. { type: "text", text: "..." }
};

struct CreateMessageParams {
    std::vector<SamplingMessage> messages;
    std::optional<ModelPreferences> modelPreferences;
    std::optional<std::string> systemPrompt;
    std::optional<std::string> includeContext;
    std::optional<double> temperature;
    int64_t maxTokens = 0;
    std::optional<std::vector<std::string>> stopSequences;
    std::optional<JSONValue> metadata;
};

struct CreateMessageResult {
    std::string role = "assistant";
    JSONValue content;
    std::string model;
    std::optional<std::string> stopReason;
};

//////////////////////////////////////////// Conversions ////////////////////////////////////////////
// FromJSON helpers are lenient: missing optional members are left empty and type mismatches fall back
// to defaults. Shape checks live in validation/Validators.h.

JSONValue ToJSON(const InitializeParams& params);
InitializeResult InitializeResultFromJSON(const JSONValue& value);
Tool ToolFromJSON(const JSONValue& value);
Resource ResourceFromJSON(const JSONValue& value);
Prompt PromptFromJSON(const JSONValue& value);
CallToolResult CallToolResultFromJSON(const JSONValue& value);
GetPromptResult GetPromptResultFromJSON(const JSONValue& value);
Root RootFromJSON(const JSONValue& value);
JSONValue ToJSON(const Root& root);
CreateMessageParams CreateMessageParamsFromJSON(const JSONValue& value);
JSONValue ToJSON(const CreateMessageParams& params);
CreateMessageResult CreateMessageResultFromJSON(const JSONValue& value);
JSONValue ToJSON(const CreateMessageResult& result);

namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Ping = "ping";
    constexpr const char* Shutdown = "shutdown";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ReadResource = "resources/read";
    constexpr const char* Subscribe = "resources/subscribe";
    constexpr const char* Unsubscribe = "resources/unsubscribe";
    constexpr const char* ListPrompts = "prompts/list";
    constexpr const char* GetPrompt = "prompts/get";
    constexpr const char* ListRoots = "roots/list";
    constexpr const char* SetLogLevel = "logging/setLevel";
    constexpr const char* CreateMessage = "sampling/createMessage";

    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Progress = "notifications/progress";
    constexpr const char* Log = "notifications/message";
    constexpr const char* Cancelled = "notifications/cancelled";
    constexpr const char* ResourceListChanged = "notifications/resources/list_changed";
    constexpr const char* ResourceUpdated = "notifications/resources/updated";
    constexpr const char* ToolListChanged = "notifications/tools/list_changed";
    constexpr const char* PromptListChanged = "notifications/prompts/list_changed";
    constexpr const char* RootsListChanged = "notifications/roots/list_changed";
}

} // namespace mcprt
