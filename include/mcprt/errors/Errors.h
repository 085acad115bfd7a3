//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Runtime exception taxonomy plus typed JSON-RPC error structures and mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "mcprt/JSONRPCTypes.h"

namespace mcprt {
namespace errors {

// Categorization of common JSON-RPC error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    ServerError,
    Unknown
};

// Typed representation of a peer's JSON-RPC error object.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a JSON-RPC numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code.
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::ServerError: return ErrorCategory::ServerError;
        default: return ErrorCategory::Unknown;
    }
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    auto code = GetInteger(errVal, "code");
    auto message = GetString(errVal, "message");
    if (!code || !message) {
        return std::nullopt;
    }
    McpError e;
    e.code = static_cast<int>(*code);
    e.message = std::move(*message);
    if (const JSONValue* data = FindMember(errVal, "data")) {
        e.data = data->DeepCopy();
    }
    e.category = errorCategoryFromCode(e.code);
    return e;
}

// Create a JSONValue error object from a typed McpError.
inline JSONValue makeErrorValue(const McpError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Convenience: Create a JSONRPCResponse error from McpError and id.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

////////////////////////////////////////// Exceptions //////////////////////////////////////////

enum class ErrorKind {
    Parse,
    Protocol,
    Timeout,
    Process,
    Validation,
    Cancellation,
    Remote,
    Transport,
    Config
};

const char* toString(ErrorKind kind);

//==========================================================================================================
// CancellationReason
// Purpose: Why a cancellable operation ended early. Carried by CancellationError and cancellation
//          results; serialized on the wire in notifications/cancelled.
//==========================================================================================================
enum class CancellationReason {
    UserCancelled,
    Timeout,
    ServerRequest,
    Shutdown,
    Error
};

const char* toString(CancellationReason reason);
std::optional<CancellationReason> cancellationReasonFromString(const std::string& s);

//==========================================================================================================
// RuntimeError
// Purpose: Base of every exception raised by the runtime; the kind allows callers to branch without
//          dynamic_cast chains.
//==========================================================================================================
class RuntimeError : public std::runtime_error {
public:
    RuntimeError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), errorKind(kind) {}

    ErrorKind Kind() const noexcept { return errorKind; }

private:
    ErrorKind errorKind;
};

// Malformed JSON text.
class ParseError : public RuntimeError {
public:
    explicit ParseError(const std::string& message) : RuntimeError(ErrorKind::Parse, message) {}
};

// Well-formed JSON that violates JSON-RPC or MCP rules, or an unsupported protocol version.
class ProtocolError : public RuntimeError {
public:
    explicit ProtocolError(const std::string& message) : RuntimeError(ErrorKind::Protocol, message) {}
};

class TimeoutError : public RuntimeError {
public:
    explicit TimeoutError(const std::string& message) : RuntimeError(ErrorKind::Timeout, message) {}
};

// Spawn failure, signal failure, unknown server or dependency problems.
class ProcessError : public RuntimeError {
public:
    explicit ProcessError(const std::string& message) : RuntimeError(ErrorKind::Process, message) {}
};

class ValidationError : public RuntimeError {
public:
    explicit ValidationError(const std::string& message) : RuntimeError(ErrorKind::Validation, message) {}
};

class CancellationError : public RuntimeError {
public:
    CancellationError(const std::string& message, CancellationReason reason)
        : RuntimeError(ErrorKind::Cancellation, message), cancelReason(reason) {}

    CancellationReason Reason() const noexcept { return cancelReason; }

private:
    CancellationReason cancelReason;
};

// The peer answered with a JSON-RPC error object.
class RemoteError : public RuntimeError {
public:
    explicit RemoteError(McpError err)
        : RuntimeError(ErrorKind::Remote, err.message), remote(std::move(err)) {}

    const McpError& Error() const noexcept { return remote; }
    int Code() const noexcept { return remote.code; }

private:
    McpError remote;
};

class TransportError : public RuntimeError {
public:
    explicit TransportError(const std::string& message) : RuntimeError(ErrorKind::Transport, message) {}
};

class ConfigError : public RuntimeError {
public:
    explicit ConfigError(const std::string& message) : RuntimeError(ErrorKind::Config, message) {}
};

// True when the exception is a CancellationError.
inline bool isCancellationError(const std::exception& e) {
    return dynamic_cast<const CancellationError*>(&e) != nullptr;
}

} // namespace errors
} // namespace mcprt
