//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.cpp
// Purpose: String conversions for error kinds and cancellation reasons.
//==========================================================================================================

#include "mcprt/errors/Errors.h"

namespace mcprt {
namespace errors {

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Parse: return "parse";
        case ErrorKind::Protocol: return "protocol";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Process: return "process";
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Cancellation: return "cancellation";
        case ErrorKind::Remote: return "remote";
        case ErrorKind::Transport: return "transport";
        case ErrorKind::Config: return "config";
    }
    return "unknown";
}

const char* toString(CancellationReason reason) {
    switch (reason) {
        case CancellationReason::UserCancelled: return "user_cancelled";
        case CancellationReason::Timeout: return "timeout";
        case CancellationReason::ServerRequest: return "server_request";
        case CancellationReason::Shutdown: return "shutdown";
        case CancellationReason::Error: return "error";
    }
    return "error";
}

std::optional<CancellationReason> cancellationReasonFromString(const std::string& s) {
    if (s == "user_cancelled") return CancellationReason::UserCancelled;
    if (s == "timeout") return CancellationReason::Timeout;
    if (s == "server_request") return CancellationReason::ServerRequest;
    if (s == "shutdown") return CancellationReason::Shutdown;
    if (s == "error") return CancellationReason::Error;
    return std::nullopt;
}

} // namespace errors
} // namespace mcprt
