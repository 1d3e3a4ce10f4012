//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Bridge error taxonomy, exception type and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "mcpbridge/JSONRPCTypes.h"

namespace mcpbridge {
namespace errors {

//==========================================================================================================
// ErrorKind
// Purpose: Failure classes raised by the transport, client, connection layer and OAuth listener.
//==========================================================================================================
enum class ErrorKind {
    SpawnFailed,       // backend process could not be started
    TransportClosed,   // process exited or channel was torn down
    Timeout,           // no response within the configured bound
    Protocol,          // malformed or schema-violating payload, or a backend error response
    OAuth,             // authorization denied, malformed callback, or callback timeout
    Io,                // local I/O failure (pipes, sockets, files)
    ServerNotFound,    // unknown backend identifier
    AlreadyConnected   // connect requested for a backend that is connected or connecting
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SpawnFailed: return "SpawnFailed";
        case ErrorKind::TransportClosed: return "TransportClosed";
        case ErrorKind::Timeout: return "Timeout";
        case ErrorKind::Protocol: return "Protocol";
        case ErrorKind::OAuth: return "OAuth";
        case ErrorKind::Io: return "Io";
        case ErrorKind::ServerNotFound: return "ServerNotFound";
        case ErrorKind::AlreadyConnected: return "AlreadyConnected";
    }
    return "Unknown";
}

//==========================================================================================================
// BridgeError
// Purpose: Exception carrying an ErrorKind. Delivered through std::future via set_exception.
//==========================================================================================================
class BridgeError : public std::runtime_error {
public:
    BridgeError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// Categorization of standard JSON-RPC error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    Unknown
};

// Typed JSON-RPC error representation.
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
        default: return ErrorCategory::Unknown;
    }
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    const JSONValue* code = errVal.Find("code");
    auto message = errVal.FindString("message");
    if (code == nullptr || !message.has_value() || !std::holds_alternative<int64_t>(code->value)) {
        return std::nullopt;
    }
    McpError e;
    e.code = static_cast<int>(std::get<int64_t>(code->value));
    e.message = std::move(message.value());
    if (const JSONValue* data = errVal.Find("data")) {
        e.data = *data;
    }
    e.category = errorCategoryFromCode(e.code);
    return e;
}

// Extract McpError from a JSONRPCResponse if it carries an error.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

// Create a JSONValue error object from a typed McpError.
inline JSONValue makeErrorValue(const McpError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Create a JSONRPCResponse error from McpError and id.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

//==========================================================================================================
// protocolErrorFromResponse
// Purpose: Turn a backend's JSON-RPC error response into a Protocol BridgeError.
// Args:
//   method: Method that was called (for the message).
//   response: Response carrying an error member.
//==========================================================================================================
inline BridgeError protocolErrorFromResponse(const std::string& method, const JSONRPCResponse& response) {
    auto err = mcpErrorFromResponse(response);
    if (err.has_value()) {
        return BridgeError(ErrorKind::Protocol,
                           method + " failed: " + err->message + " (code " + std::to_string(err->code) + ")");
    }
    return BridgeError(ErrorKind::Protocol, method + " failed: malformed error object");
}

} // namespace errors
} // namespace mcpbridge
