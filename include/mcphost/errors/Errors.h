//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structures, the host exception type and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include "mcphost/JSONRPCTypes.h"

namespace mcphost {
namespace errors {

// Categorization of JSON-RPC, MCP and host-side failures.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    McpInvalidRequestId,
    McpToolNotFound,
    Connection,      // spawn/pipe failure, write failure, transport closed, process gone
    Timeout,         // no correlated reply within the request timeout
    ServerNotFound,  // operation against an unregistered or unconnected server name
    Rpc,             // server replied with an error code outside the known set
    Unknown
};

// Typed error representation used by the host.
struct McpError {
    int64_t code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Short stable name for logs and test output.
inline const char* categoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::JsonRpcParse: return "Protocol";
        case ErrorCategory::JsonRpcInvalidRequest: return "InvalidRequest";
        case ErrorCategory::JsonRpcMethodNotFound: return "MethodNotFound";
        case ErrorCategory::JsonRpcInvalidParams: return "InvalidParams";
        case ErrorCategory::JsonRpcInternal: return "Internal";
        case ErrorCategory::McpInvalidRequestId: return "InvalidRequestId";
        case ErrorCategory::McpToolNotFound: return "ToolNotFound";
        case ErrorCategory::Connection: return "Connection";
        case ErrorCategory::Timeout: return "Timeout";
        case ErrorCategory::ServerNotFound: return "ServerNotFound";
        case ErrorCategory::Rpc: return "Rpc";
        case ErrorCategory::Unknown: break;
    }
    return "Unknown";
}

// Map a JSON-RPC/MCP/host numeric error code to an ErrorCategory.
//
// Args:
//   code: The error code as sent on the wire (JSON-RPC standard, MCP-specific or host-side).
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int64_t code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::InvalidRequestId: return ErrorCategory::McpInvalidRequestId;
        case JSONRPCErrorCodes::ToolNotFound: return ErrorCategory::McpToolNotFound;
        case JSONRPCErrorCodes::ConnectionError: return ErrorCategory::Connection;
        case JSONRPCErrorCodes::RequestTimeout: return ErrorCategory::Timeout;
        case JSONRPCErrorCodes::ServerNotFound: return ErrorCategory::ServerNotFound;
        default: return ErrorCategory::Unknown;
    }
}

// Canonical code for a host-side category (used when raising errors locally).
inline int codeForCategory(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::JsonRpcParse: return JSONRPCErrorCodes::ParseError;
        case ErrorCategory::McpToolNotFound: return JSONRPCErrorCodes::ToolNotFound;
        case ErrorCategory::Connection: return JSONRPCErrorCodes::ConnectionError;
        case ErrorCategory::Timeout: return JSONRPCErrorCodes::RequestTimeout;
        case ErrorCategory::ServerNotFound: return JSONRPCErrorCodes::ServerNotFound;
        default: return JSONRPCErrorCodes::InternalError;
    }
}

//==========================================================================================================
// McpException
// Purpose: Exception carrying a typed McpError; this is what host futures fail with.
//==========================================================================================================
class McpException : public std::runtime_error {
public:
    explicit McpException(McpError err)
        : std::runtime_error(err.message), error_(std::move(err)) {}

    const McpError& error() const noexcept { return error_; }
    ErrorCategory category() const noexcept { return error_.category; }
    int64_t code() const noexcept { return error_.code; }

private:
    McpError error_;
};

// Build an McpException for a locally raised failure of the given category.
inline McpException makeException(ErrorCategory category, const std::string& message) {
    McpError e;
    e.code = codeForCategory(category);
    e.message = message;
    e.category = category;
    return McpException(std::move(e));
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
//
// Args:
//   errVal: JSONValue expected to be an Object with code/message and optional data.
//
// Returns:
//   std::optional<McpError> populated when shape is valid.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    if (!std::holds_alternative<JSONValue::Object>(errVal.value)) {
        return std::nullopt;
    }
    const auto& obj = std::get<JSONValue::Object>(errVal.value);
    auto itCode = obj.find("code");
    auto itMsg = obj.find("message");
    if (itCode == obj.end() || itMsg == obj.end()) {
        return std::nullopt;
    }
    if (!itCode->second || !itMsg->second) {
        return std::nullopt;
    }
    if (!std::holds_alternative<int64_t>(itCode->second->value) ||
        !std::holds_alternative<std::string>(itMsg->second->value)) {
        return std::nullopt;
    }
    const int64_t code = std::get<int64_t>(itCode->second->value);
    std::string message = std::get<std::string>(itMsg->second->value);

    std::optional<JSONValue> data;
    auto itData = obj.find("data");
    if (itData != obj.end() && itData->second) {
        data = *(itData->second);
    }

    McpError e;
    e.code = code;
    e.message = std::move(message);
    e.data = std::move(data);
    e.category = errorCategoryFromCode(code);
    return e;
}

// Extract McpError from a JSONRPCResponse if it carries an error.
//
// Args:
//   response: JSONRPCResponse that may contain an error object.
//
// Returns:
//   std::optional<McpError> when response.IsError() and shape is valid.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

// Exception for an error reply from a server. Codes outside the known set are tagged Rpc.
inline McpException rpcExceptionFromResponse(const JSONRPCResponse& response) {
    auto err = mcpErrorFromResponse(response);
    if (!err.has_value()) {
        return makeException(ErrorCategory::JsonRpcParse,
                             "Server returned a malformed error object for id " + IdToString(response.id));
    }
    if (err->category == ErrorCategory::Unknown) {
        err->category = ErrorCategory::Rpc;
    }
    return McpException(std::move(*err));
}

} // namespace errors
} // namespace mcphost
