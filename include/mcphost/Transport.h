//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Transport layer interfaces between the host and one MCP server
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <functional>
#include <future>
#include <cstdint>

#include "mcphost/ServerConfig.h"

namespace mcphost {

// Forward declarations
class JSONRPCRequest;
class JSONRPCResponse;
class JSONRPCNotification;

//==========================================================================================================
// ITransport
// Purpose: A correlated JSON-RPC channel to one server process.
// Notes:
//   - Failures reach callers as errors::McpException stored in the returned futures: Connection for
//     spawn, pipe and write failures or a closed channel, Timeout for a reply that never came.
//   - Handlers are installed before Start() and run on the transport's I/O thread.
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Lifecycle ///////////////////////////////////////////
    // Launches the server and the I/O tasks. Nothing is left running when the future fails.
    virtual std::future<void> Start() = 0;

    // Tears the channel down and fails whatever is still pending. Safe to call more than once.
    virtual std::future<void> Close() = 0;

    // True while outbound messages can still be queued.
    virtual bool IsConnected() const = 0;

    // True while the transport still owns its server process.
    virtual bool IsAlive() const = 0;

    virtual std::string GetSessionId() const = 0;

    /////////////////////////////////////////// Messaging ///////////////////////////////////////////
    //==========================================================================================================
    // SendRequest
    // Purpose: Assigns the request a fresh id, queues it and waits for the reply carrying that id.
    // Returns:
    //   Future with the reply; error replies resolve it too (JSONRPCResponse::IsError). Transport-level
    //   failures fail the future instead.
    //==========================================================================================================
    virtual std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        std::unique_ptr<JSONRPCRequest> request) = 0;

    // Queues a notification. The returned future is already complete; nothing is awaited.
    virtual std::future<void> SendNotification(
        std::unique_ptr<JSONRPCNotification> notification) = 0;

    /////////////////////////////////////////// Inbound callbacks ///////////////////////////////////////////
    // Receives every notification the server sends.
    using NotificationHandler = std::function<void(std::unique_ptr<JSONRPCNotification>)>;
    virtual void SetNotificationHandler(NotificationHandler handler) = 0;

    // Receives non-fatal problems (unparsable lines, a closed stdout, write failures) as text.
    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

//==========================================================================================================
// ITransportFactory
// Purpose: Builds an unstarted transport for a server launch configuration. The Client owns one
//          factory and calls it once per ConnectServer.
//==========================================================================================================
class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;
    virtual std::unique_ptr<ITransport> CreateTransport(const ServerConfig& config) = 0;
};

} // namespace mcphost
