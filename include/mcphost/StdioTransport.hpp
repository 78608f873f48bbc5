//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.hpp
// Purpose: Newline-delimited JSON-RPC transport over a spawned server's stdin/stdout
//==========================================================================================================
#pragma once

#include "mcphost/Transport.h"
#include <cstdint>
#include <memory>
#include <string>

namespace mcphost {

//==========================================================================================================
// StdioTransport
// Purpose: Owns one server process and turns it into a correlated async RPC endpoint.
// Notes:
//   - A writer task owns the child's stdin and a reader task owns its stdout; stderr lines are logged.
//   - Request ids come from a per-transport counter starting at 1.
//   - The destructor kills the child when Close() was never called.
//==========================================================================================================
class StdioTransport : public ITransport {
public:
    explicit StdioTransport(ServerConfig config);
    virtual ~StdioTransport();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    //==========================================================================================================
    // Spawns the server and starts the writer, reader and stderr tasks.
    // Returns:
    //   Future that completes when running, or fails with a Connection McpException (spawn or pipe
    //   failure); nothing is left running on failure.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Stops the writer, kills the server and waits for it, then fails any request still pending with a
    // Connection error. Idempotent.
    //==========================================================================================================
    std::future<void> Close() override;

    //==========================================================================================================
    // True while started, not closed, and the writer can still accept messages.
    //==========================================================================================================
    bool IsConnected() const override;

    //==========================================================================================================
    // Returns a diagnostic session identifier.
    //==========================================================================================================
    std::string GetSessionId() const override;

    //==========================================================================================================
    // Assigns the next id, registers a pending entry and enqueues the request. Fails immediately with a
    // Connection error (without registering) when the writer queue is closed.
    //==========================================================================================================
    std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        std::unique_ptr<JSONRPCRequest> request) override;

    //==========================================================================================================
    // Enqueues a notification; never registers a pending entry and is a no-op once closed.
    //==========================================================================================================
    std::future<void> SendNotification(
        std::unique_ptr<JSONRPCNotification> notification) override;

    void SetNotificationHandler(NotificationHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    // True until Close() (or the destructor) takes and kills the child handle.
    bool IsAlive() const override;

    //==========================================================================================================
    // SetRequestTimeoutMs
    // Purpose: Configure maximum time to wait for a single request/response pair.
    // Args:
    //   timeoutMs: Timeout in milliseconds (default 30000, or MCPHOST_STDIOTRANSPORT_TIMEOUT_MS);
    //              0 disables the timeout. Applies to requests sent after the call, also after Start().
    //==========================================================================================================
    void SetRequestTimeoutMs(uint64_t timeoutMs);

    //==========================================================================================================
    // SetMaxLineBytes
    // Purpose: Upper bound for one inbound line; longer lines are discarded up to their newline.
    //==========================================================================================================
    void SetMaxLineBytes(std::size_t maxBytes);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
    friend struct StdioTransportTestHooks;
};

//==========================================================================================================
// StdioTransportFactory
// Purpose: Factory for creating stdio transports.
// Args (ctor):
//   options: "key=value" pairs separated by ';' or whitespace. Keys: timeout_ms, max_line_bytes.
//==========================================================================================================
class StdioTransportFactory : public ITransportFactory {
public:
    StdioTransportFactory() = default;
    explicit StdioTransportFactory(std::string options) : options(std::move(options)) {}

    std::unique_ptr<ITransport> CreateTransport(const ServerConfig& config) override;

private:
    std::string options;
};

// Introspection used by the transport tests.
struct StdioTransportTestHooks {
    static std::size_t pendingCount(const StdioTransport& t);
    static std::size_t unmatchedResponses(const StdioTransport& t);
    static std::size_t wakeupsPosted(const StdioTransport& t);
    static long childPid(const StdioTransport& t);
};

} // namespace mcphost
