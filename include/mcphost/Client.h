//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.h
// Purpose: Multi-server MCP client interface - one transport per named server
//==========================================================================================================

#pragma once

#include "mcphost/Transport.h"
#include "mcphost/JSONRPCTypes.h"
#include "mcphost/ServerConfig.h"
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcphost {

// JSON-RPC method names used by the host.
namespace Methods {
    constexpr const char* CallTool = "tools/call";
}

//==========================================================================================================
// IClient
// Purpose: Connects named MCP servers and routes requests to them. Failures surface as
//          errors::McpException stored in the returned futures (or thrown from Connect/Disconnect).
//==========================================================================================================
class IClient {
public:
    virtual ~IClient() = default;

    ////////////////////////////////////////// Connection management ///////////////////////////////////////////
    //==========================================================================================================
    // Launches and connects a server under the given name, replacing any previous connection with that name.
    // Args:
    //   name: Server name used to route later calls.
    //   config: Launch configuration.
    // Returns:
    //   Future that completes when the transport runs, or fails with a Connection error.
    //==========================================================================================================
    virtual std::future<void> ConnectServer(const std::string& name, const ServerConfig& config) = 0;

    //==========================================================================================================
    // Closes the named server's transport. Unknown names are a no-op.
    // Returns:
    //   Future that completes when the transport has closed.
    //==========================================================================================================
    virtual std::future<void> DisconnectServer(const std::string& name) = 0;

    virtual bool IsServerConnected(const std::string& name) const = 0;

    // Names of every server with a transport, sorted.
    virtual std::vector<std::string> ListServers() const = 0;

    ////////////////////////////////////////// Tool operations /////////////////////////////////////////////////
    //==========================================================================================================
    // Invokes a server tool by name with JSON arguments.
    // Args:
    //   serverName: Connected server to route to.
    //   toolName: The tool name.
    //   arguments: JSON object containing the tool parameters.
    // Returns:
    //   Future with the raw tools/call result; fails with ServerNotFound for an unknown server, with the
    //   server's error (category Rpc or a known category) for an error reply, or with transport errors.
    //==========================================================================================================
    virtual std::future<JSONValue> CallTool(const std::string& serverName,
                                           const std::string& toolName,
                                           const JSONValue& arguments) = 0;

    ////////////////////////////////////////// Generic messaging ///////////////////////////////////////////////
    //==========================================================================================================
    // Sends an arbitrary request to a server.
    // Returns:
    //   Future with the result member of the reply; error replies fail the future as in CallTool.
    //==========================================================================================================
    virtual std::future<JSONValue> SendRequest(const std::string& serverName,
                                              const std::string& method,
                                              const std::optional<JSONValue>& params) = 0;

    // Fire-and-forget notification; fails with ServerNotFound for an unknown server.
    virtual std::future<void> SendNotification(const std::string& serverName,
                                              const std::string& method,
                                              const std::optional<JSONValue>& params) = 0;

    //==========================================================================================================
    // Registers a sink for notifications from every connected server. Applies to servers connected later.
    // Args:
    //   handler: Invoked on the server's I/O thread with the server name and the notification.
    //==========================================================================================================
    using NotificationHandler = std::function<void(const std::string& serverName,
                                                   std::unique_ptr<JSONRPCNotification> notification)>;
    virtual void SetNotificationHandler(NotificationHandler handler) = 0;
};

//==========================================================================================================
// Client
// Purpose: IClient implementation holding one ITransport per server name.
//==========================================================================================================
class Client : public IClient {
public:
    struct Stats {
        std::size_t servers{0};
        std::size_t connected{0};
    };

    //==========================================================================================================
    // Constructs a client that creates transports through the given factory.
    // Args:
    //   factory: Transport factory; defaults to StdioTransportFactory when null.
    //==========================================================================================================
    explicit Client(std::shared_ptr<ITransportFactory> factory = nullptr);
    virtual ~Client();

    ////////////////////////////////////////// IClient implementation //////////////////////////////////////////
    std::future<void> ConnectServer(const std::string& name, const ServerConfig& config) override;
    std::future<void> DisconnectServer(const std::string& name) override;
    bool IsServerConnected(const std::string& name) const override;
    std::vector<std::string> ListServers() const override;

    std::future<JSONValue> CallTool(const std::string& serverName,
                                   const std::string& toolName,
                                   const JSONValue& arguments) override;

    std::future<JSONValue> SendRequest(const std::string& serverName,
                                      const std::string& method,
                                      const std::optional<JSONValue>& params) override;
    std::future<void> SendNotification(const std::string& serverName,
                                      const std::string& method,
                                      const std::optional<JSONValue>& params) override;

    void SetNotificationHandler(NotificationHandler handler) override;

    // Counts of servers with a transport and of those still connected.
    Stats GetStats() const;

    // Closes every transport.
    void DisconnectAll();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcphost
