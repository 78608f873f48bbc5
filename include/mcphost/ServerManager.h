//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerManager.h
// Purpose: Lifecycle state machine over the named MCP servers connected through an IClient
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcphost/Client.h"
#include "mcphost/ServerConfig.h"

namespace mcphost {

//==========================================================================================================
// ServerStatus
// Purpose: Stopped -> Starting -> Running -> Stopping -> Stopped, with Error reachable from Starting and
//          Stopping. Error is recoverable through StartServer/RestartServer.
//==========================================================================================================
enum class ServerStatus {
    Stopped,
    Starting,
    Running,
    Stopping,
    Error
};

const char* ToString(ServerStatus status);

//==========================================================================================================
// ManagedServer
// Purpose: Snapshot of one registered server.
// Fields:
//   startedAt: Set when the server reached Running; cleared when it stops.
//   errorMessage: Reason of the last failed start/stop; cleared when a start begins.
//   restartCount: Incremented by every RestartServer call, successful or not.
//==========================================================================================================
struct ManagedServer {
    std::string name;
    ServerConfig config;
    ServerStatus status{ServerStatus::Stopped};
    std::optional<std::chrono::system_clock::time_point> startedAt;
    std::optional<std::string> errorMessage;
    uint32_t restartCount{0};

    // Whole seconds since startedAt; nullopt when not started.
    std::optional<uint64_t> UptimeSeconds() const;
};

//==========================================================================================================
// ServerManager
// Purpose: Owns the server table and drives each server's transitions through IClient.
// Notes:
//   - The table lock is never held across IClient calls; queries return copies.
//   - Lifecycle failures move the server to Error and are rethrown through the returned future.
//==========================================================================================================
class ServerManager {
public:
    // Servers that failed this many restarts are left alone by AutoRestartFailedServers().
    static constexpr uint32_t kMaxRestartAttempts = 3;

    explicit ServerManager(std::shared_ptr<IClient> client);
    ~ServerManager();

    ServerManager(const ServerManager&) = delete;
    ServerManager& operator=(const ServerManager&) = delete;

    //==========================================================================================================
    // RegisterServer
    // Purpose: Adds (or replaces) an entry in Stopped state. Nothing is launched.
    //==========================================================================================================
    void RegisterServer(const std::string& name, const ServerConfig& config);

    // Registers every server in the config file model.
    void RegisterFromConfig(const ServersConfig& config);

    //==========================================================================================================
    // StartServer
    // Purpose: Starting, then connect through IClient::ConnectServer; Running with startedAt on success.
    // Returns:
    //   Future failing with ServerNotFound for an unknown name, or with the connect error after the server
    //   has been moved to Error.
    //==========================================================================================================
    std::future<void> StartServer(const std::string& name);

    //==========================================================================================================
    // StopServer
    // Purpose: Stopping, then IClient::DisconnectServer; Stopped with startedAt cleared on success.
    //==========================================================================================================
    std::future<void> StopServer(const std::string& name);

    //==========================================================================================================
    // RestartServer
    // Purpose: Stops a Running server and waits the restart delay, increments restartCount, then starts.
    //==========================================================================================================
    std::future<void> RestartServer(const std::string& name);

    //==========================================================================================================
    // AutoRestartFailedServers
    // Purpose: Restarts every server in Error whose restartCount is below kMaxRestartAttempts. Individual
    //          failures are logged, not propagated.
    // Returns:
    //   Future with the names that were attempted, in name order.
    //==========================================================================================================
    std::future<std::vector<std::string>> AutoRestartFailedServers();

    //==========================================================================================================
    // StartEnabledServers
    // Purpose: Starts every registered server whose config is enabled; failures are logged.
    // Returns:
    //   Future with the number of servers that reached Running.
    //==========================================================================================================
    std::future<std::size_t> StartEnabledServers();

    // Settle delay applied between stop and start of a running server (default 500 ms).
    void SetRestartDelay(std::chrono::milliseconds delay);

    bool IsRunning(const std::string& name) const;
    std::optional<ServerStatus> GetStatus(const std::string& name) const;
    // Registered names in name order
    std::vector<std::string> ListServers() const;
    std::optional<ManagedServer> GetServerInfo(const std::string& name) const;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace mcphost
