//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerManager.cpp
// Purpose: Server lifecycle state machine implementation
//==========================================================================================================

#include <map>
#include <mutex>
#include <utility>

#include "logging/Logger.h"
#include "mcphost/ServerManager.h"
#include "mcphost/async/FutureAwaitable.h"
#include "mcphost/async/Task.h"
#include "mcphost/errors/Errors.h"

namespace mcphost {

using errors::ErrorCategory;

const char* ToString(ServerStatus status) {
    switch (status) {
        case ServerStatus::Stopped: return "stopped";
        case ServerStatus::Starting: return "starting";
        case ServerStatus::Running: return "running";
        case ServerStatus::Stopping: return "stopping";
        case ServerStatus::Error: return "error";
    }
    return "unknown";
}

std::optional<uint64_t> ManagedServer::UptimeSeconds() const {
    if (!startedAt) {
        return std::nullopt;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now() - *startedAt);
    return elapsed.count() > 0 ? static_cast<uint64_t>(elapsed.count()) : 0;
}

class ServerManager::Impl {
public:
    std::shared_ptr<IClient> client;

    mutable std::mutex tableMutex; // protects servers and restartDelay
    std::map<std::string, ManagedServer> servers;
    std::chrono::milliseconds restartDelay{500};

    explicit Impl(std::shared_ptr<IClient> c) : client(std::move(c)) {}

    // Applies fn to the entry when it still exists.
    template <typename Fn>
    void update(const std::string& name, Fn&& fn) {
        std::lock_guard<std::mutex> lock(tableMutex);
        auto it = servers.find(name);
        if (it != servers.end()) {
            fn(it->second);
        }
    }

    static errors::McpException notFound(const std::string& name) {
        return errors::makeException(ErrorCategory::ServerNotFound, "Server '" + name + "' is not registered");
    }

    using ImplPtr = std::shared_ptr<Impl>;
    static async::Task<void> coStart(ImplPtr self, std::string name);
    static async::Task<void> coStop(ImplPtr self, std::string name);
    static async::Task<void> coRestart(ImplPtr self, std::string name);
    static async::Task<std::vector<std::string>> coAutoRestart(ImplPtr self);
    static async::Task<std::size_t> coStartEnabled(ImplPtr self);
};

async::Task<void> ServerManager::Impl::coStart(ImplPtr self, std::string name) {
    FUNC_SCOPE();
    ServerConfig config;
    {
        std::lock_guard<std::mutex> lock(self->tableMutex);
        auto it = self->servers.find(name);
        if (it == self->servers.end()) {
            throw notFound(name);
        }
        it->second.status = ServerStatus::Starting;
        it->second.errorMessage.reset();
        config = it->second.config;
    }
    LOG_INFO("Starting server '{}'", name);
    try {
        co_await async::makeFutureAwaitable(self->client->ConnectServer(name, config));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start server '{}': {}", name, e.what());
        self->update(name, [&e](ManagedServer& s) {
            s.status = ServerStatus::Error;
            s.errorMessage = e.what();
        });
        throw;
    }
    self->update(name, [](ManagedServer& s) {
        s.status = ServerStatus::Running;
        s.startedAt = std::chrono::system_clock::now();
    });
    LOG_INFO("Server '{}' is running", name);
    co_return;
}

async::Task<void> ServerManager::Impl::coStop(ImplPtr self, std::string name) {
    FUNC_SCOPE();
    {
        std::lock_guard<std::mutex> lock(self->tableMutex);
        auto it = self->servers.find(name);
        if (it == self->servers.end()) {
            throw notFound(name);
        }
        it->second.status = ServerStatus::Stopping;
    }
    LOG_INFO("Stopping server '{}'", name);
    try {
        co_await async::makeFutureAwaitable(self->client->DisconnectServer(name));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to stop server '{}': {}", name, e.what());
        self->update(name, [&e](ManagedServer& s) {
            s.status = ServerStatus::Error;
            s.errorMessage = e.what();
        });
        throw;
    }
    self->update(name, [](ManagedServer& s) {
        s.status = ServerStatus::Stopped;
        s.startedAt.reset();
    });
    LOG_INFO("Server '{}' stopped", name);
    co_return;
}

async::Task<void> ServerManager::Impl::coRestart(ImplPtr self, std::string name) {
    FUNC_SCOPE();
    bool wasRunning = false;
    std::chrono::milliseconds delay{0};
    {
        std::lock_guard<std::mutex> lock(self->tableMutex);
        auto it = self->servers.find(name);
        if (it == self->servers.end()) {
            throw notFound(name);
        }
        wasRunning = it->second.status == ServerStatus::Running;
        delay = self->restartDelay;
    }
    LOG_INFO("Restarting server '{}'", name);
    if (wasRunning) {
        co_await async::makeFutureAwaitable(coStop(self, name).toFuture());
        co_await async::sleepFor(delay);
    }
    self->update(name, [](ManagedServer& s) { ++s.restartCount; });
    co_await async::makeFutureAwaitable(coStart(self, name).toFuture());
    co_return;
}

async::Task<std::vector<std::string>> ServerManager::Impl::coAutoRestart(ImplPtr self) {
    FUNC_SCOPE();
    std::vector<std::string> candidates;
    {
        std::lock_guard<std::mutex> lock(self->tableMutex);
        for (const auto& [name, server] : self->servers) {
            if (server.status != ServerStatus::Error) {
                continue;
            }
            if (server.restartCount < ServerManager::kMaxRestartAttempts) {
                candidates.push_back(name);
            } else {
                LOG_WARN("Server '{}' exhausted its {} restart attempts; leaving it in error", name,
                         ServerManager::kMaxRestartAttempts);
            }
        }
    }
    for (const auto& name : candidates) {
        try {
            co_await async::makeFutureAwaitable(coRestart(self, name).toFuture());
        } catch (const std::exception& e) {
            LOG_WARN("Auto-restart of server '{}' failed: {}", name, e.what());
        }
    }
    co_return candidates;
}

async::Task<std::size_t> ServerManager::Impl::coStartEnabled(ImplPtr self) {
    FUNC_SCOPE();
    std::vector<std::string> enabled;
    {
        std::lock_guard<std::mutex> lock(self->tableMutex);
        for (const auto& [name, server] : self->servers) {
            if (server.config.enabled) {
                enabled.push_back(name);
            }
        }
    }
    std::size_t running = 0;
    for (const auto& name : enabled) {
        try {
            co_await async::makeFutureAwaitable(coStart(self, name).toFuture());
            ++running;
        } catch (const std::exception& e) {
            LOG_WARN("Server '{}' did not start: {}", name, e.what());
        }
    }
    LOG_INFO("Started {}/{} enabled server(s)", running, enabled.size());
    co_return running;
}

ServerManager::ServerManager(std::shared_ptr<IClient> client) : pImpl(std::make_shared<Impl>(std::move(client))) {
    FUNC_SCOPE();
}

ServerManager::~ServerManager() { FUNC_SCOPE(); }

void ServerManager::RegisterServer(const std::string& name, const ServerConfig& config) {
    FUNC_SCOPE();
    ManagedServer server;
    server.name = name;
    server.config = config;
    std::lock_guard<std::mutex> lock(pImpl->tableMutex);
    pImpl->servers[name] = std::move(server);
    LOG_DEBUG("Registered server '{}': {}", name, config.CommandLine());
}

void ServerManager::RegisterFromConfig(const ServersConfig& config) {
    FUNC_SCOPE();
    for (const auto& [name, serverConfig] : config.servers) {
        RegisterServer(name, serverConfig);
    }
}

std::future<void> ServerManager::StartServer(const std::string& name) {
    FUNC_SCOPE();
    return Impl::coStart(pImpl, name).toFuture();
}

std::future<void> ServerManager::StopServer(const std::string& name) {
    FUNC_SCOPE();
    return Impl::coStop(pImpl, name).toFuture();
}

std::future<void> ServerManager::RestartServer(const std::string& name) {
    FUNC_SCOPE();
    return Impl::coRestart(pImpl, name).toFuture();
}

std::future<std::vector<std::string>> ServerManager::AutoRestartFailedServers() {
    FUNC_SCOPE();
    return Impl::coAutoRestart(pImpl).toFuture();
}

std::future<std::size_t> ServerManager::StartEnabledServers() {
    FUNC_SCOPE();
    return Impl::coStartEnabled(pImpl).toFuture();
}

void ServerManager::SetRestartDelay(std::chrono::milliseconds delay) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->tableMutex);
    pImpl->restartDelay = delay;
}

bool ServerManager::IsRunning(const std::string& name) const {
    std::lock_guard<std::mutex> lock(pImpl->tableMutex);
    auto it = pImpl->servers.find(name);
    return it != pImpl->servers.end() && it->second.status == ServerStatus::Running;
}

std::optional<ServerStatus> ServerManager::GetStatus(const std::string& name) const {
    std::lock_guard<std::mutex> lock(pImpl->tableMutex);
    auto it = pImpl->servers.find(name);
    if (it == pImpl->servers.end()) {
        return std::nullopt;
    }
    return it->second.status;
}

std::vector<std::string> ServerManager::ListServers() const {
    std::lock_guard<std::mutex> lock(pImpl->tableMutex);
    std::vector<std::string> out;
    out.reserve(pImpl->servers.size());
    for (const auto& [name, server] : pImpl->servers) {
        out.push_back(name);
    }
    return out;
}

std::optional<ManagedServer> ServerManager::GetServerInfo(const std::string& name) const {
    std::lock_guard<std::mutex> lock(pImpl->tableMutex);
    auto it = pImpl->servers.find(name);
    if (it == pImpl->servers.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace mcphost
