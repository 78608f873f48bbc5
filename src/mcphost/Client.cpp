//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.cpp
// Purpose: Multi-server MCP client implementation
//==========================================================================================================

#include <map>
#include <mutex>
#include <optional>
#include <utility>

#include "logging/Logger.h"
#include "mcphost/Client.h"
#include "mcphost/StdioTransport.hpp"
#include "mcphost/async/FutureAwaitable.h"
#include "mcphost/async/Task.h"
#include "mcphost/errors/Errors.h"

namespace mcphost {

using errors::ErrorCategory;

class Client::Impl {
public:
    std::shared_ptr<ITransportFactory> factory;

    mutable std::mutex transportsMutex;
    std::map<std::string, std::shared_ptr<ITransport>> transports;

    std::mutex handlerMutex;
    IClient::NotificationHandler notificationHandler;

    explicit Impl(std::shared_ptr<ITransportFactory> f) : factory(std::move(f)) {
        if (!factory) {
            factory = std::make_shared<StdioTransportFactory>();
        }
    }

    std::shared_ptr<ITransport> findTransport(const std::string& serverName) const {
        std::lock_guard<std::mutex> lock(transportsMutex);
        auto it = transports.find(serverName);
        if (it == transports.end()) {
            throw errors::makeException(ErrorCategory::ServerNotFound,
                                        "Server '" + serverName + "' is not connected");
        }
        return it->second;
    }

    void dispatchNotification(const std::string& serverName, std::unique_ptr<JSONRPCNotification> n) {
        IClient::NotificationHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlerMutex);
            handler = notificationHandler;
        }
        if (!handler) {
            LOG_DEBUG("Dropping notification '{}' from server '{}' (no handler)", n->method, serverName);
            return;
        }
        handler(serverName, std::move(n));
    }

    async::Task<void> coConnect(std::string name, ServerConfig config);
    async::Task<void> coDisconnect(std::string name);
    async::Task<JSONValue> coSendRequest(std::string serverName, std::string method, std::optional<JSONValue> params);
    async::Task<void> coSendNotification(std::string serverName, std::string method, std::optional<JSONValue> params);
};

async::Task<void> Client::Impl::coConnect(std::string name, ServerConfig config) {
    FUNC_SCOPE();
    LOG_INFO("Connecting server '{}': {}", name, config.CommandLine());
    std::shared_ptr<ITransport> transport = factory->CreateTransport(config);
    transport->SetNotificationHandler([this, name](std::unique_ptr<JSONRPCNotification> n) {
        dispatchNotification(name, std::move(n));
    });
    transport->SetErrorHandler([name](const std::string& err) {
        LOG_WARN("Server '{}': {}", name, err);
    });
    co_await async::makeFutureAwaitable(transport->Start());

    std::shared_ptr<ITransport> previous;
    {
        std::lock_guard<std::mutex> lock(transportsMutex);
        previous = std::exchange(transports[name], transport);
    }
    if (previous) {
        LOG_INFO("Replacing existing connection for server '{}'", name);
        co_await async::makeFutureAwaitable(previous->Close());
    }
    LOG_INFO("Connected server '{}' (session {})", name, transport->GetSessionId());
    co_return;
}

async::Task<void> Client::Impl::coDisconnect(std::string name) {
    FUNC_SCOPE();
    std::shared_ptr<ITransport> transport;
    {
        std::lock_guard<std::mutex> lock(transportsMutex);
        auto it = transports.find(name);
        if (it != transports.end()) {
            transport = std::move(it->second);
            transports.erase(it);
        }
    }
    if (!transport) {
        LOG_DEBUG("Disconnect: server '{}' has no transport", name);
        co_return;
    }
    co_await async::makeFutureAwaitable(transport->Close());
    LOG_INFO("Disconnected server '{}'", name);
    co_return;
}

async::Task<JSONValue> Client::Impl::coSendRequest(std::string serverName, std::string method,
                                                   std::optional<JSONValue> params) {
    FUNC_SCOPE();
    auto transport = findTransport(serverName);
    auto request = std::make_unique<JSONRPCRequest>();
    request->method = method;
    request->params = std::move(params);
    auto fut = transport->SendRequest(std::move(request));
    transport.reset();

    auto response = co_await async::makeFutureAwaitable(std::move(fut));
    if (!response) {
        throw errors::makeException(ErrorCategory::Connection, "Server '" + serverName + "' returned no response");
    }
    if (response->IsError()) {
        auto ex = errors::rpcExceptionFromResponse(*response);
        LOG_DEBUG("Server '{}' replied to '{}' with error {}: {}", serverName, method, ex.code(), ex.what());
        throw ex;
    }
    co_return response->result.value_or(JSONValue{});
}

async::Task<void> Client::Impl::coSendNotification(std::string serverName, std::string method,
                                                   std::optional<JSONValue> params) {
    FUNC_SCOPE();
    auto transport = findTransport(serverName);
    auto notification = std::make_unique<JSONRPCNotification>(std::move(method), std::move(params));
    co_await async::makeFutureAwaitable(transport->SendNotification(std::move(notification)));
    co_return;
}

Client::Client(std::shared_ptr<ITransportFactory> factory)
    : pImpl(std::make_unique<Impl>(std::move(factory))) {
    FUNC_SCOPE();
}

Client::~Client() {
    FUNC_SCOPE();
    DisconnectAll();
}

std::future<void> Client::ConnectServer(const std::string& name, const ServerConfig& config) {
    FUNC_SCOPE();
    return pImpl->coConnect(name, config).toFuture();
}

std::future<void> Client::DisconnectServer(const std::string& name) {
    FUNC_SCOPE();
    return pImpl->coDisconnect(name).toFuture();
}

bool Client::IsServerConnected(const std::string& name) const {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->transportsMutex);
    auto it = pImpl->transports.find(name);
    return it != pImpl->transports.end() && it->second->IsConnected();
}

std::vector<std::string> Client::ListServers() const {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->transportsMutex);
    std::vector<std::string> names;
    names.reserve(pImpl->transports.size());
    for (const auto& [name, transport] : pImpl->transports) {
        names.push_back(name);
    }
    return names;
}

std::future<JSONValue> Client::CallTool(const std::string& serverName,
                                        const std::string& toolName,
                                        const JSONValue& arguments) {
    FUNC_SCOPE();
    JSONValue::Object paramsObj;
    paramsObj["name"] = std::make_shared<JSONValue>(toolName);
    paramsObj["arguments"] = std::make_shared<JSONValue>(arguments);
    LOG_DEBUG("Calling tool '{}' on server '{}'", toolName, serverName);
    return pImpl->coSendRequest(serverName, Methods::CallTool, JSONValue{paramsObj}).toFuture();
}

std::future<JSONValue> Client::SendRequest(const std::string& serverName,
                                           const std::string& method,
                                           const std::optional<JSONValue>& params) {
    FUNC_SCOPE();
    return pImpl->coSendRequest(serverName, method, params).toFuture();
}

std::future<void> Client::SendNotification(const std::string& serverName,
                                           const std::string& method,
                                           const std::optional<JSONValue>& params) {
    FUNC_SCOPE();
    return pImpl->coSendNotification(serverName, method, params).toFuture();
}

void Client::SetNotificationHandler(NotificationHandler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->handlerMutex);
    pImpl->notificationHandler = std::move(handler);
}

Client::Stats Client::GetStats() const {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->transportsMutex);
    Stats stats;
    stats.servers = pImpl->transports.size();
    for (const auto& [name, transport] : pImpl->transports) {
        if (transport->IsConnected()) {
            ++stats.connected;
        }
    }
    return stats;
}

void Client::DisconnectAll() {
    FUNC_SCOPE();
    std::map<std::string, std::shared_ptr<ITransport>> drained;
    {
        std::lock_guard<std::mutex> lock(pImpl->transportsMutex);
        drained.swap(pImpl->transports);
    }
    for (auto& [name, transport] : drained) {
        transport->Close().get();
        LOG_DEBUG("Closed transport for server '{}'", name);
    }
}

} // namespace mcphost
