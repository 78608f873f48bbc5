//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_server_manager.cpp
// Purpose: ServerManager lifecycle transitions, restart budget and startup of enabled servers
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "mcphost/Client.h"
#include "mcphost/ServerManager.h"
#include "mcphost/errors/Errors.h"

using namespace mcphost;
using errors::ErrorCategory;
using namespace std::chrono_literals;

namespace {

template <typename T>
std::future<T> readyFuture(T value) {
    std::promise<T> p;
    p.set_value(std::move(value));
    return p.get_future();
}

std::future<void> readyFuture() {
    std::promise<void> p;
    p.set_value();
    return p.get_future();
}

template <typename T>
std::future<T> failedFuture(ErrorCategory category, const std::string& message) {
    std::promise<T> p;
    p.set_exception(std::make_exception_ptr(errors::makeException(category, message)));
    return p.get_future();
}

// Scriptable IClient: connects succeed unless the name is marked failing. While a gate is set,
// connects (or disconnects) stay in flight until the test releases it.
class FakeClient : public IClient {
public:
    std::future<void> ConnectServer(const std::string& name, const ServerConfig&) override {
        std::shared_future<void> gate;
        {
            std::lock_guard<std::mutex> lock(mutex);
            connectCalls.push_back(name);
            gate = connectGate;
        }
        if (gate.valid()) {
            return std::async(std::launch::async, [this, name, gate] {
                gate.wait();
                finishConnect(name);
            });
        }
        try {
            finishConnect(name);
        } catch (const errors::McpException& e) {
            return failedFuture<void>(e.category(), e.what());
        }
        return readyFuture();
    }

    std::future<void> DisconnectServer(const std::string& name) override {
        std::shared_future<void> gate;
        {
            std::lock_guard<std::mutex> lock(mutex);
            disconnectCalls.push_back(name);
            gate = disconnectGate;
        }
        if (gate.valid()) {
            return std::async(std::launch::async, [this, name, gate] {
                gate.wait();
                finishDisconnect(name);
            });
        }
        try {
            finishDisconnect(name);
        } catch (const errors::McpException& e) {
            return failedFuture<void>(e.category(), e.what());
        }
        return readyFuture();
    }

    bool IsServerConnected(const std::string& name) const override {
        std::lock_guard<std::mutex> lock(mutex);
        return connected.count(name) > 0;
    }

    std::vector<std::string> ListServers() const override {
        std::lock_guard<std::mutex> lock(mutex);
        return {connected.begin(), connected.end()};
    }

    std::future<JSONValue> CallTool(const std::string&, const std::string&, const JSONValue&) override {
        return readyFuture(JSONValue{});
    }

    std::future<JSONValue> SendRequest(const std::string&, const std::string&,
                                       const std::optional<JSONValue>&) override {
        return readyFuture(JSONValue{});
    }

    std::future<void> SendNotification(const std::string&, const std::string&,
                                       const std::optional<JSONValue>&) override {
        return readyFuture();
    }

    void SetNotificationHandler(NotificationHandler) override {}

    void setFailing(const std::string& name, bool fail) {
        std::lock_guard<std::mutex> lock(mutex);
        if (fail) {
            failing.insert(name);
        } else {
            failing.erase(name);
        }
    }

    void finishConnect(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex);
        if (failing.count(name)) {
            throw errors::makeException(ErrorCategory::Connection, "spawn failed for " + name);
        }
        connected.insert(name);
    }

    void finishDisconnect(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex);
        if (failDisconnect) {
            throw errors::makeException(ErrorCategory::Connection, "close failed");
        }
        connected.erase(name);
    }

    mutable std::mutex mutex;
    std::shared_future<void> connectGate;
    std::shared_future<void> disconnectGate;
    std::set<std::string> failing;
    std::set<std::string> connected;
    std::vector<std::string> connectCalls;
    std::vector<std::string> disconnectCalls;
    bool failDisconnect{false};
};

ServerConfig config(const std::string& command, bool enabled = true) {
    ServerConfig cfg;
    cfg.command = command;
    cfg.enabled = enabled;
    return cfg;
}

template <typename T>
ErrorCategory failureCategory(std::future<T> fut) {
    try {
        fut.get();
    } catch (const errors::McpException& e) {
        return e.category();
    }
    ADD_FAILURE() << "future completed without an error";
    return ErrorCategory::Unknown;
}

} // namespace

TEST(ServerManager, RegisterLeavesServerStopped) {
    auto client = std::make_shared<FakeClient>();
    ServerManager manager(client);
    manager.RegisterServer("fs", config("fs-server"));

    auto info = manager.GetServerInfo("fs");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->status, ServerStatus::Stopped);
    EXPECT_EQ(info->restartCount, 0u);
    EXPECT_FALSE(info->startedAt.has_value());
    EXPECT_FALSE(info->UptimeSeconds().has_value());
    EXPECT_FALSE(manager.IsRunning("fs"));
    EXPECT_TRUE(client->connectCalls.empty());
}

TEST(ServerManager, StartAndStopTransitions) {
    auto client = std::make_shared<FakeClient>();
    ServerManager manager(client);
    manager.RegisterServer("fs", config("fs-server"));

    ASSERT_NO_THROW(manager.StartServer("fs").get());
    EXPECT_TRUE(manager.IsRunning("fs"));
    auto info = manager.GetServerInfo("fs");
    ASSERT_TRUE(info && info->startedAt.has_value());
    EXPECT_EQ(info->UptimeSeconds().value_or(99), 0u);
    EXPECT_TRUE(client->IsServerConnected("fs"));

    ASSERT_NO_THROW(manager.StopServer("fs").get());
    EXPECT_EQ(manager.GetStatus("fs"), ServerStatus::Stopped);
    EXPECT_FALSE(manager.GetServerInfo("fs")->startedAt.has_value());
    EXPECT_EQ(client->disconnectCalls, std::vector<std::string>{"fs"});
}

TEST(ServerManager, StatusIsStartingAndStoppingWhileInFlight) {
    auto client = std::make_shared<FakeClient>();
    ServerManager manager(client);
    manager.RegisterServer("fs", config("fs-server"));

    std::promise<void> releaseConnect;
    client->connectGate = releaseConnect.get_future().share();
    auto started = manager.StartServer("fs");
    EXPECT_EQ(manager.GetStatus("fs"), ServerStatus::Starting);
    EXPECT_FALSE(manager.IsRunning("fs"));
    EXPECT_EQ(started.wait_for(50ms), std::future_status::timeout);
    releaseConnect.set_value();
    ASSERT_NO_THROW(started.get());
    EXPECT_EQ(manager.GetStatus("fs"), ServerStatus::Running);

    std::promise<void> releaseDisconnect;
    client->disconnectGate = releaseDisconnect.get_future().share();
    auto stopped = manager.StopServer("fs");
    EXPECT_EQ(manager.GetStatus("fs"), ServerStatus::Stopping);
    EXPECT_EQ(stopped.wait_for(50ms), std::future_status::timeout);
    releaseDisconnect.set_value();
    ASSERT_NO_THROW(stopped.get());
    EXPECT_EQ(manager.GetStatus("fs"), ServerStatus::Stopped);
}

TEST(ServerManager, FailingStartPassesThroughStartingAndClearsOldError) {
    auto client = std::make_shared<FakeClient>();
    client->setFailing("broken", true);
    ServerManager manager(client);
    manager.RegisterServer("broken", config("nope"));
    EXPECT_EQ(failureCategory(manager.StartServer("broken")), ErrorCategory::Connection);
    ASSERT_TRUE(manager.GetServerInfo("broken")->errorMessage.has_value());

    std::promise<void> release;
    client->connectGate = release.get_future().share();
    auto started = manager.StartServer("broken");
    auto inFlight = manager.GetServerInfo("broken");
    ASSERT_TRUE(inFlight.has_value());
    EXPECT_EQ(inFlight->status, ServerStatus::Starting);
    EXPECT_FALSE(inFlight->errorMessage.has_value());

    release.set_value();
    EXPECT_EQ(failureCategory(std::move(started)), ErrorCategory::Connection);
    EXPECT_EQ(manager.GetStatus("broken"), ServerStatus::Error);
    EXPECT_EQ(manager.GetServerInfo("broken")->errorMessage.value_or(""), "spawn failed for broken");
}

TEST(ServerManager, FailedStartMovesToError) {
    auto client = std::make_shared<FakeClient>();
    client->setFailing("broken", true);
    ServerManager manager(client);
    manager.RegisterServer("broken", config("nope"));

    EXPECT_EQ(failureCategory(manager.StartServer("broken")), ErrorCategory::Connection);
    auto info = manager.GetServerInfo("broken");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->status, ServerStatus::Error);
    EXPECT_EQ(info->errorMessage.value_or(""), "spawn failed for broken");

    // Error is recoverable, and a new start clears the message
    client->setFailing("broken", false);
    ASSERT_NO_THROW(manager.StartServer("broken").get());
    info = manager.GetServerInfo("broken");
    EXPECT_EQ(info->status, ServerStatus::Running);
    EXPECT_FALSE(info->errorMessage.has_value());
}

TEST(ServerManager, FailedStopMovesToError) {
    auto client = std::make_shared<FakeClient>();
    ServerManager manager(client);
    manager.RegisterServer("fs", config("fs-server"));
    manager.StartServer("fs").get();

    client->failDisconnect = true;
    EXPECT_EQ(failureCategory(manager.StopServer("fs")), ErrorCategory::Connection);
    EXPECT_EQ(manager.GetStatus("fs"), ServerStatus::Error);
    EXPECT_EQ(manager.GetServerInfo("fs")->errorMessage.value_or(""), "close failed");
}

TEST(ServerManager, UnknownNameIsServerNotFound) {
    ServerManager manager(std::make_shared<FakeClient>());
    EXPECT_EQ(failureCategory(manager.StartServer("ghost")), ErrorCategory::ServerNotFound);
    EXPECT_EQ(failureCategory(manager.StopServer("ghost")), ErrorCategory::ServerNotFound);
    EXPECT_EQ(failureCategory(manager.RestartServer("ghost")), ErrorCategory::ServerNotFound);
    EXPECT_FALSE(manager.GetStatus("ghost").has_value());
    EXPECT_FALSE(manager.GetServerInfo("ghost").has_value());
    EXPECT_FALSE(manager.IsRunning("ghost"));
}

TEST(ServerManager, RestartStopsThenStartsAndCounts) {
    auto client = std::make_shared<FakeClient>();
    ServerManager manager(client);
    manager.SetRestartDelay(0ms);
    manager.RegisterServer("fs", config("fs-server"));
    manager.StartServer("fs").get();

    manager.RestartServer("fs").get();
    EXPECT_TRUE(manager.IsRunning("fs"));
    EXPECT_EQ(manager.GetServerInfo("fs")->restartCount, 1u);
    EXPECT_EQ(client->disconnectCalls.size(), 1u);
    EXPECT_EQ(client->connectCalls.size(), 2u);
}

TEST(ServerManager, RestartOfStoppedServerSkipsStop) {
    auto client = std::make_shared<FakeClient>();
    ServerManager manager(client);
    manager.RegisterServer("fs", config("fs-server"));

    manager.RestartServer("fs").get();
    EXPECT_TRUE(manager.IsRunning("fs"));
    EXPECT_TRUE(client->disconnectCalls.empty());
    EXPECT_EQ(manager.GetServerInfo("fs")->restartCount, 1u);
}

TEST(ServerManager, RestartWaitsForDelay) {
    auto client = std::make_shared<FakeClient>();
    ServerManager manager(client);
    manager.SetRestartDelay(150ms);
    manager.RegisterServer("fs", config("fs-server"));
    manager.StartServer("fs").get();

    const auto start = std::chrono::steady_clock::now();
    manager.RestartServer("fs").get();
    EXPECT_GE(std::chrono::steady_clock::now() - start, 150ms);
}

TEST(ServerManager, AutoRestartStopsAfterBudget) {
    auto client = std::make_shared<FakeClient>();
    client->setFailing("flaky", true);
    ServerManager manager(client);
    manager.SetRestartDelay(0ms);
    manager.RegisterServer("flaky", config("flaky"));
    manager.RegisterServer("healthy", config("healthy"));
    manager.StartServer("healthy").get();
    EXPECT_EQ(failureCategory(manager.StartServer("flaky")), ErrorCategory::Connection);

    std::vector<std::size_t> attempted;
    for (int round = 0; round < 5; ++round) {
        attempted.push_back(manager.AutoRestartFailedServers().get().size());
    }
    EXPECT_EQ(attempted, (std::vector<std::size_t>{1, 1, 1, 0, 0}));
    auto info = manager.GetServerInfo("flaky");
    EXPECT_EQ(info->restartCount, ServerManager::kMaxRestartAttempts);
    EXPECT_EQ(info->status, ServerStatus::Error);
    EXPECT_TRUE(manager.IsRunning("healthy"));
    EXPECT_EQ(manager.GetServerInfo("healthy")->restartCount, 0u);
}

TEST(ServerManager, AutoRestartPicksOnlyServersWithBudgetLeft) {
    auto client = std::make_shared<FakeClient>();
    ServerManager manager(client);
    manager.SetRestartDelay(0ms);
    const std::vector<std::string> names{"a", "b", "c", "d", "e"};
    for (const auto& name : names) {
        client->setFailing(name, true);
        manager.RegisterServer(name, config(name));
        EXPECT_EQ(failureCategory(manager.StartServer(name)), ErrorCategory::Connection);
    }
    // Every server fails twice more, then d and e burn their last attempt
    EXPECT_EQ(manager.AutoRestartFailedServers().get(), names);
    EXPECT_EQ(manager.AutoRestartFailedServers().get(), names);
    EXPECT_EQ(failureCategory(manager.RestartServer("d")), ErrorCategory::Connection);
    EXPECT_EQ(failureCategory(manager.RestartServer("e")), ErrorCategory::Connection);

    for (const auto& name : names) {
        auto info = manager.GetServerInfo(name);
        ASSERT_TRUE(info.has_value());
        EXPECT_EQ(info->status, ServerStatus::Error);
        EXPECT_EQ(info->restartCount, (name == "d" || name == "e") ? 3u : 2u) << name;
    }

    EXPECT_EQ(manager.AutoRestartFailedServers().get(), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_TRUE(manager.AutoRestartFailedServers().get().empty());
}

TEST(ServerManager, AutoRestartRecoversServer) {
    auto client = std::make_shared<FakeClient>();
    client->setFailing("flaky", true);
    ServerManager manager(client);
    manager.RegisterServer("flaky", config("flaky"));
    EXPECT_EQ(failureCategory(manager.StartServer("flaky")), ErrorCategory::Connection);

    client->setFailing("flaky", false);
    auto attempted = manager.AutoRestartFailedServers().get();
    EXPECT_EQ(attempted, std::vector<std::string>{"flaky"});
    EXPECT_TRUE(manager.IsRunning("flaky"));
    EXPECT_TRUE(manager.AutoRestartFailedServers().get().empty());
}

TEST(ServerManager, StartEnabledServersSkipsDisabledAndCountsFailures) {
    auto client = std::make_shared<FakeClient>();
    client->setFailing("bad", true);
    ServersConfig servers;
    servers.servers["a"] = config("a");
    servers.servers["b"] = config("b", false);
    servers.servers["bad"] = config("bad");

    ServerManager manager(client);
    manager.RegisterFromConfig(servers);
    EXPECT_EQ(manager.ListServers(), (std::vector<std::string>{"a", "b", "bad"}));

    EXPECT_EQ(manager.StartEnabledServers().get(), 1u);
    EXPECT_TRUE(manager.IsRunning("a"));
    EXPECT_EQ(manager.GetStatus("b"), ServerStatus::Stopped);
    EXPECT_EQ(manager.GetStatus("bad"), ServerStatus::Error);
}

TEST(ServerManager, StatusNames) {
    EXPECT_STREQ(ToString(ServerStatus::Stopped), "stopped");
    EXPECT_STREQ(ToString(ServerStatus::Starting), "starting");
    EXPECT_STREQ(ToString(ServerStatus::Running), "running");
    EXPECT_STREQ(ToString(ServerStatus::Stopping), "stopping");
    EXPECT_STREQ(ToString(ServerStatus::Error), "error");
}

TEST(ServerManager, DrivesRealServerProcess) {
    auto client = std::make_shared<Client>();
    ServerManager manager(client);
    manager.SetRestartDelay(0ms);
    manager.RegisterServer("mock", config(MCPHOST_MOCK_SERVER_PATH));
    manager.RegisterServer("missing", config("/definitely/not/a/real/mcp-server"));

    EXPECT_EQ(manager.StartEnabledServers().get(), 1u);
    EXPECT_TRUE(client->IsServerConnected("mock"));
    EXPECT_EQ(manager.GetStatus("missing"), ServerStatus::Error);

    manager.RestartServer("mock").get();
    EXPECT_TRUE(client->IsServerConnected("mock"));
    EXPECT_EQ(client->SendRequest("mock", "echo", JSONValue{"alive"}).get(), JSONValue{"alive"});

    manager.StopServer("mock").get();
    EXPECT_FALSE(client->IsServerConnected("mock"));
    EXPECT_EQ(manager.GetStatus("mock"), ServerStatus::Stopped);
}
