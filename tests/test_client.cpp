//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_client.cpp
// Purpose: Multi-server Client routing tests against the mock server
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <string>

#include "mcphost/Client.h"
#include "mcphost/StdioTransport.hpp"
#include "mcphost/errors/Errors.h"

using namespace mcphost;
using errors::ErrorCategory;
using namespace std::chrono_literals;

namespace {

ServerConfig mockServer() {
    ServerConfig cfg;
    cfg.command = MCPHOST_MOCK_SERVER_PATH;
    return cfg;
}

template <typename T>
ErrorCategory failureCategory(std::future<T> fut) {
    EXPECT_EQ(fut.wait_for(5s), std::future_status::ready);
    try {
        fut.get();
    } catch (const errors::McpException& e) {
        return e.category();
    }
    ADD_FAILURE() << "future completed without an error";
    return ErrorCategory::Unknown;
}

} // namespace

TEST(Client, ConnectCallAndDisconnect) {
    Client client;
    ASSERT_NO_THROW(client.ConnectServer("files", mockServer()).get());
    EXPECT_TRUE(client.IsServerConnected("files"));
    ASSERT_EQ(client.ListServers().size(), 1u);
    EXPECT_EQ(client.ListServers()[0], "files");

    auto result = client.CallTool("files", "echo", ParseJSON(R"({"path":"/tmp"})")).get();
    EXPECT_EQ(std::get<std::string>(GetMember(result, "tool")->value), "echo");
    EXPECT_EQ(*GetMember(result, "arguments"), ParseJSON(R"({"path":"/tmp"})"));

    client.DisconnectServer("files").get();
    EXPECT_FALSE(client.IsServerConnected("files"));
    EXPECT_TRUE(client.ListServers().empty());
}

TEST(Client, UnknownServerFailsWithServerNotFound) {
    Client client;
    EXPECT_EQ(failureCategory(client.CallTool("nowhere", "echo", JSONValue{JSONValue::Object{}})),
              ErrorCategory::ServerNotFound);
    EXPECT_EQ(failureCategory(client.SendRequest("nowhere", "echo", std::nullopt)), ErrorCategory::ServerNotFound);
    EXPECT_EQ(failureCategory(client.SendNotification("nowhere", "notifications/x", std::nullopt)),
              ErrorCategory::ServerNotFound);
    EXPECT_NO_THROW(client.DisconnectServer("nowhere").get());
}

TEST(Client, ErrorRepliesKeepTheirCode) {
    Client client;
    client.ConnectServer("s", mockServer()).get();

    EXPECT_EQ(failureCategory(client.CallTool("s", "missing_tool", JSONValue{JSONValue::Object{}})),
              ErrorCategory::McpToolNotFound);
    EXPECT_EQ(failureCategory(client.CallTool("s", "fail_tool", JSONValue{JSONValue::Object{}})),
              ErrorCategory::JsonRpcInvalidParams);
    EXPECT_EQ(failureCategory(client.SendRequest("s", "no/such/method", std::nullopt)),
              ErrorCategory::JsonRpcMethodNotFound);

    try {
        client.SendRequest("s", "fail", ParseJSON(R"({"code":-31999,"message":"custom"})")).get();
        FAIL() << "expected failure";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.category(), ErrorCategory::Rpc);
        EXPECT_EQ(e.code(), -31999);
        EXPECT_STREQ(e.what(), "custom");
    }
    // Server stays usable after error replies
    EXPECT_EQ(client.SendRequest("s", "echo", JSONValue{int64_t{5}}).get(), JSONValue{int64_t{5}});
}

TEST(Client, NullResultIsReturnedAsNull) {
    Client client;
    client.ConnectServer("s", mockServer()).get();
    auto result = client.SendRequest("s", "echo", std::nullopt).get();
    EXPECT_TRUE(result.IsNull());
}

TEST(Client, RoutesToTheNamedServer) {
    Client client;
    auto a = mockServer();
    a.env["MCPHOST_MOCK_GREETING"] = "from-a";
    auto b = mockServer();
    b.env["MCPHOST_MOCK_GREETING"] = "from-b";
    client.ConnectServer("a", a).get();
    client.ConnectServer("b", b).get();

    const auto params = ParseJSON(R"({"name":"MCPHOST_MOCK_GREETING"})");
    EXPECT_EQ(std::get<std::string>(client.SendRequest("a", "env", params).get().value), "from-a");
    EXPECT_EQ(std::get<std::string>(client.SendRequest("b", "env", params).get().value), "from-b");

    auto stats = client.GetStats();
    EXPECT_EQ(stats.servers, 2u);
    EXPECT_EQ(stats.connected, 2u);

    client.DisconnectAll();
    EXPECT_EQ(client.GetStats().servers, 0u);
}

TEST(Client, ReconnectReplacesPreviousTransport) {
    Client client;
    client.ConnectServer("s", mockServer()).get();
    client.SendNotification("s", "notifications/initialized", std::nullopt).get();

    client.ConnectServer("s", mockServer()).get();
    EXPECT_EQ(client.ListServers().size(), 1u);
    // A fresh process has seen no notifications yet
    EXPECT_EQ(std::get<int64_t>(client.SendRequest("s", "count_notifications", std::nullopt).get().value), 0);
}

TEST(Client, FailedConnectLeavesNoEntry) {
    Client client;
    ServerConfig bogus;
    bogus.command = "/definitely/not/a/real/mcp-server";
    EXPECT_EQ(failureCategory(client.ConnectServer("bad", bogus)), ErrorCategory::Connection);
    EXPECT_FALSE(client.IsServerConnected("bad"));
    EXPECT_TRUE(client.ListServers().empty());
}

TEST(Client, NotificationsCarryServerName) {
    Client client;
    std::promise<std::pair<std::string, std::string>> seen;
    auto fut = seen.get_future();
    client.SetNotificationHandler([&seen](const std::string& server, std::unique_ptr<JSONRPCNotification> n) {
        seen.set_value({server, n->method});
    });
    client.ConnectServer("watcher", mockServer()).get();
    client.SendRequest("watcher", "notify", ParseJSON(R"({"method":"notifications/resources/updated"})")).get();

    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    auto [server, method] = fut.get();
    EXPECT_EQ(server, "watcher");
    EXPECT_EQ(method, "notifications/resources/updated");
}

TEST(Client, DeadServerReportsDisconnected) {
    Client client;
    client.ConnectServer("s", mockServer()).get();
    EXPECT_EQ(failureCategory(client.SendRequest("s", "exit", std::nullopt)), ErrorCategory::Connection);
    EXPECT_FALSE(client.IsServerConnected("s"));
    EXPECT_EQ(client.GetStats().servers, 1u);
    EXPECT_EQ(client.GetStats().connected, 0u);
    EXPECT_EQ(failureCategory(client.SendRequest("s", "echo", std::nullopt)), ErrorCategory::Connection);
}
