//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_stdio_transport.cpp
// Purpose: StdioTransport tests against the scripted mock server (correlation, timeouts, teardown)
//==========================================================================================================

#include <gtest/gtest.h>

#include <signal.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <fmt/format.h>

#include "mcphost/JSONRPCTypes.h"
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

std::future<std::unique_ptr<JSONRPCResponse>> send(StdioTransport& t, const std::string& method,
                                                   const std::string& paramsJson = "") {
    auto req = std::make_unique<JSONRPCRequest>();
    req->method = method;
    if (!paramsJson.empty()) {
        req->params = ParseJSON(paramsJson);
    }
    return t.SendRequest(std::move(req));
}

std::unique_ptr<JSONRPCResponse> await(std::future<std::unique_ptr<JSONRPCResponse>>& fut) {
    if (fut.wait_for(5s) != std::future_status::ready) {
        ADD_FAILURE() << "response did not arrive";
        return nullptr;
    }
    return fut.get();
}

template <typename T>
void expectFailure(std::future<T>& fut, ErrorCategory category, std::chrono::milliseconds within) {
    ASSERT_EQ(fut.wait_for(within), std::future_status::ready);
    try {
        fut.get();
        FAIL() << "expected " << errors::categoryName(category) << " failure";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.category(), category) << e.what();
    }
}

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds limit = 3000ms) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

} // namespace

TEST(StdioTransport, EchoRoundTrip) {
    StdioTransport t(mockServer());
    ASSERT_NO_THROW(t.Start().get());
    EXPECT_TRUE(t.IsConnected());
    EXPECT_TRUE(t.IsAlive());
    EXPECT_GT(StdioTransportTestHooks::childPid(t), 0);

    auto fut = send(t, "echo", R"({"x":1,"s":"two"})");
    auto resp = await(fut);
    ASSERT_TRUE(resp);
    ASSERT_FALSE(resp->IsError());
    EXPECT_EQ(*resp->result, ParseJSON(R"({"x":1,"s":"two"})"));
    EXPECT_EQ(std::get<int64_t>(resp->id), 1);
    EXPECT_EQ(StdioTransportTestHooks::pendingCount(t), 0u);
    t.Close().get();
}

TEST(StdioTransport, OutOfOrderRepliesAreCorrelated) {
    StdioTransport t(mockServer());
    t.Start().get();

    auto slow = send(t, "sleep", R"({"ms":300,"value":"slow"})");
    auto fast = send(t, "sleep", R"({"ms":20,"value":"fast"})");
    auto now = send(t, "echo", R"("immediate")");

    auto rNow = await(now);
    auto rFast = await(fast);
    auto rSlow = await(slow);
    ASSERT_TRUE(rNow && rFast && rSlow);
    EXPECT_EQ(std::get<std::string>(rNow->result->value), "immediate");
    EXPECT_EQ(std::get<std::string>(rFast->result->value), "fast");
    EXPECT_EQ(std::get<std::string>(rSlow->result->value), "slow");
    EXPECT_EQ(StdioTransportTestHooks::pendingCount(t), 0u);
    t.Close().get();
}

TEST(StdioTransport, ConcurrentSendersGetTheirOwnReplies) {
    StdioTransport t(mockServer());
    t.Start().get();

    constexpr int kThreads = 8;
    constexpr int kPerThread = 25;
    std::atomic<int> matched{0};
    std::vector<std::thread> senders;
    for (int th = 0; th < kThreads; ++th) {
        senders.emplace_back([&t, &matched, th] {
            std::vector<std::future<std::unique_ptr<JSONRPCResponse>>> futs;
            for (int n = 0; n < kPerThread; ++n) {
                futs.push_back(send(t, "echo", fmt::format(R"({{"thread":{},"n":{}}})", th, n)));
            }
            for (int n = 0; n < kPerThread; ++n) {
                auto resp = await(futs[n]);
                if (resp && !resp->IsError() &&
                    *resp->result == ParseJSON(fmt::format(R"({{"thread":{},"n":{}}})", th, n))) {
                    ++matched;
                }
            }
        });
    }
    for (auto& s : senders) s.join();

    EXPECT_EQ(matched.load(), kThreads * kPerThread);
    EXPECT_EQ(StdioTransportTestHooks::pendingCount(t), 0u);
    EXPECT_EQ(StdioTransportTestHooks::unmatchedResponses(t), 0u);
    t.Close().get();
}

TEST(StdioTransport, TimeoutCleansUpAndLateReplyIsDropped) {
    StdioTransport t(mockServer());
    t.SetRequestTimeoutMs(100);
    t.Start().get();

    auto fut = send(t, "sleep", R"({"ms":500,"value":"late"})");
    expectFailure(fut, ErrorCategory::Timeout, 2000ms);
    EXPECT_EQ(StdioTransportTestHooks::pendingCount(t), 0u);

    EXPECT_TRUE(eventually([&] { return StdioTransportTestHooks::unmatchedResponses(t) == 1u; }));
    EXPECT_EQ(StdioTransportTestHooks::pendingCount(t), 0u);

    // The transport stays usable after a timeout
    auto ok = send(t, "echo", "true");
    auto resp = await(ok);
    ASSERT_TRUE(resp);
    EXPECT_TRUE(std::get<bool>(resp->result->value));
    t.Close().get();
}

TEST(StdioTransport, TimeoutChangeAfterStartApplies) {
    StdioTransport t(mockServer());
    t.Start().get();

    std::thread tuner([&t] {
        for (int i = 0; i < 100; ++i) t.SetRequestTimeoutMs(i % 2 ? 5000 : 4000);
        t.SetRequestTimeoutMs(100);
    });
    for (int i = 0; i < 20; ++i) {
        auto fut = send(t, "echo", std::to_string(i));
        ASSERT_TRUE(await(fut));
    }
    tuner.join();

    auto fut = send(t, "sleep", R"({"ms":800,"value":"late"})");
    expectFailure(fut, ErrorCategory::Timeout, 2000ms);
    t.Close().get();
}

TEST(StdioTransport, NotificationsAreFireAndForget) {
    StdioTransport t(mockServer());
    t.Start().get();

    for (int i = 0; i < 3; ++i) {
        auto n = std::make_unique<JSONRPCNotification>("notifications/progress", ParseJSON(R"({"progress":1})"));
        auto done = t.SendNotification(std::move(n));
        EXPECT_EQ(done.wait_for(0ms), std::future_status::ready);
        EXPECT_EQ(StdioTransportTestHooks::pendingCount(t), 0u);
    }

    // Outbound order is preserved, so the server has seen all three before this request
    auto count = send(t, "count_notifications");
    auto resp = await(count);
    ASSERT_TRUE(resp);
    EXPECT_EQ(std::get<int64_t>(resp->result->value), 3);
    t.Close().get();
}

TEST(StdioTransport, ServerNotificationsReachHandler) {
    StdioTransport t(mockServer());
    std::promise<std::string> seen;
    auto seenFut = seen.get_future();
    std::atomic<bool> once{false};
    t.SetNotificationHandler([&](std::unique_ptr<JSONRPCNotification> n) {
        if (!once.exchange(true)) seen.set_value(n->method);
    });
    t.Start().get();

    auto fut = send(t, "notify", R"({"method":"notifications/tools/list_changed"})");
    ASSERT_TRUE(await(fut));
    ASSERT_EQ(seenFut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(seenFut.get(), "notifications/tools/list_changed");
    t.Close().get();
}

TEST(StdioTransport, MalformedLinesAreSkipped) {
    StdioTransport t(mockServer());
    std::atomic<int> protocolErrors{0};
    t.SetErrorHandler([&](const std::string&) { ++protocolErrors; });
    t.Start().get();

    auto fut = send(t, "garbage");
    auto resp = await(fut);
    ASSERT_TRUE(resp);
    EXPECT_EQ(std::get<std::string>(resp->result->value), "after-garbage");
    EXPECT_EQ(protocolErrors.load(), 2);
    EXPECT_TRUE(t.IsConnected());
    t.Close().get();
}

TEST(StdioTransport, UnknownIdIsCountedNotFatal) {
    StdioTransport t(mockServer());
    t.Start().get();
    auto fut = send(t, "stray");
    auto resp = await(fut);
    ASSERT_TRUE(resp);
    EXPECT_EQ(std::get<std::string>(resp->result->value), "ok");
    EXPECT_EQ(StdioTransportTestHooks::unmatchedResponses(t), 1u);
    t.Close().get();
}

TEST(StdioTransport, ErrorRepliesResolveTheFuture) {
    StdioTransport t(mockServer());
    t.Start().get();
    auto fut = send(t, "fail", R"({"code":-32601,"message":"no such method"})");
    auto resp = await(fut);
    ASSERT_TRUE(resp);
    ASSERT_TRUE(resp->IsError());
    auto ex = errors::rpcExceptionFromResponse(*resp);
    EXPECT_EQ(ex.category(), ErrorCategory::JsonRpcMethodNotFound);
    EXPECT_STREQ(ex.what(), "no such method");
    t.Close().get();
}

TEST(StdioTransport, EnvironmentOverlayReachesServer) {
    auto cfg = mockServer();
    cfg.env["MCPHOST_MOCK_GREETING"] = "hello";
    StdioTransport t(cfg);
    t.Start().get();
    auto fut = send(t, "env", R"({"name":"MCPHOST_MOCK_GREETING"})");
    auto resp = await(fut);
    ASSERT_TRUE(resp);
    EXPECT_EQ(std::get<std::string>(resp->result->value), "hello");
    t.Close().get();
}

TEST(StdioTransport, StderrDoesNotDisturbStdout) {
    StdioTransport t(mockServer());
    t.Start().get();
    auto fut = send(t, "stderr", R"({"text":"diagnostic line"})");
    auto resp = await(fut);
    ASSERT_TRUE(resp);
    EXPECT_EQ(std::get<std::string>(resp->result->value), "ok");
    t.Close().get();
}

TEST(StdioTransport, ServerExitFailsPendingImmediately) {
    StdioTransport t(mockServer());
    t.SetRequestTimeoutMs(30000);
    t.Start().get();

    auto silent = send(t, "silent");
    auto exiting = send(t, "exit");
    expectFailure(silent, ErrorCategory::Connection, 3000ms);
    expectFailure(exiting, ErrorCategory::Connection, 3000ms);
    EXPECT_EQ(StdioTransportTestHooks::pendingCount(t), 0u);
    EXPECT_TRUE(eventually([&] { return !t.IsConnected(); }));

    auto after = send(t, "echo");
    expectFailure(after, ErrorCategory::Connection, 100ms);
    EXPECT_EQ(StdioTransportTestHooks::pendingCount(t), 0u);
    t.Close().get();
}

TEST(StdioTransport, CloseFailsPendingAndKillsChild) {
    StdioTransport t(mockServer());
    t.Start().get();
    const long pid = StdioTransportTestHooks::childPid(t);
    ASSERT_GT(pid, 0);

    auto silent = send(t, "silent");
    t.Close().get();
    expectFailure(silent, ErrorCategory::Connection, 1000ms);
    EXPECT_FALSE(t.IsConnected());
    EXPECT_FALSE(t.IsAlive());
    EXPECT_EQ(StdioTransportTestHooks::childPid(t), -1);
    EXPECT_EQ(::kill(static_cast<pid_t>(pid), 0), -1);

    // Idempotent, and later sends fail fast
    EXPECT_NO_THROW(t.Close().get());
    auto after = send(t, "echo");
    expectFailure(after, ErrorCategory::Connection, 100ms);
    auto note = t.SendNotification(std::make_unique<JSONRPCNotification>("notifications/cancelled"));
    EXPECT_NO_THROW(note.get());

    // Nothing is posted to the stopped I/O context once the queue is closed
    const auto wakeups = StdioTransportTestHooks::wakeupsPosted(t);
    for (int i = 0; i < 50; ++i) {
        t.SendNotification(std::make_unique<JSONRPCNotification>("notifications/progress")).get();
    }
    EXPECT_EQ(StdioTransportTestHooks::wakeupsPosted(t), wakeups);
}

TEST(StdioTransport, UnspawnableCommandFailsStart) {
    ServerConfig cfg;
    cfg.command = "/definitely/not/a/real/mcp-server";
    StdioTransport t(cfg);
    auto started = t.Start();
    expectFailure(started, ErrorCategory::Connection, 1000ms);
    EXPECT_FALSE(t.IsConnected());
    EXPECT_FALSE(t.IsAlive());
}

TEST(StdioTransport, SendBeforeStartFails) {
    StdioTransport t(mockServer());
    auto fut = send(t, "echo");
    expectFailure(fut, ErrorCategory::Connection, 100ms);
    EXPECT_EQ(StdioTransportTestHooks::pendingCount(t), 0u);
}

TEST(StdioTransport, OversizedLineIsDiscarded) {
    StdioTransport t(mockServer());
    t.SetMaxLineBytes(128);
    t.SetRequestTimeoutMs(300);
    t.Start().get();

    auto big = send(t, "echo", "\"" + std::string(1000, 'x') + "\"");
    expectFailure(big, ErrorCategory::Timeout, 2000ms);

    auto small = send(t, "echo", "\"small\"");
    auto resp = await(small);
    ASSERT_TRUE(resp);
    EXPECT_EQ(std::get<std::string>(resp->result->value), "small");
    t.Close().get();
}

TEST(StdioTransportFactory, AppliesOptions) {
    StdioTransportFactory factory("timeout_ms=50; max_line_bytes=4096; bogus");
    auto t = factory.CreateTransport(mockServer());
    ASSERT_NO_THROW(t->Start().get());
    auto req = std::make_unique<JSONRPCRequest>();
    req->method = "silent";
    auto fut = t->SendRequest(std::move(req));
    expectFailure(fut, ErrorCategory::Timeout, 2000ms);
    t->Close().get();
}
