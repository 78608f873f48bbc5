//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Host example - launch configured MCP servers, run one tool and print execution statistics
//==========================================================================================================

#include "logging/Logger.h"
#include "mcphost/Client.h"
#include "mcphost/ServerManager.h"
#include "mcphost/StdioTransport.hpp"
#include "mcphost/ToolExecutor.h"
#include "mcphost/errors/Errors.h"
#include "mcphost/version.h"
#include <fmt/format.h>
#include <chrono>
#include <iostream>
#include <optional>

using namespace mcphost;

//==========================================================================================================
// getArgValue
// Purpose: Parses key=value style CLI options.
// Args:
//   argc: Argument count
//   argv: Argument vector
//   key: Key string including leading dashes (e.g., "--config")
// Returns:
//   Optional string containing the value when present
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (size_t i = 1; i < static_cast<size_t>(argc); ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

static void printUsage() {
    std::cerr << "usage: mcphost_host_demo --config=<servers.json> [--tool=mcp_<server>_<tool>]"
                 " [--args=<json object>] [--timeout_ms=<n>] [--transport_options=<k=v;...>]" << std::endl;
}

int main(int argc, char** argv) {
    auto configPath = getArgValue(argc, argv, "--config");
    if (!configPath) {
        printUsage();
        return 2;
    }
    LOG_INFO("mcphost {} host demo", getVersionString());

    ServersConfig servers;
    try {
        servers = ServersConfig::LoadFromFile(*configPath);
    } catch (const std::exception& e) {
        LOG_ERROR("Cannot load {}: {}", *configPath, e.what());
        return 1;
    }

    auto factory = std::make_shared<StdioTransportFactory>(getArgValue(argc, argv, "--transport_options").value_or(""));
    auto client = std::make_shared<Client>(factory);
    client->SetNotificationHandler([](const std::string& server, std::unique_ptr<JSONRPCNotification> n) {
        LOG_INFO("Notification from '{}': {}", server, n->method);
    });

    ServerManager manager(client);
    manager.RegisterFromConfig(servers);
    const auto running = manager.StartEnabledServers().get();
    std::cout << fmt::format("servers running: {}/{}", running, servers.EnabledServers().size()) << std::endl;
    for (const auto& name : manager.ListServers()) {
        if (auto s = manager.GetServerInfo(name)) {
            std::cout << fmt::format("  {:<20} {:<9} {}", s->name, ToString(s->status), s->errorMessage.value_or(""))
                      << std::endl;
        }
    }

    ToolExecutor executor(client);
    int rc = 0;
    if (auto toolId = getArgValue(argc, argv, "--tool")) {
        ToolArguments arguments;
        if (auto rawArgs = getArgValue(argc, argv, "--args")) {
            try {
                auto parsed = ParseJSON(*rawArgs);
                if (!parsed.IsObject()) {
                    throw std::runtime_error("--args must be a JSON object");
                }
                for (const auto& [key, value] : std::get<JSONValue::Object>(parsed.value)) {
                    arguments[key] = value ? *value : JSONValue{};
                }
            } catch (const std::runtime_error& e) {
                LOG_ERROR("Bad --args: {}", e.what());
                return 2;
            }
        }
        unsigned long long timeoutMs = 30000;
        try {
            timeoutMs = std::stoull(getArgValue(argc, argv, "--timeout_ms").value_or("30000"));
        } catch (const std::logic_error& e) {
            LOG_ERROR("Bad --timeout_ms: {}", e.what());
            return 2;
        }
        try {
            auto result = executor.ExecuteToolWithTimeout(*toolId, arguments, std::chrono::milliseconds(timeoutMs)).get();
            std::cout << fmt::format("{} ({} ms): {}", result.toolId, result.durationMs, SerializeJSON(result.result))
                      << std::endl;
        } catch (const errors::McpException& e) {
            std::cout << fmt::format("{} failed [{} {}]: {}", *toolId, errors::categoryName(e.category()), e.code(), e.what())
                      << std::endl;
            rc = 1;
        }
    }

    for (const auto& s : executor.GetAllStats()) {
        std::cout << fmt::format("{}: total={} ok={} failed={} avg={:.1f}ms success={:.1f}%", s.toolId,
                                 s.totalExecutions, s.successfulExecutions, s.failedExecutions, s.avgDurationMs,
                                 executor.GetSuccessRate(s.toolId))
                  << std::endl;
    }

    for (const auto& name : manager.ListServers()) {
        if (manager.IsRunning(name)) {
            try {
                manager.StopServer(name).get();
            } catch (const std::exception& e) {
                LOG_WARN("Stopping '{}' failed: {}", name, e.what());
            }
        }
    }
    return rc;
}
