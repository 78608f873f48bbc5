//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_server_config.cpp
// Purpose: GoogleTests for the mcpServers config model, its JSON mapping and file persistence
//==========================================================================================================

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unistd.h>

#include "mcphost/ServerConfig.h"

using namespace mcphost;

namespace {

std::string tempPath(const std::string& stem) {
    return "/tmp/mcphost_" + stem + "_" + std::to_string(::getpid()) + ".json";
}

const char* kConfigText = R"({
  "mcpServers": {
    "filesystem": {
      "command": "npx",
      "args": ["-y", "@modelcontextprotocol/server-filesystem", "/tmp"],
      "env": {"LOG_LEVEL": "debug"}
    },
    "github": {"command": "github-mcp", "enabled": false}
  }
})";

} // namespace

TEST(ServerConfig, ParsesDefaults) {
    auto cfg = ServersConfig::FromJSON(ParseJSON(kConfigText));
    ASSERT_EQ(cfg.servers.size(), 2u);
    const auto& fs = cfg.servers.at("filesystem");
    EXPECT_EQ(fs.command, "npx");
    ASSERT_EQ(fs.args.size(), 3u);
    EXPECT_EQ(fs.args[2], "/tmp");
    EXPECT_EQ(fs.env.at("LOG_LEVEL"), "debug");
    EXPECT_TRUE(fs.enabled);
    EXPECT_EQ(fs.CommandLine(), "npx -y @modelcontextprotocol/server-filesystem /tmp");

    const auto& gh = cfg.servers.at("github");
    EXPECT_TRUE(gh.args.empty());
    EXPECT_TRUE(gh.env.empty());
    EXPECT_FALSE(gh.enabled);

    EXPECT_EQ(cfg.EnabledServers(), std::vector<std::string>{"filesystem"});
}

TEST(ServerConfig, RejectsMalformedEntries) {
    EXPECT_THROW(ServersConfig::FromJSON(ParseJSON(R"({"servers":{}})")), std::runtime_error);
    EXPECT_THROW(ServersConfig::FromJSON(ParseJSON(R"({"mcpServers":[]})")), std::runtime_error);
    EXPECT_THROW(ServersConfig::FromJSON(ParseJSON(R"({"mcpServers":{"a":{"args":[]}}})")), std::runtime_error);
    EXPECT_THROW(ServersConfig::FromJSON(ParseJSON(R"({"mcpServers":{"a":{"command":"x","args":[1]}}})")),
                 std::runtime_error);
    EXPECT_THROW(ServersConfig::FromJSON(ParseJSON(R"({"mcpServers":{"a":{"command":"x","enabled":"yes"}}})")),
                 std::runtime_error);
    EXPECT_THROW(ServersConfig::FromJSON(ParseJSON(R"({"mcpServers":{"a":{"command":"  "}}})")), std::runtime_error);
}

TEST(ServerConfig, ErrorNamesTheServer) {
    try {
        ServersConfig::FromJSON(ParseJSON(R"({"mcpServers":{"broken":{"command":7}}})"));
        FAIL() << "expected runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("broken"), std::string::npos);
    }
}

TEST(ServerConfig, SaveThenLoadPreservesServers) {
    auto cfg = ServersConfig::FromJSON(ParseJSON(kConfigText));
    const auto path = tempPath("roundtrip");
    cfg.SaveToFile(path);
    auto loaded = ServersConfig::LoadFromFile(path);
    std::remove(path.c_str());

    ASSERT_EQ(loaded.servers.size(), 2u);
    EXPECT_EQ(loaded.servers.at("filesystem").args, cfg.servers.at("filesystem").args);
    EXPECT_EQ(loaded.servers.at("filesystem").env, cfg.servers.at("filesystem").env);
    EXPECT_FALSE(loaded.servers.at("github").enabled);
}

TEST(ServerConfig, LoadReportsMissingAndInvalidFiles) {
    EXPECT_THROW(ServersConfig::LoadFromFile("/nonexistent/dir/mcp.json"), std::runtime_error);

    const auto path = tempPath("invalid");
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(ServersConfig::LoadFromFile(path), std::runtime_error);
    std::remove(path.c_str());
}

TEST(ServerConfig, SetEnabledValidatesName) {
    auto cfg = ServersConfig::FromJSON(ParseJSON(kConfigText));
    cfg.SetEnabled("github", true);
    EXPECT_TRUE(cfg.servers.at("github").enabled);
    cfg.SetEnabled("filesystem", false);
    EXPECT_EQ(cfg.EnabledServers(), std::vector<std::string>{"github"});
    EXPECT_THROW(cfg.SetEnabled("", true), std::invalid_argument);
    EXPECT_THROW(cfg.SetEnabled("   ", true), std::invalid_argument);
    EXPECT_THROW(cfg.SetEnabled("unknown", true), std::invalid_argument);
}
