//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.h
// Purpose: Launch configuration for MCP server processes and the mcpServers JSON config file
//==========================================================================================================
#pragma once

#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include "mcphost/JSONRPCTypes.h"

namespace mcphost {

//==========================================================================================================
// ServerConfig
// Purpose: How to launch one MCP server.
// Fields:
//   command: Executable name or path (resolved through PATH when it has no slash).
//   args: Arguments passed after the command.
//   env: Variables overlaid on the inherited environment.
//   enabled: Whether StartEnabledServers() launches it.
//==========================================================================================================
struct ServerConfig {
    std::string command;
    std::vector<std::string> args;
    std::unordered_map<std::string, std::string> env;
    bool enabled{true};

    // Human-readable "command arg1 arg2" for logs.
    std::string CommandLine() const;

    JSONValue ToJSON() const;

    //==========================================================================================================
    // FromJSON
    // Purpose: Reads { "command": str, "args"?: [str], "env"?: {str: str}, "enabled"?: bool }.
    // Throws:
    //   std::runtime_error naming the offending field.
    //==========================================================================================================
    static ServerConfig FromJSON(const JSONValue& value);
};

//==========================================================================================================
// ServersConfig
// Purpose: The set of named servers persisted as { "mcpServers": { "<name>": ServerConfig } }.
//==========================================================================================================
struct ServersConfig {
    std::map<std::string, ServerConfig> servers;

    JSONValue ToJSON() const;
    static ServersConfig FromJSON(const JSONValue& value);

    //==========================================================================================================
    // LoadFromFile / SaveToFile
    // Purpose: Read or write the JSON config file.
    // Throws:
    //   std::runtime_error when the file cannot be opened, read, written or parsed.
    //==========================================================================================================
    static ServersConfig LoadFromFile(const std::string& path);
    void SaveToFile(const std::string& path) const;

    //==========================================================================================================
    // SetEnabled
    // Purpose: Toggle whether a configured server is launched at startup.
    // Throws:
    //   std::invalid_argument for a blank or unknown name.
    //==========================================================================================================
    void SetEnabled(const std::string& name, bool enabled);

    std::vector<std::string> EnabledServers() const;
};

} // namespace mcphost
