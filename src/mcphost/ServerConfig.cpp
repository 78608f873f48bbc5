//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.cpp
// Purpose: JSON mapping and file persistence for server launch configuration
//==========================================================================================================

#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "mcphost/ServerConfig.h"

namespace mcphost {

namespace {

const std::string& requireString(const JSONValue& v, const std::string& what) {
    const auto* s = std::get_if<std::string>(&v.value);
    if (s == nullptr) {
        throw std::runtime_error(fmt::format("{} must be a string", what));
    }
    return *s;
}

bool isBlank(const std::string& s) {
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // namespace

std::string ServerConfig::CommandLine() const {
    std::string line = command;
    for (const auto& a : args) {
        line.push_back(' ');
        line += a;
    }
    return line;
}

JSONValue ServerConfig::ToJSON() const {
    JSONValue::Object obj;
    obj["command"] = std::make_shared<JSONValue>(command);
    JSONValue::Array argArr;
    for (const auto& a : args) {
        argArr.push_back(std::make_shared<JSONValue>(a));
    }
    obj["args"] = std::make_shared<JSONValue>(std::move(argArr));
    JSONValue::Object envObj;
    for (const auto& [k, v] : env) {
        envObj[k] = std::make_shared<JSONValue>(v);
    }
    obj["env"] = std::make_shared<JSONValue>(std::move(envObj));
    obj["enabled"] = std::make_shared<JSONValue>(enabled);
    return JSONValue{std::move(obj)};
}

ServerConfig ServerConfig::FromJSON(const JSONValue& value) {
    if (!value.IsObject()) {
        throw std::runtime_error("server entry must be an object");
    }
    ServerConfig cfg;
    const JSONValue* command = GetMember(value, "command");
    if (command == nullptr) {
        throw std::runtime_error("server entry is missing \"command\"");
    }
    cfg.command = requireString(*command, "command");
    if (isBlank(cfg.command)) {
        throw std::runtime_error("command must not be empty");
    }

    if (const JSONValue* args = GetMember(value, "args")) {
        const auto* arr = std::get_if<JSONValue::Array>(&args->value);
        if (arr == nullptr) {
            throw std::runtime_error("args must be an array of strings");
        }
        for (const auto& item : *arr) {
            if (!item) throw std::runtime_error("args must be an array of strings");
            cfg.args.push_back(requireString(*item, "args element"));
        }
    }

    if (const JSONValue* env = GetMember(value, "env")) {
        const auto* obj = std::get_if<JSONValue::Object>(&env->value);
        if (obj == nullptr) {
            throw std::runtime_error("env must be an object of strings");
        }
        for (const auto& [k, v] : *obj) {
            if (!v) throw std::runtime_error(fmt::format("env.{} must be a string", k));
            cfg.env[k] = requireString(*v, "env." + k);
        }
    }

    if (const JSONValue* enabled = GetMember(value, "enabled")) {
        const auto* b = std::get_if<bool>(&enabled->value);
        if (b == nullptr) {
            throw std::runtime_error("enabled must be a boolean");
        }
        cfg.enabled = *b;
    }
    return cfg;
}

JSONValue ServersConfig::ToJSON() const {
    JSONValue::Object serversObj;
    for (const auto& [name, cfg] : servers) {
        serversObj[name] = std::make_shared<JSONValue>(cfg.ToJSON());
    }
    JSONValue::Object root;
    root["mcpServers"] = std::make_shared<JSONValue>(std::move(serversObj));
    return JSONValue{std::move(root)};
}

ServersConfig ServersConfig::FromJSON(const JSONValue& value) {
    ServersConfig out;
    const JSONValue* serversVal = GetMember(value, "mcpServers");
    if (serversVal == nullptr) {
        throw std::runtime_error("config is missing \"mcpServers\"");
    }
    const auto* obj = std::get_if<JSONValue::Object>(&serversVal->value);
    if (obj == nullptr) {
        throw std::runtime_error("\"mcpServers\" must be an object");
    }
    for (const auto& [name, entry] : *obj) {
        if (isBlank(name)) {
            throw std::runtime_error("server names must not be blank");
        }
        if (!entry) {
            throw std::runtime_error(fmt::format("server '{}' has no configuration", name));
        }
        try {
            out.servers[name] = ServerConfig::FromJSON(*entry);
        } catch (const std::runtime_error& e) {
            throw std::runtime_error(fmt::format("server '{}': {}", name, e.what()));
        }
    }
    return out;
}

ServersConfig ServersConfig::LoadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error(fmt::format("cannot open MCP config file '{}'", path));
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad()) {
        throw std::runtime_error(fmt::format("failed reading MCP config file '{}'", path));
    }
    try {
        auto cfg = FromJSON(ParseJSON(buf.str()));
        LOG_INFO("Loaded {} MCP server definition(s) from {}", cfg.servers.size(), path);
        return cfg;
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(fmt::format("invalid MCP config file '{}': {}", path, e.what()));
    }
}

void ServersConfig::SaveToFile(const std::string& path) const {
    const std::string text = SerializeJSON(ToJSON());
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error(fmt::format("cannot write MCP config file '{}'", path));
    }
    out << text << '\n';
    out.flush();
    if (!out.good()) {
        throw std::runtime_error(fmt::format("failed writing MCP config file '{}'", path));
    }
}

void ServersConfig::SetEnabled(const std::string& name, bool enabled) {
    if (isBlank(name)) {
        throw std::invalid_argument("server name must not be blank");
    }
    auto it = servers.find(name);
    if (it == servers.end()) {
        throw std::invalid_argument(fmt::format("server '{}' is not configured", name));
    }
    it->second.enabled = enabled;
}

std::vector<std::string> ServersConfig::EnabledServers() const {
    std::vector<std::string> names;
    for (const auto& [name, cfg] : servers) {
        if (cfg.enabled) names.push_back(name);
    }
    return names;
}

} // namespace mcphost
