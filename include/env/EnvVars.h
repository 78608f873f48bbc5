//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read MCPHOST_* environment overrides safely.
//==========================================================================================================
#pragma once
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset/empty.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    return (v != nullptr && *v != '\0') ? std::string(v) : defaultValue;
}

//==========================================================================================================
// GetEnvUint64
// Purpose: Reads an unsigned integer override (e.g. MCPHOST_STDIOTRANSPORT_TIMEOUT_MS).
// Args:
//   name: Environment variable name.
// Returns:
//   The parsed value, or std::nullopt when unset or not a valid unsigned number.
//==========================================================================================================
inline std::optional<uint64_t> GetEnvUint64(const char* name) {
    const std::string raw = GetEnvOrDefault(name, "");
    if (raw.empty() || raw.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    try {
        return static_cast<uint64_t>(std::stoull(raw));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

//==========================================================================================================
// GetEnvFlag
// Purpose: Reads a boolean switch ("1", "true", "TRUE" are on; anything else is off).
//==========================================================================================================
inline bool GetEnvFlag(const char* name, bool defaultValue) {
    const std::string v = GetEnvOrDefault(name, defaultValue ? "1" : "0");
    return v == "1" || v == "true" || v == "TRUE";
}
