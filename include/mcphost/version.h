//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Version of the mcphost runtime, reported in logs and by the host demo
//==========================================================================================================
#pragma once

#include <string>

namespace mcphost {

// Semantic version components; kept in step with the project() version in CMakeLists.txt.
struct VersionInfo {
    int major{0};
    int minor{0};
    int patch{0};
};

VersionInfo getVersion();

// "MAJOR.MINOR.PATCH"
std::string getVersionString();

} // namespace mcphost
