//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for the toolhub library (semantic version helpers).
//==========================================================================================================
#pragma once

#include <string>

namespace toolhub {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

// Library semantic version components.
VersionInfo getVersion();

// "MAJOR.MINOR.PATCH"; reported in the hub's server header and startup log.
std::string getVersionString();

} // namespace toolhub
