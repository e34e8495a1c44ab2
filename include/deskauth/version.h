//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Library version and the User-Agent string sent on provider/backend requests.
//==========================================================================================================
#pragma once

#include <string>

// Overridden by the build (project(VERSION ...)).
#ifndef DESKAUTH_VERSION_MAJOR
#define DESKAUTH_VERSION_MAJOR 0
#endif
#ifndef DESKAUTH_VERSION_MINOR
#define DESKAUTH_VERSION_MINOR 1
#endif
#ifndef DESKAUTH_VERSION_PATCH
#define DESKAUTH_VERSION_PATCH 0
#endif

namespace deskauth {

struct VersionInfo {
    int major;
    int minor;
    int patch;
};

//==========================================================================================================
// getVersion / getVersionString
// Returns:
//   VersionInfo {major, minor, patch}, or the "MAJOR.MINOR.PATCH" string.
//==========================================================================================================
VersionInfo getVersion();
std::string getVersionString();

// "deskauth/MAJOR.MINOR.PATCH", used as the HTTP User-Agent.
std::string userAgent();

} // namespace deskauth
