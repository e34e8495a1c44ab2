//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Implements version helpers returning semantic version string.
//==========================================================================================================
#include "deskauth/version.h"

#include <sstream>

namespace deskauth {

VersionInfo getVersion() {
    return VersionInfo{DESKAUTH_VERSION_MAJOR, DESKAUTH_VERSION_MINOR, DESKAUTH_VERSION_PATCH};
}

std::string getVersionString() {
    const auto v = getVersion();
    std::ostringstream oss;
    oss << v.major << "." << v.minor << "." << v.patch;
    return oss.str();
}

std::string userAgent() {
    return std::string("deskauth/") + getVersionString();
}

} // namespace deskauth
