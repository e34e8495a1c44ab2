//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: UriSafety.hpp
// Purpose: Launch-time safety policy for URLs handed to a browser or browser-opening subprocess
//==========================================================================================================

#pragma once

#include <string>
#include <vector>

namespace deskauth::auth {

// Identity-provider domains accepted when no explicit allow-list is configured.
std::vector<std::string> defaultAllowedHosts();

//==========================================================================================================
// UriSafetyVerdict
// Purpose: Result of evaluating a launch URI.
// Fields:
//   safe: True when every rule passed.
//   reason: First violated rule (empty when safe). Never echoes the URI.
//==========================================================================================================
struct UriSafetyVerdict {
    bool safe{false};
    std::string reason;
};

//==========================================================================================================
// evaluateLaunchUri
// Purpose: Applies the launch policy to a fully rendered URL.
// Rules:
//   - scheme is https, or http with a loopback host (localhost, 127.0.0.1, ::1);
//   - host equals, or is a subdomain of, an allowed host (loopback hosts are always allowed);
//   - the string contains none of ; | ` $ < > " ' CR LF, nor other control characters or spaces;
//   - the string contains no backslash, raw or percent-encoded as %5C;
//   - the authority carries no userinfo.
// Args:
//   uri: URL to be opened.
//   allowedHosts: Registrable domains, e.g. {"google.com", "googleapis.com"}.
//==========================================================================================================
UriSafetyVerdict evaluateLaunchUri(const std::string& uri, const std::vector<std::string>& allowedHosts);

inline bool isSafeLaunchUri(const std::string& uri, const std::vector<std::string>& allowedHosts) {
    return evaluateLaunchUri(uri, allowedHosts).safe;
}

// Throws errors::AuthError(Security) with the violated rule when the URI is unsafe.
void checkLaunchUri(const std::string& uri, const std::vector<std::string>& allowedHosts);

// True for "localhost" and loopback literals (127.0.0.1, ::1).
bool isLoopbackHost(const std::string& host);

} // namespace deskauth::auth
