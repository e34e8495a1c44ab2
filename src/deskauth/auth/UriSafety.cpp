//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: UriSafety.cpp
// Purpose: Launch-time safety policy for URLs handed to a browser or browser-opening subprocess
//==========================================================================================================

#include <algorithm>
#include <cctype>

#include "deskauth/Url.hpp"
#include "deskauth/auth/UriSafety.hpp"
#include "deskauth/errors/Errors.h"
#include "logging/Logger.h"

namespace deskauth::auth {

namespace {
constexpr char kShellMetacharacters[] = ";|`$<>\"'\n\r";

bool hostMatches(const std::string& host, const std::string& allowed) {
    if (allowed.empty()) {
        return false;
    }
    std::string a = allowed;
    std::transform(a.begin(), a.end(), a.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (!a.empty() && a.front() == '.') {
        a.erase(0, 1);
    }
    if (host == a) {
        return true;
    }
    return host.size() > a.size() + 1 &&
           host.compare(host.size() - a.size(), a.size(), a) == 0 &&
           host[host.size() - a.size() - 1] == '.';
}

bool containsEncodedBackslash(const std::string& uri) {
    for (std::size_t i = uri.find('%'); i != std::string::npos && i + 2 < uri.size(); i = uri.find('%', i + 1)) {
        if (uri[i + 1] == '5' && (uri[i + 2] == 'c' || uri[i + 2] == 'C')) {
            return true;
        }
    }
    return false;
}
} // namespace

std::vector<std::string> defaultAllowedHosts() {
    return {"google.com", "googleapis.com"};
}

bool isLoopbackHost(const std::string& host) {
    return host == "localhost" || host == "127.0.0.1" || host == "::1";
}

UriSafetyVerdict evaluateLaunchUri(const std::string& uri, const std::vector<std::string>& allowedHosts) {
    UriSafetyVerdict v;
    if (uri.empty()) {
        v.reason = "empty URI";
        return v;
    }
    if (uri.find_first_of(kShellMetacharacters) != std::string::npos) {
        v.reason = "URI contains shell metacharacters";
        return v;
    }
    for (char ch : uri) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c <= 0x20 || c == 0x7F) {
            v.reason = "URI contains whitespace or control characters";
            return v;
        }
    }
    // Browsers treat a backslash as '/' in http(s) URLs.
    if (uri.find('\\') != std::string::npos || containsEncodedBackslash(uri)) {
        v.reason = "URI contains a backslash";
        return v;
    }
    if (uri.find("://") == std::string::npos) {
        v.reason = "URI is not absolute";
        return v;
    }

    const UrlParts u = parseUrl(uri);
    if (u.host.empty()) {
        v.reason = "URI has no host";
        return v;
    }
    if (u.host.find('@') != std::string::npos) {
        v.reason = "URI carries userinfo";
        return v;
    }
    const bool localhost = isLoopbackHost(u.host);
    if (u.scheme == "https") {
        // ok
    } else if (u.scheme == "http" && localhost) {
        // ok
    } else {
        v.reason = "scheme '" + u.scheme + "' is not allowed for this host";
        return v;
    }
    if (!localhost) {
        bool allowed = std::any_of(allowedHosts.begin(), allowedHosts.end(),
                                   [&](const std::string& a) { return hostMatches(u.host, a); });
        if (!allowed) {
            v.reason = "host '" + u.host + "' is not in the allow-list";
            return v;
        }
    }
    v.safe = true;
    return v;
}

void checkLaunchUri(const std::string& uri, const std::vector<std::string>& allowedHosts) {
    UriSafetyVerdict v = evaluateLaunchUri(uri, allowedHosts);
    if (!v.safe) {
        LOG_WARN("UriSafety: rejected launch URI: {}", v.reason);
        throw errors::SecurityError("Refusing to open unsafe authorization URL: " + v.reason);
    }
}

} // namespace deskauth::auth
