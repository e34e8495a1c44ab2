//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: AuthorizationUrl.cpp
// Purpose: Builder for the provider /authorize URL
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <sstream>

#include "deskauth/Url.hpp"
#include "deskauth/auth/AuthorizationUrl.hpp"
#include "deskauth/errors/Errors.h"
#include "logging/Logger.h"

namespace deskauth::auth {

void requireClientId(const std::string& clientId, CredentialSource source) {
    if (!clientId.empty()) {
        return;
    }
    if (source == CredentialSource::OtherPlatformOnly) {
        throw errors::ConfigurationError(
            "OAuth client is not configured for this platform. Use another sign-in method or contact support.",
            errors::Remedy::AlternateSignIn);
    }
    if (source == CredentialSource::Unset) {
        throw errors::ConfigurationError(
            "This build was not configured with OAuth client credentials. Use another sign-in method or contact support.",
            errors::Remedy::AlternateSignIn);
    }
    throw errors::ConfigurationError("OAuth client id is empty");
}

void requireLoopbackRedirectUri(const std::string& uri) {
    const bool hasScheme = uri.rfind("http://", 0) == 0;
    const UrlParts u = parseUrl(uri);
    const bool loopback = (u.host == "localhost" || u.host == "127.0.0.1");
    const bool portOk = u.hasExplicitPort && !u.port.empty() &&
                        std::all_of(u.port.begin(), u.port.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
    if (!hasScheme || !loopback || !portOk) {
        throw errors::ConfigurationError("Redirect URI must be http://localhost:<port>: " + uri);
    }
}

std::string buildAuthorizationUrl(const AuthorizationRequest& req, CredentialSource source) {
    requireClientId(req.clientId, source);
    requireLoopbackRedirectUri(req.redirectUri);
    const UrlParts ep = parseUrl(req.authorizationEndpoint);
    if (req.authorizationEndpoint.find("://") == std::string::npos || ep.host.empty() ||
        (ep.scheme != "https" && ep.scheme != "http")) {
        throw errors::ConfigurationError("Authorization endpoint must be an absolute http(s) URL");
    }
    if (req.codeChallenge.empty() || req.state.empty()) {
        throw errors::ConfigurationError("Authorization request is missing PKCE challenge or state");
    }

    std::string scope;
    for (const auto& s : req.scopes) {
        if (s.empty()) continue;
        if (!scope.empty()) scope.push_back(' ');
        scope += s;
    }

    std::ostringstream url;
    url << req.authorizationEndpoint;
    url << (req.authorizationEndpoint.find('?') == std::string::npos ? '?' : '&');
    url << "client_id=" << percentEncode(req.clientId)
        << "&redirect_uri=" << percentEncode(req.redirectUri)
        << "&response_type=code";
    if (!scope.empty()) {
        url << "&scope=" << percentEncode(scope);
    }
    url << "&code_challenge=" << percentEncode(req.codeChallenge)
        << "&code_challenge_method=S256"
        << "&state=" << percentEncode(req.state);
    for (const auto& kv : req.extraParams) {
        url << '&' << percentEncode(kv.first) << '=' << percentEncode(kv.second);
    }
    LOG_DEBUG("AuthorizationUrl: built for endpoint {} ({} scopes)", req.authorizationEndpoint, req.scopes.size());
    return url.str();
}

} // namespace deskauth::auth
