//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: AuthorizationUrl.hpp
// Purpose: Immutable authorization request value and the builder for the provider /authorize URL
//==========================================================================================================

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace deskauth::auth {

// Where the client id would have come from; selects the message when it is missing.
enum class CredentialSource {
    Explicit,
    CompiledIn,
    Environment,
    Unset,            // nothing configured for this build
    OtherPlatformOnly // configured, but for a different desktop platform
};

//==========================================================================================================
// AuthorizationRequest
// Purpose: Everything that goes into one authorization URL. Built once per flow session.
// Fields:
//   authorizationEndpoint: Provider endpoint, e.g. https://accounts.google.com/o/oauth2/v2/auth
//   clientId: OAuth client id (required).
//   scopes: Ordered scopes, joined with spaces.
//   redirectUri: Loopback redirect, http://localhost:<port>.
//   codeChallenge: S256 PKCE challenge.
//   state: CSRF state.
//   extraParams: Provider hints appended in order (e.g. access_type=offline, prompt=consent).
//==========================================================================================================
struct AuthorizationRequest {
    std::string authorizationEndpoint;
    std::string clientId;
    std::vector<std::string> scopes;
    std::string redirectUri;
    std::string codeChallenge;
    std::string state;
    std::vector<std::pair<std::string, std::string>> extraParams;
};

//==========================================================================================================
// buildAuthorizationUrl
// Purpose: Renders the request as a percent-encoded URL.
// Args:
//   req: Request to render.
//   source: Origin of req.clientId, used to word the error when it is empty.
// Returns:
//   "<endpoint>?client_id=..&redirect_uri=..&response_type=code&scope=..&code_challenge=..
//    &code_challenge_method=S256&state=..[&extra...]"
// Throws:
//   errors::AuthError(Configuration) for an empty client id, a non-loopback redirect URI, an empty
//   challenge/state, or a non-http(s) endpoint.
//==========================================================================================================
std::string buildAuthorizationUrl(const AuthorizationRequest& req, CredentialSource source = CredentialSource::Explicit);

// Throws ConfigurationError unless uri is http://localhost:<port> or http://127.0.0.1:<port>.
void requireLoopbackRedirectUri(const std::string& uri);

// Throws ConfigurationError worded for the credential source when clientId is empty.
void requireClientId(const std::string& clientId, CredentialSource source);

} // namespace deskauth::auth
