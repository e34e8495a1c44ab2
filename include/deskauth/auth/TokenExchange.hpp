//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TokenExchange.hpp
// Purpose: Token/credential value types and the pluggable token-exchange strategy interface
//==========================================================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <stop_token>
#include <string>

#include <boost/asio/awaitable.hpp>

#include "deskauth/JSONValue.h"
#include "deskauth/errors/Errors.h"
#include "deskauth/http/HttpClient.hpp"

namespace deskauth::auth {

//==========================================================================================================
// TokenSet
// Purpose: Provider tokens returned by a code exchange or refresh.
//==========================================================================================================
struct TokenSet {
    std::string accessToken;
    std::optional<std::string> idToken;
    std::optional<std::string> refreshToken;
    std::optional<int64_t> expiresInSeconds;
    std::optional<std::string> tokenType;
    std::optional<std::string> scope;
};

struct UserProfile {
    std::string uid;
    std::string email;
    std::string displayName;
    std::string photoUrl;
};

//==========================================================================================================
// Credential
// Purpose: Terminal output of a flow; the caller hands it to its own identity system.
// Fields:
//   tokens: Provider tokens (always set by the direct strategy; set by the proxied strategy when the
//           backend forwards them).
//   customToken: Opaque backend-minted sign-in token (proxied strategy only).
//   user: Profile returned by the backend (proxied strategy only).
//==========================================================================================================
struct Credential {
    std::optional<TokenSet> tokens;
    std::optional<std::string> customToken;
    std::optional<UserProfile> user;
};

//==========================================================================================================
// PreparedAuthorization
// Purpose: Output of the preparation step: the URL to open plus the secrets the session must keep.
//==========================================================================================================
struct PreparedAuthorization {
    std::string authorizationUrl;
    std::string csrfState;
    std::string codeVerifier;
};

struct AuthorizationGrant {
    std::string code;
    std::string state;
    std::string codeVerifier;
    std::string redirectUri;
};

//==========================================================================================================
// ITokenExchangeStrategy
// Purpose: Provider-direct or backend-proxied half of the flow. Coroutines run on an io_context owned by
//          the calling thread and stop early (CancelledError) when the stop token fires.
//==========================================================================================================
class ITokenExchangeStrategy {
public:
    virtual ~ITokenExchangeStrategy() = default;

    virtual const char* name() const = 0;

    // Synchronous configuration check run before the listener is bound. Throws ConfigurationError.
    virtual void validateConfiguration() const {}

    // Produce the authorization URL, CSRF state and PKCE verifier for a loopback redirect URI.
    virtual boost::asio::awaitable<PreparedAuthorization> coPrepare(std::string redirectUri,
                                                                    std::stop_token stop) = 0;

    // Redeem a validated authorization grant.
    virtual boost::asio::awaitable<Credential> coExchange(AuthorizationGrant grant, std::stop_token stop) = 0;

    // Single refresh call-through; no token lifecycle is managed.
    virtual boost::asio::awaitable<TokenSet> coRefresh(std::string refreshToken, std::stop_token stop) = 0;
};

//==========================================================================================================
// parseTokenResponse
// Purpose: Parses an OAuth token endpoint JSON body (snake_case fields).
// Throws:
//   errors::AuthError(TokenExchange) when the body is not JSON or lacks access_token.
//==========================================================================================================
TokenSet parseTokenResponse(const std::string& body, int httpStatus);

// "error"/"error_description" of an OAuth or backend error body ("message" is accepted as description).
struct ProviderErrorInfo {
    std::string error;
    std::string description;
};
ProviderErrorInfo parseProviderError(const std::string& body);

// Builds the TokenExchangeError for a rejected exchange/refresh response. The body is truncated and
// kept only as diagnostic detail.
errors::AuthError makeExchangeFailure(const std::string& what, const http::HttpResponse& res);

//==========================================================================================================
// coRevokeToken
// Purpose: Best-effort token revocation (RFC 7009 style form POST "token=<t>").
// Returns:
//   true when the endpoint answered 200; false on any failure, including cancellation. Failures are
//   logged at WARN and never thrown.
//==========================================================================================================
boost::asio::awaitable<bool> coRevokeToken(std::string revocationEndpoint,
                                           std::string token,
                                           http::HttpRequestParams transport,
                                           std::stop_token stop);

} // namespace deskauth::auth
