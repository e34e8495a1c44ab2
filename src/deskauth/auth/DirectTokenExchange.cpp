//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DirectTokenExchange.cpp
// Purpose: Token exchange directly against the identity provider's token endpoint (PKCE + client secret)
//==========================================================================================================

#include <utility>

#include "deskauth/Url.hpp"
#include "deskauth/auth/DirectTokenExchange.hpp"
#include "deskauth/auth/Pkce.hpp"
#include "deskauth/errors/Errors.h"
#include "logging/Logger.h"

namespace deskauth::auth {

DirectTokenExchange::DirectTokenExchange(Options o) : opts(std::move(o)) {}

void DirectTokenExchange::validateConfiguration() const {
    requireClientId(opts.clientId, opts.credentialSource);
}

boost::asio::awaitable<PreparedAuthorization> DirectTokenExchange::coPrepare(std::string redirectUri,
                                                                             std::stop_token stop) {
    // Fail on missing credentials before any secret is generated
    requireClientId(opts.clientId, opts.credentialSource);
    if (stop.stop_requested()) {
        throw errors::CancelledError("Sign-in cancelled");
    }

    PreparedAuthorization prepared;
    prepared.codeVerifier = generateCodeVerifier();
    prepared.csrfState = generateState();

    AuthorizationRequest req;
    req.authorizationEndpoint = opts.authorizationEndpoint;
    req.clientId = opts.clientId;
    req.scopes = opts.scopes;
    req.redirectUri = std::move(redirectUri);
    req.codeChallenge = generateCodeChallenge(prepared.codeVerifier);
    req.state = prepared.csrfState;
    req.extraParams = opts.extraAuthParams;
    prepared.authorizationUrl = buildAuthorizationUrl(req, opts.credentialSource);
    co_return prepared;
}

boost::asio::awaitable<Credential> DirectTokenExchange::coExchange(AuthorizationGrant grant, std::stop_token stop) {
    QueryParams form{
        {"client_id", opts.clientId},
        {"client_secret", opts.clientSecret},
        {"code", grant.code},
        {"code_verifier", grant.codeVerifier},
        {"grant_type", "authorization_code"},
        {"redirect_uri", grant.redirectUri},
    };
    if (opts.clientSecret.empty()) {
        form.erase(form.begin() + 1);
    }
    http::HttpRequestParams params = opts.transport;
    params.url = opts.tokenEndpoint;
    LOG_INFO("DirectTokenExchange: exchanging authorization code {} at {}", redactSecret(grant.code), opts.tokenEndpoint);

    http::HttpResponse res = co_await http::coPostFormUrlencoded(params, buildFormBody(form), nullptr, stop);
    wipeSecret(grant.code);
    wipeSecret(grant.codeVerifier);
    if (res.status != 200) {
        throw makeExchangeFailure("Token exchange", res);
    }
    Credential cred;
    cred.tokens = parseTokenResponse(res.body, res.status);
    LOG_INFO("DirectTokenExchange: received access token {} (id_token: {}, refresh_token: {})",
             redactSecret(cred.tokens->accessToken),
             cred.tokens->idToken ? "yes" : "no",
             cred.tokens->refreshToken ? "yes" : "no");
    co_return cred;
}

boost::asio::awaitable<TokenSet> DirectTokenExchange::coRefresh(std::string refreshToken, std::stop_token stop) {
    if (refreshToken.empty()) {
        throw errors::ConfigurationError("No refresh token available");
    }
    QueryParams form{
        {"client_id", opts.clientId},
        {"client_secret", opts.clientSecret},
        {"grant_type", "refresh_token"},
        {"refresh_token", refreshToken},
    };
    if (opts.clientSecret.empty()) {
        form.erase(form.begin() + 1);
    }
    http::HttpRequestParams params = opts.transport;
    params.url = opts.tokenEndpoint;
    http::HttpResponse res = co_await http::coPostFormUrlencoded(params, buildFormBody(form), nullptr, stop);
    if (res.status != 200) {
        throw makeExchangeFailure("Token refresh", res);
    }
    TokenSet t = parseTokenResponse(res.body, res.status);
    if (!t.refreshToken) {
        // Providers usually omit the refresh token on refresh; the caller keeps using its own
        t.refreshToken = refreshToken;
    }
    co_return t;
}

} // namespace deskauth::auth
