//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProxiedTokenExchange.hpp
// Purpose: Token exchange through a backend that holds the client secret and mints a custom sign-in token
//==========================================================================================================

#pragma once

#include <mutex>
#include <string>

#include "deskauth/auth/TokenExchange.hpp"

namespace deskauth::auth {

//==========================================================================================================
// ProxiedTokenExchange
// Purpose: Backend-proxied strategy.
//   coPrepare:  GET  <base>/getOAuthUrl?redirect_uri=..   -> {authUrl, state, codeVerifier}
//   coExchange: POST <base>/exchangeOAuthCode {code, state, codeVerifier, redirectUri}
//               -> {<customTokenField>, googleTokens?, user?}
//   coRefresh:  POST <base>/refreshOAuthToken {refreshToken} -> {accessToken, expiresIn, idToken}
// Notes:
//   - The state handed out by the backend is remembered and re-verified before the exchange call.
//   - The URL fetch is bounded by urlFetchTimeoutMs; expiry raises TimeoutError.
//==========================================================================================================
class ProxiedTokenExchange : public ITokenExchangeStrategy {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   backendBaseUrl: Base URL of the backend functions (see resolveBackendBaseUrl).
    //   customTokenField: Response field carrying the custom token (default: firebaseToken).
    //   urlFetchTimeoutMs: Overall deadline of the getOAuthUrl call (default: 10000).
    //   transport: Timeouts and trust settings for exchange/refresh calls.
    //==========================================================================================================
    struct Options {
        std::string backendBaseUrl;
        std::string customTokenField{"firebaseToken"};
        unsigned int urlFetchTimeoutMs{10000};
        http::HttpRequestParams transport;
    };

    explicit ProxiedTokenExchange(Options opts);

    const char* name() const override { return "proxied"; }
    void validateConfiguration() const override;

    boost::asio::awaitable<PreparedAuthorization> coPrepare(std::string redirectUri, std::stop_token stop) override;
    boost::asio::awaitable<Credential> coExchange(AuthorizationGrant grant, std::stop_token stop) override;
    boost::asio::awaitable<TokenSet> coRefresh(std::string refreshToken, std::stop_token stop) override;

    const Options& options() const { return opts; }

private:
    std::string endpoint(const char* name) const;

    Options opts;
    std::mutex stateMutex;
    std::string issuedState;
};

//==========================================================================================================
// resolveBackendBaseUrl
// Purpose: Resolves the functions base URL.
// Returns:
//   explicitUrl (trailing '/' removed) when set; otherwise http://localhost:5001/<projectId>/<region> when
//   useEmulator, else https://<region>-<projectId>.cloudfunctions.net.
// Throws:
//   errors::AuthError(Configuration) when neither an explicit URL nor a project id is available.
//==========================================================================================================
std::string resolveBackendBaseUrl(const std::string& explicitUrl,
                                  const std::string& projectId,
                                  const std::string& region,
                                  bool useEmulator);

} // namespace deskauth::auth
