//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DirectTokenExchange.hpp
// Purpose: Token exchange directly against the identity provider's token endpoint (PKCE + client secret)
//==========================================================================================================

#pragma once

#include <string>
#include <utility>
#include <vector>

#include "deskauth/auth/AuthorizationUrl.hpp"
#include "deskauth/auth/TokenExchange.hpp"

namespace deskauth::auth {

class DirectTokenExchange : public ITokenExchangeStrategy {
public:
    //==========================================================================================================
    // Options
    // Purpose: Provider endpoints and client credentials.
    // Fields:
    //   clientId/clientSecret: OAuth client credentials (secret may be empty for public clients).
    //   credentialSource: Origin of clientId, used to word ConfigurationError.
    //   authorizationEndpoint/tokenEndpoint: Provider endpoints (Google defaults).
    //   scopes: Requested scopes (default: openid email profile).
    //   extraAuthParams: Provider hints (default: access_type=offline, prompt=consent).
    //   transport: Timeouts and trust settings for token calls.
    //==========================================================================================================
    struct Options {
        std::string clientId;
        std::string clientSecret;
        CredentialSource credentialSource{CredentialSource::Explicit};
        std::string authorizationEndpoint{"https://accounts.google.com/o/oauth2/v2/auth"};
        std::string tokenEndpoint{"https://oauth2.googleapis.com/token"};
        std::vector<std::string> scopes{"openid", "email", "profile"};
        std::vector<std::pair<std::string, std::string>> extraAuthParams{{"access_type", "offline"}, {"prompt", "consent"}};
        http::HttpRequestParams transport;
    };

    explicit DirectTokenExchange(Options opts);

    const char* name() const override { return "direct"; }
    void validateConfiguration() const override;

    boost::asio::awaitable<PreparedAuthorization> coPrepare(std::string redirectUri, std::stop_token stop) override;
    boost::asio::awaitable<Credential> coExchange(AuthorizationGrant grant, std::stop_token stop) override;
    boost::asio::awaitable<TokenSet> coRefresh(std::string refreshToken, std::stop_token stop) override;

    const Options& options() const { return opts; }

private:
    Options opts;
};

} // namespace deskauth::auth
