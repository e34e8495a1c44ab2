//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.hpp
// Purpose: Flow configuration, credential resolution and strategy construction
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "deskauth/auth/AuthorizationUrl.hpp"
#include "deskauth/auth/TokenExchange.hpp"

namespace deskauth {

enum class FlowMode {
    Direct,
    Proxied
};

const char* flowModeName(FlowMode m);

//==========================================================================================================
// FlowConfig
// Purpose: Everything a flow needs, resolved once and injected into the orchestrator.
// Fields:
//   mode: Direct (provider token endpoint) or Proxied (backend functions).
//   clientId/clientSecret/credentialSource: Direct-mode client credentials and where the id came from.
//   clientIdPlatforms: Platforms the client id is registered for ("windows", "macos", "linux"); empty
//                      means all.
//   authorizationEndpoint/tokenEndpoint/revocationEndpoint: Provider endpoints (Google defaults).
//   scopes/extraAuthParams: Authorization request scopes and provider hints.
//   allowedHosts: Launch allow-list for the authorization URL.
//   backendBaseUrl/projectId/region/useEmulator/customTokenField: Proxied-mode backend settings.
//   regionSet/useEmulatorSet: True once region/useEmulator were given explicitly; the environment is
//                             consulted only while they are false.
//   connectTimeoutMs/readTimeoutMs: Token call timeouts.
//   urlFetchTimeoutMs: Deadline of the proxied authorization URL fetch.
//   redirectTimeoutSeconds: Browser round-trip deadline; 0 waits without limit.
//   caFile/caPath: Extra trust anchors for TLS.
//==========================================================================================================
struct FlowConfig {
    FlowMode mode{FlowMode::Direct};

    std::string clientId;
    std::string clientSecret;
    auth::CredentialSource credentialSource{auth::CredentialSource::Unset};
    std::vector<std::string> clientIdPlatforms;

    std::string authorizationEndpoint{"https://accounts.google.com/o/oauth2/v2/auth"};
    std::string tokenEndpoint{"https://oauth2.googleapis.com/token"};
    std::string revocationEndpoint{"https://oauth2.googleapis.com/revoke"};
    std::vector<std::string> scopes{"openid", "email", "profile"};
    std::vector<std::pair<std::string, std::string>> extraAuthParams{{"access_type", "offline"}, {"prompt", "consent"}};
    std::vector<std::string> allowedHosts{"google.com", "googleapis.com"};

    std::string backendBaseUrl;
    std::string projectId;
    std::string region{"us-central1"};
    bool useEmulator{false};
    bool regionSet{false};
    bool useEmulatorSet{false};
    std::string customTokenField{"firebaseToken"};

    unsigned int connectTimeoutMs{10000};
    unsigned int readTimeoutMs{30000};
    unsigned int urlFetchTimeoutMs{10000};
    unsigned int redirectTimeoutSeconds{300};

    std::string caFile;
    std::string caPath;
};

// "windows", "macos" or "linux".
const char* currentPlatformName();

class ConfigLoader {
public:
    //==========================================================================================================
    // FromString
    // Purpose: Applies a semicolon-delimited "key=value; key=value" string on top of base.
    // Keys:
    //   mode, clientId, clientSecret, clientIdPlatforms, authorizationEndpoint (authEndpoint), tokenEndpoint,
    //   revocationEndpoint, scopes (space or comma separated), allowedHosts (comma separated),
    //   authParam.<name>, backendBaseUrl (backendUrl), projectId, region, useEmulator, customTokenField,
    //   connectTimeoutMs, readTimeoutMs, urlFetchTimeoutMs, redirectTimeoutSeconds, caFile, caPath.
    // Throws:
    //   errors::AuthError(Configuration) for an unknown mode or a non-numeric timeout.
    // Notes:
    //   Unknown keys are logged at WARN and ignored. A clientId set here is an explicit credential.
    //==========================================================================================================
    static FlowConfig FromString(const std::string& config, FlowConfig base = FlowConfig{});

    //==========================================================================================================
    // Resolve
    // Purpose: Fills credentials and backend settings left empty in cfg: compile-time defaults first
    //          (DESKAUTH_DEFAULT_CLIENT_ID/_SECRET), then environment (DESKAUTH_CLIENT_ID, DESKAUTH_CLIENT_SECRET,
    //          DESKAUTH_BACKEND_URL, DESKAUTH_PROJECT_ID, DESKAUTH_REGION, DESKAUTH_USE_EMULATOR).
    //          Sets credentialSource accordingly, including OtherPlatformOnly when clientIdPlatforms
    //          excludes the running platform (the id is then cleared).
    //==========================================================================================================
    static FlowConfig Resolve(FlowConfig cfg);

    // Resolve(FlowConfig{}).
    static FlowConfig FromEnvironment();
};

// Transport settings shared by token calls.
http::HttpRequestParams transportFor(const FlowConfig& cfg);

//==========================================================================================================
// makeStrategy
// Purpose: Builds the direct or proxied token-exchange strategy for cfg.
// Throws:
//   errors::AuthError(Configuration) when proxied mode has neither backend URL nor project id.
//==========================================================================================================
std::shared_ptr<auth::ITokenExchangeStrategy> makeStrategy(const FlowConfig& cfg);

} // namespace deskauth
