//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.cpp
// Purpose: Flow configuration parsing, credential resolution and strategy construction
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "deskauth/Config.hpp"
#include "deskauth/auth/DirectTokenExchange.hpp"
#include "deskauth/auth/ProxiedTokenExchange.hpp"
#include "deskauth/errors/Errors.h"
#include "env/EnvVars.h"
#include "logging/Logger.h"

#ifndef DESKAUTH_DEFAULT_CLIENT_ID
#define DESKAUTH_DEFAULT_CLIENT_ID ""
#endif
#ifndef DESKAUTH_DEFAULT_CLIENT_SECRET
#define DESKAUTH_DEFAULT_CLIENT_SECRET ""
#endif

namespace deskauth {

namespace {

std::string trim(std::string s) {
    std::size_t b = 0, e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) {
        ++b;
    }
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) {
        --e;
    }
    return s.substr(b, e - b);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> splitList(const std::string& val, const char* seps) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= val.size()) {
        std::size_t sep = val.find_first_of(seps, start);
        if (sep == std::string::npos) {
            sep = val.size();
        }
        std::string item = trim(val.substr(start, sep - start));
        if (!item.empty()) {
            out.push_back(item);
        }
        start = sep + 1;
    }
    return out;
}

unsigned int parseUnsigned(const std::string& key, const std::string& val) {
    try {
        std::size_t used = 0;
        unsigned long v = std::stoul(val, &used);
        if (used != val.size()) {
            throw std::invalid_argument(val);
        }
        return static_cast<unsigned int>(v);
    } catch (const std::logic_error&) {
        throw errors::ConfigurationError("Invalid numeric value for " + key + ": '" + val + "'");
    }
}

bool parseBool(const std::string& val) {
    const std::string v = lower(val);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

FlowMode parseMode(const std::string& val) {
    const std::string v = lower(val);
    if (v == "direct") {
        return FlowMode::Direct;
    }
    if (v == "proxied" || v == "backend") {
        return FlowMode::Proxied;
    }
    throw errors::ConfigurationError("Unknown sign-in mode: '" + val + "'");
}

void setAuthParam(FlowConfig& cfg, const std::string& name, const std::string& val) {
    for (auto& kv : cfg.extraAuthParams) {
        if (kv.first == name) {
            kv.second = val;
            return;
        }
    }
    cfg.extraAuthParams.emplace_back(name, val);
}

} // namespace

const char* flowModeName(FlowMode m) {
    return m == FlowMode::Proxied ? "proxied" : "direct";
}

const char* currentPlatformName() {
#ifdef _WIN32
    return "windows";
#elif defined(__APPLE__)
    return "macos";
#else
    return "linux";
#endif
}

//==========================================================================================================
// ConfigLoader::FromString
// Purpose: Parse semicolon-delimited key=value config on top of base.
//==========================================================================================================
FlowConfig ConfigLoader::FromString(const std::string& config, FlowConfig cfg) {
    std::size_t start = 0;
    while (start < config.size()) {
        std::size_t sep = config.find(';', start);
        if (sep == std::string::npos) { sep = config.size(); }
        std::string kv = trim(config.substr(start, sep - start));
        start = sep + 1;
        if (kv.empty()) {
            continue;
        }
        std::size_t eq = kv.find('=');
        if (eq == std::string::npos) {
            LOG_WARN("ConfigLoader: ignoring entry without '=': {}", kv);
            continue;
        }
        std::string key = trim(kv.substr(0, eq));
        std::string val = trim(kv.substr(eq + 1));
        if (key == "mode") {
            cfg.mode = parseMode(val);
        }
        else if (key == "clientId") {
            cfg.clientId = val;
            cfg.credentialSource = auth::CredentialSource::Explicit;
        }
        else if (key == "clientSecret") {
            cfg.clientSecret = val;
        }
        else if (key == "clientIdPlatforms") {
            cfg.clientIdPlatforms = splitList(lower(val), ", ");
        }
        else if (key == "authorizationEndpoint" || key == "authEndpoint") {
            cfg.authorizationEndpoint = val;
        }
        else if (key == "tokenEndpoint") {
            cfg.tokenEndpoint = val;
        }
        else if (key == "revocationEndpoint") {
            cfg.revocationEndpoint = val;
        }
        else if (key == "scopes" || key == "scope") {
            cfg.scopes = splitList(val, ", ");
        }
        else if (key == "allowedHosts") {
            cfg.allowedHosts = splitList(lower(val), ", ");
        }
        else if (key.rfind("authParam.", 0) == 0 && key.size() > 10) {
            setAuthParam(cfg, key.substr(10), val);
        }
        else if (key == "backendBaseUrl" || key == "backendUrl") {
            cfg.backendBaseUrl = val;
        }
        else if (key == "projectId") {
            cfg.projectId = val;
        }
        else if (key == "region") {
            cfg.region = val;
            cfg.regionSet = true;
        }
        else if (key == "useEmulator") {
            cfg.useEmulator = parseBool(val);
            cfg.useEmulatorSet = true;
        }
        else if (key == "customTokenField") {
            cfg.customTokenField = val;
        }
        else if (key == "connectTimeoutMs") {
            cfg.connectTimeoutMs = parseUnsigned(key, val);
        }
        else if (key == "readTimeoutMs") {
            cfg.readTimeoutMs = parseUnsigned(key, val);
        }
        else if (key == "urlFetchTimeoutMs") {
            cfg.urlFetchTimeoutMs = parseUnsigned(key, val);
        }
        else if (key == "redirectTimeoutSeconds" || key == "timeout") {
            cfg.redirectTimeoutSeconds = parseUnsigned(key, val);
        }
        else if (key == "caFile") {
            cfg.caFile = val;
        }
        else if (key == "caPath") {
            cfg.caPath = val;
        }
        else {
            LOG_WARN("ConfigLoader: unknown key '{}'", key);
        }
    }
    return cfg;
}

FlowConfig ConfigLoader::Resolve(FlowConfig cfg) {
    if (!cfg.clientId.empty()) {
        if (cfg.credentialSource == auth::CredentialSource::Unset) {
            cfg.credentialSource = auth::CredentialSource::Explicit;
        }
    } else if (std::string(DESKAUTH_DEFAULT_CLIENT_ID).size() > 0) {
        cfg.clientId = DESKAUTH_DEFAULT_CLIENT_ID;
        cfg.credentialSource = auth::CredentialSource::CompiledIn;
    } else {
        cfg.clientId = GetEnvOrDefault("DESKAUTH_CLIENT_ID", std::string());
        cfg.credentialSource = cfg.clientId.empty() ? auth::CredentialSource::Unset
                                                    : auth::CredentialSource::Environment;
    }

    if (cfg.clientSecret.empty()) {
        cfg.clientSecret = std::string(DESKAUTH_DEFAULT_CLIENT_SECRET);
        if (cfg.clientSecret.empty()) {
            cfg.clientSecret = GetEnvOrDefault("DESKAUTH_CLIENT_SECRET", std::string());
        }
    }

    if (!cfg.clientId.empty() && !cfg.clientIdPlatforms.empty()) {
        const std::string here = currentPlatformName();
        if (std::find(cfg.clientIdPlatforms.begin(), cfg.clientIdPlatforms.end(), here) == cfg.clientIdPlatforms.end()) {
            LOG_WARN("ConfigLoader: client id is not registered for platform {}", here);
            cfg.clientId.clear();
            cfg.clientSecret.clear();
            cfg.credentialSource = auth::CredentialSource::OtherPlatformOnly;
        }
    }

    if (cfg.backendBaseUrl.empty()) {
        cfg.backendBaseUrl = GetEnvOrDefault("DESKAUTH_BACKEND_URL", std::string());
    }
    if (cfg.projectId.empty()) {
        cfg.projectId = GetEnvOrDefault("DESKAUTH_PROJECT_ID", std::string());
    }
    if (!cfg.regionSet) {
        cfg.region = GetEnvOrDefault("DESKAUTH_REGION", cfg.region);
    }
    if (!cfg.useEmulatorSet) {
        cfg.useEmulator = GetEnvFlag("DESKAUTH_USE_EMULATOR", cfg.useEmulator);
    }

    LOG_DEBUG("ConfigLoader: mode={} clientId={} secret={} backend={}",
              flowModeName(cfg.mode), redactSecret(cfg.clientId), redactSecret(cfg.clientSecret),
              cfg.backendBaseUrl.empty() ? cfg.projectId : cfg.backendBaseUrl);
    return cfg;
}

FlowConfig ConfigLoader::FromEnvironment() {
    return Resolve(FlowConfig{});
}

http::HttpRequestParams transportFor(const FlowConfig& cfg) {
    http::HttpRequestParams p;
    p.connectTimeoutMs = cfg.connectTimeoutMs;
    p.readTimeoutMs = cfg.readTimeoutMs;
    p.caFile = cfg.caFile;
    p.caPath = cfg.caPath;
    return p;
}

std::shared_ptr<auth::ITokenExchangeStrategy> makeStrategy(const FlowConfig& cfg) {
    if (cfg.mode == FlowMode::Proxied) {
        auth::ProxiedTokenExchange::Options o;
        o.backendBaseUrl = auth::resolveBackendBaseUrl(cfg.backendBaseUrl, cfg.projectId, cfg.region, cfg.useEmulator);
        o.customTokenField = cfg.customTokenField;
        o.urlFetchTimeoutMs = cfg.urlFetchTimeoutMs;
        o.transport = transportFor(cfg);
        LOG_INFO("Using proxied token exchange via {}", o.backendBaseUrl);
        return std::make_shared<auth::ProxiedTokenExchange>(std::move(o));
    }
    auth::DirectTokenExchange::Options o;
    o.clientId = cfg.clientId;
    o.clientSecret = cfg.clientSecret;
    o.credentialSource = cfg.credentialSource;
    o.authorizationEndpoint = cfg.authorizationEndpoint;
    o.tokenEndpoint = cfg.tokenEndpoint;
    o.scopes = cfg.scopes;
    o.extraAuthParams = cfg.extraAuthParams;
    o.transport = transportFor(cfg);
    LOG_INFO("Using direct token exchange against {}", o.tokenEndpoint);
    return std::make_shared<auth::DirectTokenExchange>(std::move(o));
}

} // namespace deskauth
