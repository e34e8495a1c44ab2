//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProxiedTokenExchange.cpp
// Purpose: Token exchange through a backend that holds the client secret and mints a custom sign-in token
//==========================================================================================================

#include <memory>
#include <stdexcept>
#include <utility>

#include "deskauth/JSONValue.h"
#include "deskauth/Url.hpp"
#include "deskauth/auth/Pkce.hpp"
#include "deskauth/auth/ProxiedTokenExchange.hpp"
#include "deskauth/errors/Errors.h"
#include "logging/Logger.h"

namespace deskauth::auth {

namespace {
JSONValue parseBackendJson(const std::string& what, const http::HttpResponse& res) {
    try {
        JSONValue v = parseJSON(res.body);
        if (!v.isObject()) {
            throw std::runtime_error("not an object");
        }
        return v;
    } catch (const std::exception& e) {
        throw errors::TokenExchangeError(what + " returned an invalid response: " + e.what(), res.status,
                                         std::string(), res.body.substr(0, 256));
    }
}

std::shared_ptr<JSONValue> str(const std::string& s) {
    return std::make_shared<JSONValue>(s);
}
} // namespace

std::string resolveBackendBaseUrl(const std::string& explicitUrl,
                                  const std::string& projectId,
                                  const std::string& region,
                                  bool useEmulator) {
    if (!explicitUrl.empty()) {
        std::string base = explicitUrl;
        while (!base.empty() && base.back() == '/') {
            base.pop_back();
        }
        return base;
    }
    if (projectId.empty()) {
        throw errors::ConfigurationError("Backend URL is not configured (set backendBaseUrl or projectId)");
    }
    const std::string r = region.empty() ? std::string("us-central1") : region;
    if (useEmulator) {
        return "http://localhost:5001/" + projectId + "/" + r;
    }
    return "https://" + r + "-" + projectId + ".cloudfunctions.net";
}

ProxiedTokenExchange::ProxiedTokenExchange(Options o) : opts(std::move(o)) {
    while (!opts.backendBaseUrl.empty() && opts.backendBaseUrl.back() == '/') {
        opts.backendBaseUrl.pop_back();
    }
}

void ProxiedTokenExchange::validateConfiguration() const {
    if (opts.backendBaseUrl.empty()) {
        throw errors::ConfigurationError("Backend URL is not configured");
    }
}

std::string ProxiedTokenExchange::endpoint(const char* name) const {
    if (opts.backendBaseUrl.empty()) {
        throw errors::ConfigurationError("Backend URL is not configured");
    }
    return opts.backendBaseUrl + "/" + name;
}

boost::asio::awaitable<PreparedAuthorization> ProxiedTokenExchange::coPrepare(std::string redirectUri,
                                                                              std::stop_token stop) {
    http::HttpRequestParams params = opts.transport;
    params.url = endpoint("getOAuthUrl") + "?redirect_uri=" + percentEncode(redirectUri);
    params.totalTimeoutMs = opts.urlFetchTimeoutMs;

    http::HttpResponse res;
    try {
        res = co_await http::coGet(params, nullptr, stop);
    } catch (const errors::AuthError& e) {
        if (e.category == errors::ErrorCategory::Timeout) {
            throw errors::TimeoutError("Sign-in service did not respond in time. Check your connection and try again.");
        }
        throw;
    }
    if (res.status != 200) {
        throw makeExchangeFailure("Fetching the authorization URL", res);
    }
    JSONValue v = parseBackendJson("getOAuthUrl", res);
    auto authUrl = getStringField(v, "authUrl");
    auto state = getStringField(v, "state");
    auto verifier = getStringField(v, "codeVerifier");
    if (!authUrl || authUrl->empty() || !state || state->empty() || !verifier || verifier->empty()) {
        throw errors::TokenExchangeError("getOAuthUrl response is missing authUrl, state or codeVerifier",
                                         res.status, std::string(), std::string());
    }
    {
        std::lock_guard<std::mutex> lk(stateMutex);
        issuedState = *state;
    }
    LOG_INFO("ProxiedTokenExchange: received authorization URL from backend");

    PreparedAuthorization prepared;
    prepared.authorizationUrl = *authUrl;
    prepared.csrfState = *state;
    prepared.codeVerifier = *verifier;
    co_return prepared;
}

boost::asio::awaitable<Credential> ProxiedTokenExchange::coExchange(AuthorizationGrant grant, std::stop_token stop) {
    {
        std::lock_guard<std::mutex> lk(stateMutex);
        const bool match = !issuedState.empty() && constantTimeEquals(grant.state, issuedState);
        wipeSecret(issuedState);
        if (!match) {
            LOG_WARN("ProxiedTokenExchange: state does not match the one issued by the backend");
            throw errors::SecurityError("Authorization state does not match the sign-in request");
        }
    }

    JSONValue::Object body;
    body["code"] = str(grant.code);
    body["state"] = str(grant.state);
    body["codeVerifier"] = str(grant.codeVerifier);
    body["redirectUri"] = str(grant.redirectUri);
    std::string payload = serializeJSONValue(JSONValue(std::move(body)));
    wipeSecret(grant.code);
    wipeSecret(grant.codeVerifier);

    http::HttpRequestParams params = opts.transport;
    params.url = endpoint("exchangeOAuthCode");
    http::HttpResponse res = co_await http::coPostJson(params, std::move(payload), nullptr, stop);
    if (res.status != 200) {
        throw makeExchangeFailure("Code exchange", res);
    }
    JSONValue v = parseBackendJson("exchangeOAuthCode", res);

    Credential cred;
    cred.customToken = getStringField(v, opts.customTokenField);
    if (!cred.customToken || cred.customToken->empty()) {
        throw errors::TokenExchangeError("Backend response did not contain a sign-in token", res.status,
                                         std::string(), std::string());
    }
    if (const JSONValue* g = getObjectField(v, "googleTokens")) {
        if (auto at = getStringField(*g, "accessToken")) {
            TokenSet t;
            t.accessToken = *at;
            t.refreshToken = getStringField(*g, "refreshToken");
            t.idToken = getStringField(*g, "idToken");
            t.expiresInSeconds = getIntField(*g, "expiresIn");
            cred.tokens = std::move(t);
        }
    }
    if (const JSONValue* u = getObjectField(v, "user")) {
        UserProfile p;
        p.uid = getStringField(*u, "uid").value_or(std::string());
        p.email = getStringField(*u, "email").value_or(std::string());
        p.displayName = getStringField(*u, "displayName").value_or(std::string());
        p.photoUrl = getStringField(*u, "photoURL").value_or(std::string());
        cred.user = std::move(p);
    }
    LOG_INFO("ProxiedTokenExchange: received sign-in token {}", redactSecret(*cred.customToken));
    co_return cred;
}

boost::asio::awaitable<TokenSet> ProxiedTokenExchange::coRefresh(std::string refreshToken, std::stop_token stop) {
    if (refreshToken.empty()) {
        throw errors::ConfigurationError("No refresh token available");
    }
    JSONValue::Object body;
    body["refreshToken"] = str(refreshToken);
    http::HttpRequestParams params = opts.transport;
    params.url = endpoint("refreshOAuthToken");
    http::HttpResponse res = co_await http::coPostJson(params, serializeJSONValue(JSONValue(std::move(body))), nullptr, stop);
    if (res.status != 200) {
        throw makeExchangeFailure("Token refresh", res);
    }
    JSONValue v = parseBackendJson("refreshOAuthToken", res);
    auto at = getStringField(v, "accessToken");
    if (!at || at->empty()) {
        throw errors::TokenExchangeError("Refresh response did not contain an accessToken", res.status,
                                         std::string(), std::string());
    }
    TokenSet t;
    t.accessToken = *at;
    t.idToken = getStringField(v, "idToken");
    t.expiresInSeconds = getIntField(v, "expiresIn");
    t.refreshToken = refreshToken;
    co_return t;
}

} // namespace deskauth::auth
