//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TokenExchange.cpp
// Purpose: Token response parsing, exchange failure classification and best-effort revocation
//==========================================================================================================

#include <stdexcept>
#include <utility>

#include "deskauth/Url.hpp"
#include "deskauth/auth/TokenExchange.hpp"
#include "logging/Logger.h"

namespace deskauth::auth {

namespace {
constexpr std::size_t kMaxDiagnosticBody = 512;
}

TokenSet parseTokenResponse(const std::string& body, int httpStatus) {
    JSONValue v;
    try {
        v = parseJSON(body);
    } catch (const std::exception& e) {
        throw errors::TokenExchangeError(std::string("Token response is not valid JSON: ") + e.what(),
                                         httpStatus, std::string(), body.substr(0, kMaxDiagnosticBody));
    }
    auto access = getStringField(v, "access_token");
    if (!access || access->empty()) {
        throw errors::TokenExchangeError("Token response did not contain an access_token", httpStatus,
                                         std::string(), std::string());
    }
    TokenSet t;
    t.accessToken = *access;
    t.idToken = getStringField(v, "id_token");
    t.refreshToken = getStringField(v, "refresh_token");
    t.expiresInSeconds = getIntField(v, "expires_in");
    t.tokenType = getStringField(v, "token_type");
    t.scope = getStringField(v, "scope");
    return t;
}

ProviderErrorInfo parseProviderError(const std::string& body) {
    ProviderErrorInfo info;
    try {
        JSONValue v = parseJSON(body);
        if (auto e = getStringField(v, "error")) {
            info.error = *e;
        } else if (const JSONValue* nested = getObjectField(v, "error")) {
            // {"error":{"status":"...","message":"..."}} as produced by HTTPS callable backends
            info.error = getStringField(*nested, "status").value_or(std::string());
            info.description = getStringField(*nested, "message").value_or(std::string());
        }
        if (info.description.empty()) {
            if (auto d = getStringField(v, "error_description")) {
                info.description = *d;
            } else if (auto m = getStringField(v, "message")) {
                info.description = *m;
            }
        }
    } catch (const std::exception&) {
        // Non-JSON bodies (HTML error pages) leave both fields empty
    }
    return info;
}

errors::AuthError makeExchangeFailure(const std::string& what, const http::HttpResponse& res) {
    ProviderErrorInfo info = parseProviderError(res.body);
    std::string msg = what + " failed with HTTP " + std::to_string(res.status);
    if (!info.error.empty()) {
        msg += ": " + info.error;
    }
    if (!info.description.empty()) {
        msg += " (" + info.description + ")";
    }
    LOG_WARN("{}", msg);
    LOG_DEBUG("{} response body prefix: {}", what, res.body.substr(0, 128));
    return errors::TokenExchangeError(msg, res.status, info.error, res.body.substr(0, kMaxDiagnosticBody));
}

boost::asio::awaitable<bool> coRevokeToken(std::string revocationEndpoint,
                                           std::string token,
                                           http::HttpRequestParams transport,
                                           std::stop_token stop) {
    if (revocationEndpoint.empty() || token.empty()) {
        co_return false;
    }
    transport.url = revocationEndpoint;
    std::string form = buildFormBody({{"token", token}});
    try {
        http::HttpResponse res = co_await http::coPostFormUrlencoded(transport, std::move(form), nullptr, stop);
        if (res.status == 200) {
            LOG_INFO("Revoke: token revoked");
            co_return true;
        }
        LOG_WARN("Revoke: endpoint answered HTTP {}", res.status);
    } catch (const errors::AuthError& e) {
        LOG_WARN("Revoke: {} ({})", e.what(), errors::categoryName(e.category));
    }
    co_return false;
}

} // namespace deskauth::auth
