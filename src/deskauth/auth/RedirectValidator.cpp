//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RedirectValidator.cpp
// Purpose: Classifies a captured authorization redirect and enforces the CSRF state check
//==========================================================================================================

#include <utility>

#include "deskauth/Url.hpp"
#include "deskauth/auth/Pkce.hpp"
#include "deskauth/auth/RedirectValidator.hpp"
#include "deskauth/errors/Errors.h"
#include "logging/Logger.h"

namespace deskauth::auth {

namespace {
bool isConfigurationError(const std::string& code) {
    return code == "invalid_client" || code == "unauthorized_client" || code == "redirect_uri_mismatch" ||
           code == "invalid_request" || code == "invalid_scope" || code == "unsupported_response_type";
}
} // namespace

RedirectOutcome validateRedirect(const std::string& query, const std::string& expectedState) {
    if (expectedState.empty()) {
        throw errors::SecurityError("No CSRF state recorded for this sign-in attempt");
    }
    const QueryParams params = parseQuery(query);
    const std::string* code = findParam(params, "code");
    const std::string* state = findParam(params, "state");
    const std::string* error = findParam(params, "error");

    if (error != nullptr) {
        // A denial that echoes a foreign state did not come from our request
        if (state != nullptr && !constantTimeEquals(*state, expectedState)) {
            LOG_WARN("RedirectValidator: state mismatch on error redirect");
            throw errors::SecurityError("Authorization response state does not match the request");
        }
        const std::string* desc = findParam(params, "error_description");
        LOG_INFO("RedirectValidator: provider returned error '{}'", *error);
        return AuthorizationDenied{*error, desc ? *desc : std::string()};
    }

    if (code != nullptr) {
        if (state == nullptr || !constantTimeEquals(*state, expectedState)) {
            LOG_WARN("RedirectValidator: state {} on authorization code redirect",
                     state == nullptr ? "missing" : "mismatch");
            throw errors::SecurityError("Authorization response state does not match the request");
        }
        if (code->empty()) {
            return MalformedRedirect{"empty authorization code"};
        }
        return AuthorizationGranted{*code, *state};
    }

    LOG_WARN("RedirectValidator: redirect carried neither code nor error ({} params)", params.size());
    return MalformedRedirect{"redirect carried neither an authorization code nor an error"};
}

AuthorizationGranted requireGranted(RedirectOutcome outcome) {
    if (auto* granted = std::get_if<AuthorizationGranted>(&outcome)) {
        return std::move(*granted);
    }
    if (auto* denied = std::get_if<AuthorizationDenied>(&outcome)) {
        std::string msg = "Authorization failed: " + denied->errorCode;
        if (!denied->errorDescription.empty()) {
            msg += " (" + denied->errorDescription + ")";
        }
        if (isConfigurationError(denied->errorCode)) {
            errors::AuthError e = errors::ConfigurationError(msg);
            e.providerError = denied->errorCode;
            throw e;
        }
        errors::AuthError e = errors::AuthorizationDeniedError(msg, denied->errorCode);
        errors::Remedy r = errors::remedyForProviderError(denied->errorCode);
        if (r != errors::Remedy::None) {
            e.remedy = r;
        }
        throw e;
    }
    const auto& malformed = std::get<MalformedRedirect>(outcome);
    throw errors::MalformedRedirectError("Malformed authorization redirect: " + malformed.detail);
}

} // namespace deskauth::auth
