//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RedirectValidator.hpp
// Purpose: Classifies a captured authorization redirect and enforces the CSRF state check
//==========================================================================================================

#pragma once

#include <string>
#include <variant>

namespace deskauth::auth {

struct AuthorizationGranted {
    std::string code;
    std::string state;
};

struct AuthorizationDenied {
    std::string errorCode;
    std::string errorDescription;
};

struct MalformedRedirect {
    std::string detail;
};

using RedirectOutcome = std::variant<AuthorizationGranted, AuthorizationDenied, MalformedRedirect>;

//==========================================================================================================
// validateRedirect
// Purpose: Parses the redirect query and decides the outcome.
// Args:
//   query: Raw query string of the callback request (with or without leading '?').
//   expectedState: CSRF state stored in the flow session.
// Returns:
//   AuthorizationDenied when "error" is present, AuthorizationGranted when "code" is present with a
//   matching state, MalformedRedirect when neither is present (or the code is empty).
// Throws:
//   errors::AuthError(Security) when the returned state does not match (for denials only when a state
//   was returned), or when no expected state is recorded.
//==========================================================================================================
RedirectOutcome validateRedirect(const std::string& query, const std::string& expectedState);

//==========================================================================================================
// requireGranted
// Purpose: Maps a non-granted outcome to the error taxonomy.
// Throws:
//   ConfigurationError for client/redirect misconfiguration codes (invalid_client,
//   unauthorized_client, redirect_uri_mismatch, invalid_request, invalid_scope,
//   unsupported_response_type); AuthorizationDeniedError for other provider errors (access_denied);
//   MalformedRedirectError for MalformedRedirect.
//==========================================================================================================
AuthorizationGranted requireGranted(RedirectOutcome outcome);

} // namespace deskauth::auth
