//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error taxonomy for the desktop authorization flow and user-facing remedy helpers
//==========================================================================================================

#pragma once

#include <stdexcept>
#include <string>

namespace deskauth {
namespace errors {

// Categorization of every failure the flow can surface to a caller.
enum class ErrorCategory {
    Configuration,
    Bind,
    Launch,
    Security,
    AuthorizationDenied,
    MalformedRedirect,
    Network,
    Timeout,
    TokenExchange,
    Cancelled
};

// What the caller should offer the user next.
enum class Remedy {
    None,
    Retry,
    ContactSupport,
    UserCancelled,
    AlternateSignIn
};

//==========================================================================================================
// AuthError
// Purpose: Exception carrying the error category plus provider diagnostics.
// Fields:
//   category: Taxonomy bucket used by callers to branch.
//   remedy: Suggested next step for the user.
//   providerError: OAuth "error" code reported by the provider or backend, when any.
//   httpStatus: HTTP status of the failing call (0 when not an HTTP failure).
//   detail: Diagnostic text (truncated response body). Never contains client secrets or tokens.
//==========================================================================================================
class AuthError : public std::runtime_error {
public:
    AuthError(ErrorCategory category, const std::string& message, Remedy remedy = Remedy::None)
        : std::runtime_error(message), category(category), remedy(remedy) {}

    ErrorCategory category;
    Remedy remedy;
    std::string providerError;
    int httpStatus{0};
    std::string detail;
};

// Map an ErrorCategory to a stable name for logs and tests.
//
// Args:
//   c: Category to name.
//
// Returns:
//   Constant string, e.g. "TokenExchangeError".
inline const char* categoryName(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::Configuration: return "ConfigurationError";
        case ErrorCategory::Bind: return "BindError";
        case ErrorCategory::Launch: return "LaunchError";
        case ErrorCategory::Security: return "SecurityError";
        case ErrorCategory::AuthorizationDenied: return "AuthorizationDeniedError";
        case ErrorCategory::MalformedRedirect: return "MalformedRedirectError";
        case ErrorCategory::Network: return "NetworkError";
        case ErrorCategory::Timeout: return "TimeoutError";
        case ErrorCategory::TokenExchange: return "TokenExchangeError";
        case ErrorCategory::Cancelled: return "CancelledError";
    }
    return "AuthError";
}

// Classify an OAuth error code (RFC 6749 section 5.2 and 4.1.2.1) into a remedy.
//
// Args:
//   providerError: Value of the "error" field, e.g. "invalid_grant".
//
// Returns:
//   Retry for expired/consumed codes and transient provider faults, ContactSupport for client
//   misconfiguration, UserCancelled for access_denied, None otherwise.
inline Remedy remedyForProviderError(const std::string& providerError) {
    if (providerError == "invalid_grant" || providerError == "temporarily_unavailable" ||
        providerError == "server_error" || providerError == "slow_down") {
        return Remedy::Retry;
    }
    if (providerError == "invalid_client" || providerError == "unauthorized_client" ||
        providerError == "redirect_uri_mismatch" || providerError == "invalid_request" ||
        providerError == "unsupported_grant_type" || providerError == "invalid_scope" ||
        providerError == "unsupported_response_type") {
        return Remedy::ContactSupport;
    }
    if (providerError == "access_denied" || providerError == "consent_required" ||
        providerError == "interaction_required" || providerError == "login_required") {
        return Remedy::UserCancelled;
    }
    return Remedy::None;
}

// Named constructors, one per category.
inline AuthError ConfigurationError(const std::string& msg, Remedy remedy = Remedy::ContactSupport) {
    return AuthError(ErrorCategory::Configuration, msg, remedy);
}
inline AuthError BindError(const std::string& msg) {
    return AuthError(ErrorCategory::Bind, msg, Remedy::Retry);
}
inline AuthError LaunchError(const std::string& msg, const std::string& uri) {
    AuthError e(ErrorCategory::Launch, msg, Remedy::Retry);
    e.detail = uri;
    return e;
}
inline AuthError SecurityError(const std::string& msg) {
    return AuthError(ErrorCategory::Security, msg, Remedy::None);
}
inline AuthError AuthorizationDeniedError(const std::string& msg, const std::string& providerError) {
    AuthError e(ErrorCategory::AuthorizationDenied, msg, Remedy::UserCancelled);
    e.providerError = providerError;
    return e;
}
inline AuthError MalformedRedirectError(const std::string& msg) {
    return AuthError(ErrorCategory::MalformedRedirect, msg, Remedy::Retry);
}
inline AuthError NetworkError(const std::string& msg) {
    return AuthError(ErrorCategory::Network, msg, Remedy::Retry);
}
inline AuthError TimeoutError(const std::string& msg) {
    return AuthError(ErrorCategory::Timeout, msg, Remedy::Retry);
}
inline AuthError CancelledError(const std::string& msg) {
    return AuthError(ErrorCategory::Cancelled, msg, Remedy::UserCancelled);
}
inline AuthError TokenExchangeError(const std::string& msg, int httpStatus,
                                    const std::string& providerError, const std::string& detail) {
    Remedy r = remedyForProviderError(providerError);
    if (r == Remedy::None && httpStatus >= 500) {
        r = Remedy::Retry;
    }
    AuthError e(ErrorCategory::TokenExchange, msg, r);
    e.httpStatus = httpStatus;
    e.providerError = providerError;
    e.detail = detail;
    return e;
}

// Produce the actionable message a UI should show for an error.
//
// Args:
//   e: Error raised by the flow.
//
// Returns:
//   Short user-facing sentence; never includes provider diagnostics.
inline std::string userMessageFor(const AuthError& e) {
    switch (e.category) {
        case ErrorCategory::AuthorizationDenied:
        case ErrorCategory::Cancelled:
            return "Sign-in was cancelled.";
        case ErrorCategory::Timeout:
            return "Sign-in timed out. Check your connection and try again.";
        case ErrorCategory::Network:
            return "Could not reach the sign-in service. Check your connection and try again.";
        case ErrorCategory::Launch:
            return "Could not open a web browser. Open a browser and try again.";
        case ErrorCategory::Security:
            return "Sign-in was rejected for security reasons. Please start again.";
        case ErrorCategory::Configuration:
            if (e.remedy == Remedy::AlternateSignIn) {
                return "Browser sign-in is not available in this build. Use another sign-in method.";
            }
            return "Sign-in is misconfigured. Please contact support.";
        case ErrorCategory::TokenExchange:
            if (e.remedy == Remedy::ContactSupport) {
                return "Sign-in is misconfigured. Please contact support.";
            }
            return "Sign-in could not be completed. Please try again.";
        case ErrorCategory::Bind:
        case ErrorCategory::MalformedRedirect:
            return "Sign-in failed. Please try again.";
    }
    return "Sign-in failed.";
}

} // namespace errors
} // namespace deskauth
